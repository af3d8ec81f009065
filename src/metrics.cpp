/*
 * The MIT License (MIT)
 *
 * Copyright (c) 2025 Yaroslav Riabtsev <yaroslav.riabtsev@rwth-aachen.de>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NON-INFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "metrics.hpp"

#include <ctime>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace corespace {
namespace {
    bool routed_to_metadata(const system_tag tag) {
        return tag == system_tag::vu || tag == system_tag::iter;
    }

    std::string rfc3339(const std::chrono::system_clock::time_point time) {
        using namespace std::chrono;
        const auto since_epoch = time.time_since_epoch();
        const auto secs = floor<seconds>(since_epoch);
        const auto micros = duration_cast<microseconds>(since_epoch - secs);
        const std::time_t t = secs.count();
        std::tm utc {};
        gmtime_r(&t, &utc);
        char date[32];
        const std::size_t n
            = std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
        std::string frac = std::to_string(micros.count());
        frac.insert(frac.begin(), 6 - frac.size(), '0');
        return std::string(date, n) + "." + frac + "Z";
    }

    nlohmann::json to_json(const sample& point) {
        return {
            { "type", "Point" },
            { "metric", point.series ? point.series->name : std::string {} },
            { "data",
              { { "time", rfc3339(point.time) },
                { "value", point.value },
                { "tags", point.tags },
                { "metadata", point.metadata } } },
        };
    }
}

std::string_view to_string(const system_tag tag) noexcept {
    switch (tag) {
    case system_tag::proto:
        return "proto";
    case system_tag::subproto:
        return "subproto";
    case system_tag::status:
        return "status";
    case system_tag::method:
        return "method";
    case system_tag::url:
        return "url";
    case system_tag::name:
        return "name";
    case system_tag::group:
        return "group";
    case system_tag::check:
        return "check";
    case system_tag::error:
        return "error";
    case system_tag::error_code:
        return "error_code";
    case system_tag::tls_version:
        return "tls_version";
    case system_tag::scenario:
        return "scenario";
    case system_tag::service:
        return "service";
    case system_tag::expected_response:
        return "expected_response";
    case system_tag::ip:
        return "ip";
    case system_tag::vu:
        return "vu";
    case system_tag::iter:
        return "iter";
    }
    return "";
}

system_tag_set system_tag_set::defaults() noexcept {
    return { system_tag::proto,
             system_tag::subproto,
             system_tag::status,
             system_tag::method,
             system_tag::url,
             system_tag::name,
             system_tag::group,
             system_tag::check,
             system_tag::error,
             system_tag::error_code,
             system_tag::tls_version,
             system_tag::scenario,
             system_tag::service,
             system_tag::expected_response };
}

std::optional<std::string> tags_and_meta::get(const std::string_view name
) const {
    if (const auto it = tags.find(name); it != tags.end()) {
        return it->second;
    }
    return std::nullopt;
}

void tags_and_meta::set_tag(const std::string_view name, std::string value) {
    tags.insert_or_assign(std::string(name), std::move(value));
}

void tags_and_meta::set_metadata(
    const std::string_view name, std::string value
) {
    metadata.insert_or_assign(std::string(name), std::move(value));
}

void tags_and_meta::set_system_tag_or_meta(
    const system_tag tag, std::string value
) {
    if (routed_to_metadata(tag)) {
        set_metadata(to_string(tag), std::move(value));
    } else {
        set_tag(to_string(tag), std::move(value));
    }
}

void tags_and_meta::set_system_tag_or_meta_if_enabled(
    const system_tag_set& enabled, const system_tag tag, std::string value
) {
    if (enabled.has(tag)) {
        set_system_tag_or_meta(tag, std::move(value));
    }
}

double to_milliseconds(const std::chrono::nanoseconds duration) noexcept {
    return std::chrono::duration<double, std::milli>(duration).count();
}

void buffered_sink::push(std::vector<sample> batch) {
    std::lock_guard lk(mu);
    if (closed) {
        return;
    }
    received.push_back(std::move(batch));
}

void buffered_sink::close() noexcept {
    std::lock_guard lk(mu);
    closed = true;
}

std::vector<std::vector<sample>> buffered_sink::batches() const {
    std::lock_guard lk(mu);
    return received;
}

std::vector<std::vector<sample>> buffered_sink::drain() {
    std::lock_guard lk(mu);
    return std::exchange(received, {});
}

json_sink::json_sink(std::ostream& out)
    : out(out) { }

void json_sink::push(std::vector<sample> batch) {
    std::lock_guard lk(mu);
    for (const auto& point : batch) {
        out << to_json(point).dump() << '\n';
    }
    out.flush();
}

bool push_if_not_done(
    const std::stop_token& done, sample_sink& sink, std::vector<sample> batch
) {
    if (done.stop_requested()) {
        return false;
    }
    sink.push(std::move(batch));
    return true;
}

spdlog::logger& run_state::log() const {
    return logger ? *logger : *spdlog::default_logger_raw();
}
}
