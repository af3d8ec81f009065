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

#include "metric_dispatcher.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace corespace {
response_callback expected_statuses(std::vector<status_range> ranges) {
    for (const auto& [min, max] : ranges) {
        if (min > max) {
            throw std::invalid_argument(
                "invalid status range " + std::to_string(min) + "-"
                + std::to_string(max)
            );
        }
    }
    return [ranges = std::move(ranges)](const long status) {
        for (const auto& [min, max] : ranges) {
            if (status >= min && status <= max) {
                return true;
            }
        }
        return false;
    };
}

metric_dispatcher::metric_dispatcher(
    tags_and_meta tags, std::shared_ptr<const run_state> state
)
    : base_tags(std::move(tags))
    , state(std::move(state)) {
    if (!this->state) {
        throw std::invalid_argument("metric_dispatcher requires a run state");
    }
}

void metric_dispatcher::set_response_callback(response_callback callback) {
    std::lock_guard lk(mu);
    on_response = std::move(callback);
}

bool metric_dispatcher::staged() const {
    std::lock_guard lk(mu);
    return last_request.has_value();
}

void metric_dispatcher::stage(
    const std::stop_token& done, unfinished_request current
) {
    std::lock_guard lk(mu);
    if (last_request) {
        unfinished_request previous = std::move(*last_request);
        last_request.reset();
        state->log().warn(
            "metric dispatcher: unexpected unprocessed request for {}",
            previous.request.uri
        );
        measure_and_emit(done, std::move(previous));
    }
    last_request = std::move(current);
}

std::optional<finished_request> metric_dispatcher::drain_and_emit(
    const std::stop_token& done, std::optional<failure> last_error
) {
    std::lock_guard lk(mu);
    if (!last_request) {
        return std::nullopt;
    }
    unfinished_request pending = std::move(*last_request);
    last_request.reset();
    // never overwrite the transport's own failure
    if (!pending.error && last_error) {
        pending.error = std::move(last_error);
    }
    return measure_and_emit(done, std::move(pending));
}

finished_request metric_dispatcher::measure_and_emit(
    const std::stop_token& done, unfinished_request request
) {
    finished_request result { .source = std::move(request) };
    const unfinished_request& unfinished = result.source;
    trail& tr = result.source.trail;
    const system_tag_set& enabled = state->system_tags;

    tags_and_meta ctm = base_tags.clone();
    for (const auto& [name, value] : unfinished.request.tags) {
        ctm.set_tag(name, value);
    }

    // `name` and `url` carry the same value; a user-set name wins so raw
    // URLs do not blow up the tag cardinality.
    if (const auto name = ctm.get(to_string(system_tag::name))) {
        ctm.set_system_tag_or_meta_if_enabled(enabled, system_tag::url, *name);
    } else {
        const std::string& uri = unfinished.request.uri;
        ctm.set_system_tag_or_meta_if_enabled(enabled, system_tag::name, uri);
        ctm.set_system_tag_or_meta_if_enabled(enabled, system_tag::url, uri);
    }
    ctm.set_system_tag_or_meta_if_enabled(
        enabled, system_tag::method, unfinished.request.method
    );

    long status = 0;
    if (unfinished.error) {
        auto [code, message] = classify(*unfinished.error);
        result.code = code;
        result.error_message = std::move(message);
        ctm.set_system_tag_or_meta_if_enabled(
            enabled, system_tag::error, result.error_message
        );
        ctm.set_system_tag_or_meta_if_enabled(
            enabled, system_tag::error_code,
            std::to_string(to_underlying(result.code))
        );
        ctm.set_system_tag_or_meta_if_enabled(enabled, system_tag::status, "0");
    } else {
        if (unfinished.response) {
            status = unfinished.response->status;
        }
        ctm.set_system_tag_or_meta_if_enabled(
            enabled, system_tag::status, std::to_string(status)
        );
        if (status >= 400) {
            result.code = status_error_code(status);
            ctm.set_system_tag_or_meta_if_enabled(
                enabled, system_tag::error_code,
                std::to_string(to_underlying(result.code))
            );
        }
    }

    if (enabled.has(system_tag::ip) && tr.conn_remote_addr) {
        if (auto ip = split_host_port(*tr.conn_remote_addr)) {
            ctm.set_system_tag_or_meta(system_tag::ip, std::move(*ip));
        }
    }

    std::optional<bool> expected;
    if (on_response) {
        try {
            expected = on_response(status);
        } catch (const std::exception& e) {
            state->log().warn(
                "metric dispatcher: response callback failed for {}: {}",
                unfinished.request.uri, e.what()
            );
            expected = false;
        }
        ctm.set_system_tag_or_meta_if_enabled(
            enabled, system_tag::expected_response,
            *expected ? "true" : "false"
        );
    }

    tr.save_samples(state->builtin, ctm);
    if (expected) {
        tr.failed = !*expected;
        tr.samples.push_back({ .series = &state->builtin.http_req_failed,
                               .tags = ctm.tags,
                               .metadata = ctm.metadata,
                               .time = tr.end_time,
                               .value = *expected ? 0.0 : 1.0 });
    }

    if (state->samples) {
        try {
            push_if_not_done(done, *state->samples, tr.samples);
        } catch (const std::exception& e) {
            state->log().warn(
                "metric dispatcher: dropping samples of {}: {}",
                unfinished.request.uri, e.what()
            );
        }
    }
    return result;
}
}
