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

#ifndef HERMES_METRICS_HPP
#define HERMES_METRICS_HPP

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <spdlog/logger.h>
#include <stop_token>
#include <string>
#include <vector>

namespace corespace {

/// Tag or metadata name -> value.
using tag_map = std::map<std::string, std::string, std::less<>>;

/**
 * @brief Tags the engine attaches to samples on its own.
 *
 * Each tag is a bit so that the set of enabled tags fits in a mask.
 */
enum class system_tag : std::uint32_t {
    proto = 1U << 0,
    subproto = 1U << 1,
    status = 1U << 2,
    method = 1U << 3,
    url = 1U << 4,
    name = 1U << 5,
    group = 1U << 6,
    check = 1U << 7,
    error = 1U << 8,
    error_code = 1U << 9,
    tls_version = 1U << 10,
    scenario = 1U << 11,
    service = 1U << 12,
    expected_response = 1U << 13,
    ip = 1U << 14,
    vu = 1U << 15,
    iter = 1U << 16,
};

/// @brief Key under which @p tag is stored ("error_code", "ip", ...).
std::string_view to_string(system_tag tag) noexcept;

/**
 * @class system_tag_set
 * @brief Bit set of enabled system tags.
 *
 * The default set enables everything except `ip`, `vu` and `iter`.
 */
class system_tag_set {
public:
    constexpr system_tag_set() noexcept = default;
    constexpr system_tag_set(std::initializer_list<system_tag> tags) noexcept {
        for (const system_tag tag : tags) {
            mask |= static_cast<std::uint32_t>(tag);
        }
    }

    static system_tag_set defaults() noexcept;

    [[nodiscard]] constexpr bool has(const system_tag tag) const noexcept {
        return (mask & static_cast<std::uint32_t>(tag)) != 0;
    }
    constexpr void add(const system_tag tag) noexcept {
        mask |= static_cast<std::uint32_t>(tag);
    }
    constexpr void remove(const system_tag tag) noexcept {
        mask &= ~static_cast<std::uint32_t>(tag);
    }

private:
    std::uint32_t mask = 0;
};

/**
 * @struct tags_and_meta
 * @brief Indexed tags plus non-indexed metadata attached to samples.
 *
 * High-cardinality system values (`vu`, `iter`) are stored as metadata,
 * every other system tag as an indexed tag.
 */
struct tags_and_meta {
    tag_map tags;
    tag_map metadata;

    [[nodiscard]] tags_and_meta clone() const { return *this; }

    /// @brief Value of tag @p name, if set.
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;

    void set_tag(std::string_view name, std::string value);
    void set_metadata(std::string_view name, std::string value);

    /// @brief Store @p value under @p tag, as a tag or as metadata.
    void set_system_tag_or_meta(system_tag tag, std::string value);

    /// @brief Same as `set_system_tag_or_meta`, only if @p tag is enabled.
    void set_system_tag_or_meta_if_enabled(
        const system_tag_set& enabled, system_tag tag, std::string value
    );
};

enum class metric_type { counter, gauge, trend, rate };

/// @brief A named series that samples are recorded against.
struct metric {
    std::string name;
    metric_type type = metric_type::counter;
    bool time_valued = false; ///< Values are durations in milliseconds.
};

/// @brief Metrics every run registers up front.
struct builtin_metrics {
    metric http_reqs { "http_reqs", metric_type::counter };
    metric http_req_duration { "http_req_duration", metric_type::trend, true };
    metric http_req_failed { "http_req_failed", metric_type::rate };
    metric checks { "checks", metric_type::rate };
};

/// @brief One timestamped, tagged data point.
struct sample {
    const metric* series = nullptr;
    tag_map tags;
    tag_map metadata;
    std::chrono::system_clock::time_point time;
    double value = 0;
};

/// @brief Duration in the sinks' canonical unit (milliseconds).
double to_milliseconds(std::chrono::nanoseconds duration) noexcept;

/**
 * @class sample_sink
 * @brief Destination for finished sample batches.
 *
 * Implementations must be safe to call from several threads.
 */
class sample_sink {
public:
    virtual ~sample_sink() = default;
    virtual void push(std::vector<sample> batch) = 0;
};

/**
 * @class buffered_sink
 * @brief Keeps pushed batches in memory, in push order.
 *
 * After `close()` further pushes are dropped.
 */
class buffered_sink final : public sample_sink {
public:
    void push(std::vector<sample> batch) override;
    void close() noexcept;

    /// @brief Copy of every batch received so far.
    [[nodiscard]] std::vector<std::vector<sample>> batches() const;
    /// @brief Remove and return every batch received so far.
    std::vector<std::vector<sample>> drain();

private:
    mutable std::mutex mu;
    bool closed = false;
    std::vector<std::vector<sample>> received;
};

/**
 * @class json_sink
 * @brief Writes each sample as one JSON object per line.
 *
 * Line format:
 * `{"type":"Point","metric":"http_reqs","data":{"time":"...","value":1,
 * "tags":{...},"metadata":{...}}}` with RFC 3339 UTC timestamps.
 */
class json_sink final : public sample_sink {
public:
    explicit json_sink(std::ostream& out);
    void push(std::vector<sample> batch) override;

private:
    std::mutex mu;
    std::ostream& out;
};

/**
 * @brief Push @p batch unless the run owning @p done has finished.
 * @return true if the batch reached the sink.
 */
bool push_if_not_done(
    const std::stop_token& done, sample_sink& sink, std::vector<sample> batch
);

/**
 * @struct run_state
 * @brief What the surrounding test run lends to clients and checks.
 *
 * `done` is requested once the run has finished; sample pushes are dropped
 * from then on. A null `logger` falls back to spdlog's default logger.
 */
struct run_state {
    builtin_metrics builtin;
    system_tag_set system_tags = system_tag_set::defaults();
    tags_and_meta tags;
    std::shared_ptr<sample_sink> samples;
    std::shared_ptr<spdlog::logger> logger;
    std::stop_token done;

    [[nodiscard]] spdlog::logger& log() const;
};

}
#endif // HERMES_METRICS_HPP
