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

#ifndef HERMES_METRIC_DISPATCHER_HPP
#define HERMES_METRIC_DISPATCHER_HPP
#include "error_codes.hpp"
#include "trail.hpp"
#include "utils.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>

namespace corespace {

/// @brief Judges whether a status (0 when no response arrived) is expected.
using response_callback = std::function<bool(long)>;

/// @brief Inclusive status range; a single status has `min == max`.
struct status_range {
    long min = 0;
    long max = 0;
};

/// @brief Response callback accepting any status inside @p ranges.
response_callback expected_statuses(std::vector<status_range> ranges);

/// @brief What the engine knew about the request when it was sent.
struct request_context {
    std::string method;
    std::string uri;
    tag_map tags; ///< Caller-supplied tags of this request only.
};

/// @brief Response facts available before the body is consumed.
struct response_head {
    long status = 0;
};

/**
 * @struct unfinished_request
 * @brief A completed round trip whose metrics were not emitted yet.
 *
 * `response` is empty when the transfer failed before a response arrived.
 */
struct unfinished_request {
    request_context request;
    std::optional<response_head> response;
    corespace::trail trail;
    std::optional<failure> error;
};

/// @brief An emitted round trip with its resolved code and message.
struct finished_request {
    unfinished_request source;
    error_code code = error_code::none;
    std::string error_message;
};

/**
 * @class metric_dispatcher
 * @brief Defers the metrics of one request until the next one is staged.
 *
 * One dispatcher belongs to one client and is shared by every call made
 * through it. It holds a single staged slot; staging a request first emits
 * whatever was staged before, within the same critical section, so samples
 * reach the sink in call order and each staged request is emitted exactly
 * once.
 */
class metric_dispatcher final {
public:
    /**
     * @param tags  Tag context cloned for every emitted request.
     * @param state Run providing builtin metrics, enabled tags, sink, logger.
     */
    metric_dispatcher(
        tags_and_meta tags, std::shared_ptr<const run_state> state
    );

    metric_dispatcher(const metric_dispatcher&) = delete;
    metric_dispatcher& operator=(const metric_dispatcher&) = delete;

    /// @brief Install or clear (empty function) the response callback.
    void set_response_callback(response_callback callback);

    /**
     * @brief Make @p current the staged request.
     *
     * A request still staged from before is emitted first and a warning is
     * logged, since callers are expected to drain between round trips.
     */
    void stage(const std::stop_token& done, unfinished_request current);

    /**
     * @brief Take the staged request, if any, and emit its samples.
     *
     * @param last_error Attached to the request only if it carries no error
     *                   of its own.
     * @return The finished request, or nullopt if nothing was staged.
     */
    std::optional<finished_request> drain_and_emit(
        const std::stop_token& done,
        std::optional<failure> last_error = std::nullopt
    );

    /// @brief True while a request waits to be emitted.
    [[nodiscard]] bool staged() const;

private:
    finished_request
    measure_and_emit(const std::stop_token& done, unfinished_request request);

    const tags_and_meta base_tags;
    const std::shared_ptr<const run_state> state;

    mutable std::mutex mu;
    response_callback on_response; ///< Guarded by `mu`.
    std::optional<unfinished_request> last_request; ///< Guarded by `mu`.
};
}
#endif // HERMES_METRIC_DISPATCHER_HPP
