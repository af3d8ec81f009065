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

#ifndef HERMES_TRAIL_HPP
#define HERMES_TRAIL_HPP
#include "metrics.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace corespace {
/**
 * @struct trail
 * @brief Timing and connection facts of one round trip.
 *
 * A trail is created when the transfer completes; its samples are filled
 * later by the metric dispatcher through `save_samples`, exactly once.
 */
struct trail {
    std::chrono::system_clock::time_point end_time;
    /// Connecting plus TLS handshaking.
    std::chrono::nanoseconds conn_duration { 0 };
    /// Whole round trip including the body transfer.
    std::chrono::nanoseconds duration { 0 };
    /// "ip:port" of the peer, if a connection was made.
    std::optional<std::string> conn_remote_addr;
    /// Unset unless a response callback judged the outcome.
    std::optional<bool> failed;

    tag_map tags;
    tag_map metadata;
    std::vector<sample> samples;

    /**
     * @brief Materialize the `http_reqs` and `http_req_duration` samples.
     *
     * Both samples are stamped with `end_time` and carry @p ctm. The trail
     * is sealed afterwards: later calls leave `samples` untouched.
     *
     * @return false if the samples had already been saved.
     */
    bool save_samples(const builtin_metrics& builtin, const tags_and_meta& ctm);

    [[nodiscard]] bool sealed() const noexcept { return saved; }

private:
    bool saved = false;
};
}
#endif // HERMES_TRAIL_HPP
