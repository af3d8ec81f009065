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

#ifndef HERMES_TRANSFER_FAILURE_HPP
#define HERMES_TRANSFER_FAILURE_HPP

#include "error_codes.hpp"
#include "http_client.hpp"
#include "utils.hpp"

#include <string_view>

namespace corespace {
/**
 * @brief Describe a failed transfer as a layered failure.
 *
 * The result is always wrapped as a URL error for @p method on @p uri, with
 * the network operation, system call, DNS, TLS or HTTP/2 detail underneath,
 * so that `classify` sees the same shapes a socket level client produces.
 * A rejection raised by a libcurl callback takes precedence over the curl
 * code.
 *
 * @pre `result.code != CURLE_OK` or `result.rejection` is set.
 */
failure translate_transfer_failure(
    const transfer_result& result, http_method method, std::string_view uri
);

/**
 * @brief True if the response head arrived and the body transfer failed.
 *
 * Such failures belong to the request that produced the head and are
 * reported through the dispatcher after it was staged.
 */
[[nodiscard]] bool body_phase_failure(const transfer_result& result) noexcept;
}
#endif // HERMES_TRANSFER_FAILURE_HPP
