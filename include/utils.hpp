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

#ifndef HERMES_UTILS_HPP
#define HERMES_UTILS_HPP
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace corespace {

/// @brief Single header or tag entry: name=value.
using parameter = std::pair<std::string, std::string>;
/// @brief Ordered list of request headers, applied in insertion order.
using parameter_list = std::vector<parameter>;
/// Case-preserving multimap of response headers (as returned by libcurl).
using header_map = std::multimap<std::string, std::string, std::less<>>;

/**
 * @brief HTTP methods issued by the request engine.
 *
 * `get` and `head` never carry a body, whatever the request definition holds.
 */
enum class http_method { get, head, post, put, patch, del, options };

/**
 * @brief How the response body is surfaced to the caller.
 *
 *  - `text`: body kept as a string.
 *  - `binary`: body kept as raw bytes (still stored in a string).
 *  - `none`: body drained from the connection and discarded.
 */
enum class response_type { text, binary, none };

/// @brief Wire name of @p method ("GET", "DELETE", ...).
std::string_view to_string(http_method method) noexcept;

/// @brief Operation name used when rendering URL errors ("Get", "Delete").
std::string_view operation_name(http_method method) noexcept;

/// @brief True for methods whose body is never transmitted (GET, HEAD).
[[nodiscard]] bool bodiless(http_method method) noexcept;

/**
 * @brief Parse a response type name ("text", "binary", "none").
 *
 * An empty string selects `text`.
 *
 * @throws std::invalid_argument for any other value.
 */
response_type parse_response_type(std::string_view name);

/**
 * @brief Split "host:port" or "[v6]:port" into its host part.
 *
 * @return Host without brackets, or nullopt if @p address has no port.
 */
std::optional<std::string> split_host_port(std::string_view address);

/// @brief Join a host and port, bracketing IPv6 literals.
std::string join_host_port(std::string_view host, long port);

/// @brief Lowercase ASCII copy of @p text.
std::string to_lower(std::string_view text);

/// @brief Name of the operating system the library was built for.
std::string_view platform_name() noexcept;

}
#endif // HERMES_UTILS_HPP
