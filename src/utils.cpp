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

#include "utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace corespace {

std::string_view to_string(const http_method method) noexcept {
    switch (method) {
    case http_method::get:
        return "GET";
    case http_method::head:
        return "HEAD";
    case http_method::post:
        return "POST";
    case http_method::put:
        return "PUT";
    case http_method::patch:
        return "PATCH";
    case http_method::del:
        return "DELETE";
    case http_method::options:
        return "OPTIONS";
    }
    return "GET";
}

std::string_view operation_name(const http_method method) noexcept {
    switch (method) {
    case http_method::get:
        return "Get";
    case http_method::head:
        return "Head";
    case http_method::post:
        return "Post";
    case http_method::put:
        return "Put";
    case http_method::patch:
        return "Patch";
    case http_method::del:
        return "Delete";
    case http_method::options:
        return "Options";
    }
    return "Get";
}

bool bodiless(const http_method method) noexcept {
    return method == http_method::get || method == http_method::head;
}

response_type parse_response_type(const std::string_view name) {
    if (name.empty() || name == "text") {
        return response_type::text;
    }
    if (name == "binary") {
        return response_type::binary;
    }
    if (name == "none") {
        return response_type::none;
    }
    throw std::invalid_argument(
        "invalid response type: " + std::string(name)
    );
}

std::optional<std::string> split_host_port(const std::string_view address) {
    if (address.empty()) {
        return std::nullopt;
    }
    if (address.front() == '[') {
        const auto close = address.find(']');
        if (close == std::string_view::npos || close + 1 >= address.size()
            || address[close + 1] != ':') {
            return std::nullopt;
        }
        return std::string(address.substr(1, close - 1));
    }
    const auto colon = address.rfind(':');
    if (colon == std::string_view::npos
        || address.find(':') != colon) {
        // bare IPv6 literals carry several colons and no port
        return std::nullopt;
    }
    return std::string(address.substr(0, colon));
}

std::string join_host_port(const std::string_view host, const long port) {
    std::string out;
    if (host.find(':') != std::string_view::npos) {
        out.append("[").append(host).append("]");
    } else {
        out.append(host);
    }
    out.append(":").append(std::to_string(port));
    return out;
}

std::string to_lower(const std::string_view text) {
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) {
        return static_cast<char>(c >= 'A' && c <= 'Z' ? c + ('a' - 'A') : c);
    });
    return out;
}

std::string_view platform_name() noexcept {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(__FreeBSD__)
    return "freebsd";
#elif defined(__linux__)
    return "linux";
#else
    return "unknown";
#endif
}
}
