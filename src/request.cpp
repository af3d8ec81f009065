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

#include "request.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace hermespace {
file_stream::file_stream(std::filesystem::path path, spdlog::logger& log)
    : source(std::move(path)) {
    in.open(source, std::ios::binary);
    if (!in) {
        const std::string reason = std::strerror(errno);
        log.error("failed to open file {}: {}", source.string(), reason);
        throw std::runtime_error(
            "failed to open file " + source.string() + ": " + reason
        );
    }
    std::error_code ec;
    length = std::filesystem::file_size(source, ec);
    if (ec) {
        length = 0;
    }
}

void file_stream::rewind() {
    std::lock_guard lk(mu);
    in.clear();
    in.seekg(0, std::ios::beg);
    if (!in) {
        throw std::runtime_error("failed to rewind " + source.string());
    }
}

std::size_t file_stream::read(char* buffer, const std::size_t size) {
    std::lock_guard lk(mu);
    in.read(buffer, static_cast<std::streamsize>(size));
    if (in.bad()) {
        throw std::runtime_error("failed to read " + source.string());
    }
    return static_cast<std::size_t>(in.gcount());
}

std::optional<std::uint64_t> file_stream::size() const { return length; }

request::request(std::string url, corespace::request_options options)
    : target(std::move(url))
    , opt(std::move(options)) {
    if (opt.body) {
        payload = *opt.body;
    }
}

request::request(
    std::string url, corespace::request_options options,
    std::shared_ptr<file_stream> stream
)
    : target(std::move(url))
    , opt(std::move(options)) {
    if (stream) {
        payload = std::move(stream);
    } else if (opt.body) {
        payload = *opt.body;
    }
}

request request::parse(std::string url, const std::string_view options_json) {
    return request(
        std::move(url), corespace::parse_request_options(options_json)
    );
}
}
