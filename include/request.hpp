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

#ifndef HERMES_REQUEST_HPP
#define HERMES_REQUEST_HPP

#include "config.hpp"
#include "http_client.hpp"
#include "pool.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <variant>

namespace hermespace {
/**
 * @class file_stream
 * @brief Request body streamed from a file, replayable for every request
 * that uses it.
 *
 * The file stays open for the lifetime of the stream; each transfer rewinds
 * it to the first byte before sending. Reads and rewinds are serialized so
 * that one stream can be attached to several request definitions.
 */
class file_stream final : public corespace::body_source {
public:
    /**
     * @brief Open @p path for reading.
     * @throws std::runtime_error if the file cannot be opened; the failure
     *         is logged on @p log first.
     */
    explicit file_stream(
        std::filesystem::path path,
        spdlog::logger& log = *spdlog::default_logger_raw()
    );

    void rewind() override;
    std::size_t read(char* buffer, std::size_t size) override;
    [[nodiscard]] std::optional<std::uint64_t> size() const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return source;
    }

private:
    std::filesystem::path source;
    std::mutex mu;
    std::ifstream in;
    std::uint64_t length = 0;
};

/// @brief Absent, in-memory bytes, or a file stream.
using request_body
    = std::variant<std::monostate, std::string, std::shared_ptr<file_stream>>;

class client;

/**
 * @class request
 * @brief Reusable request definition: URL, options and body, plus the pool
 * of transfer handles prepared for it.
 *
 * A definition can be sent any number of times, with any method and from
 * several threads at once; each send leases its own handle from the pool.
 */
class request {
public:
    /**
     * @param url     Target URL, sent as-is.
     * @param options Headers, Host override, keep-alive, tags, error mode
     *                and response type; `options.body` becomes the body.
     */
    explicit request(std::string url, corespace::request_options options = {});

    /// @brief Definition streaming its body from @p stream.
    request(
        std::string url, corespace::request_options options,
        std::shared_ptr<file_stream> stream
    );

    /**
     * @brief Build a definition from a JSON options document.
     * @throws std::invalid_argument on malformed options.
     */
    static request parse(std::string url, std::string_view options_json);

    request(const request&) = delete;
    request& operator=(const request&) = delete;
    request(request&&) = delete;

    [[nodiscard]] const std::string& url() const noexcept { return target; }
    [[nodiscard]] const corespace::request_options& options() const noexcept {
        return opt;
    }
    [[nodiscard]] const request_body& body() const noexcept { return payload; }

    /// @brief Transfer handles waiting to be reused.
    [[nodiscard]] std::size_t pooled() const { return handles.idle(); }

private:
    friend class client;

    std::string target;
    corespace::request_options opt;
    request_body payload;
    object_pool<corespace::easy_request> handles;
};
}
#endif // HERMES_REQUEST_HPP
