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

#ifndef HERMES_HTTP_CLIENT_HPP
#define HERMES_HTTP_CLIENT_HPP

#include "config.hpp"
#include "error_codes.hpp"
#include "utils.hpp"

#include <chrono>
#include <curl/curl.h>
#include <memory>
#include <optional>

namespace corespace {
class transport_share;

/**
 * @class body_source
 * @brief Streaming request body that can be replayed from its start.
 */
class body_source {
public:
    virtual ~body_source() = default;
    /// @brief Seek back to the first byte. @throws std::runtime_error.
    virtual void rewind() = 0;
    /// @brief Copy up to @p size bytes into @p buffer; 0 signals the end.
    virtual std::size_t read(char* buffer, std::size_t size) = 0;
    /// @brief Total length if known up front.
    [[nodiscard]] virtual std::optional<std::uint64_t> size() const = 0;
};

enum class body_kind { none, bytes, stream };

/**
 * @class easy_request
 * @brief Reusable transfer handle: one libcurl easy handle plus the request
 * line, headers and body it will send.
 *
 * Setters only record the desired state; it is pushed into the easy handle
 * right before each transfer, so a handle reused for another method or body
 * never keeps options from its previous use.
 *
 * Lifetime and thread-safety:
 *  - A handle is used by one transfer at a time; pools hand it out
 *    exclusively.
 *  - The handle keeps the transport state of the client that created it
 *    alive.
 */
class easy_request final {
public:
    ~easy_request();
    easy_request(const easy_request&) = delete;
    easy_request& operator=(const easy_request&) = delete;

    void set_uri(std::string uri);
    /// @brief Send @p host in the Host header instead of the URI's host.
    void set_host(std::string host);
    void set_headers(parameter_list headers);
    void set_keep_alive(bool enabled);
    void set_method(http_method method);
    void clear_body();
    void set_body(std::string bytes);
    void set_body(std::shared_ptr<body_source> source);

    [[nodiscard]] const std::string& uri() const noexcept { return target; }
    [[nodiscard]] http_method method() const noexcept { return verb; }
    [[nodiscard]] body_kind body() const noexcept { return kind; }
    [[nodiscard]] bool keep_alive() const noexcept { return keep; }
    [[nodiscard]] const std::string& host() const noexcept {
        return host_override;
    }
    [[nodiscard]] std::size_t body_size() const noexcept {
        return payload.size();
    }

private:
    friend class http_client;
    explicit easy_request(std::shared_ptr<transport_share> owner);

    /// @brief Push URI, headers, method and body into the easy handle.
    void apply();
    void rebuild_headers();

    static size_t
    read_callback(char* buffer, size_t size, size_t n, void* data);
    static curl_socket_t
    open_socket(void* data, curlsocktype purpose, curl_sockaddr* address);

    std::shared_ptr<transport_share> owner;
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl {
        nullptr, &curl_easy_cleanup
    };
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list {
        nullptr, &curl_slist_free_all
    };
    std::string target;
    std::string host_override;
    parameter_list header_fields;
    bool keep = true;
    bool headers_dirty = true;
    http_method verb = http_method::get;
    body_kind kind = body_kind::none;
    std::string payload;
    std::shared_ptr<body_source> stream;

    std::optional<failure> rejected; ///< Set by callbacks during a transfer.
    char error_buffer[CURL_ERROR_SIZE] = {};
};

/**
 * @struct transfer_result
 * @brief Everything libcurl reported about one transfer.
 *
 * Invariants:
 *  - `code == CURLE_OK` means the transfer completed; `status` then holds
 *    the final HTTP status.
 *  - `status > 0` with a failing `code` means the response head arrived and
 *    the failure happened while the body was transferred.
 *  - `rejection` carries a failure raised inside a libcurl callback (network
 *    policy, body stream), which takes precedence over `code`.
 */
struct transfer_result {
    CURLcode code = CURLE_OK;
    std::string error_message; ///< libcurl error buffer or strerror text.
    long os_errno = 0; ///< errno of the last failed socket operation.
    long status = 0;
    header_map headers;
    std::string body;
    std::size_t bytes_received = 0;
    std::string primary_ip;
    long primary_port = 0;
    long ssl_verify_result = 0; ///< X509 verification result (0 = ok).
    std::string effective_url;
    std::chrono::microseconds name_lookup { 0 };
    std::chrono::microseconds connect { 0 };
    std::chrono::microseconds app_connect { 0 };
    std::optional<failure> rejection;

    /// @brief True once a TCP connection to the peer was established.
    [[nodiscard]] bool connected() const noexcept;
    /// @brief Connecting plus TLS handshaking.
    [[nodiscard]] std::chrono::microseconds conn_duration() const noexcept;
    /// @brief "ip:port" of the peer, if known.
    [[nodiscard]] std::optional<std::string> remote_addr() const;
};

/// @brief Host part of @p uri as libcurl parses it, empty if malformed.
std::string url_host(std::string_view uri);

/**
 * @class http_client
 * @brief Transport over libcurl shared by every request of one client.
 *
 * Responsibilities:
 *  - Initialize libcurl once per process (`std::call_once`).
 *  - Own a share handle so that connections, DNS entries and TLS sessions
 *    are reused across the pooled easy handles.
 *  - Configure new easy handles from `client_config` (user agent,
 *    timeouts, buffer sizes, proxy, TLS, connection lifetime, network
 *    policy).
 *  - Perform transfers and collect status, headers, body, peer address and
 *    phase timings.
 */
class http_client final {
public:
    /**
     * @brief Validate @p config and set up the shared transport state.
     * @throws std::invalid_argument if validation fails.
     * @throws std::runtime_error if libcurl initialization fails.
     */
    explicit http_client(client_config config);

    /// @brief A fresh easy handle configured for this client.
    [[nodiscard]] std::unique_ptr<easy_request> new_request() const;

    /// @brief True if @p request was created by this client.
    [[nodiscard]] bool owns(const easy_request& request) const noexcept;

    /**
     * @brief Perform the transfer described by @p request.
     *
     * The body is accumulated unless @p type is `response_type::none`, in
     * which case it is read from the connection and dropped. Blocked host
     * names are rejected before anything is sent. A streamed body is sent
     * from its current position.
     */
    transfer_result perform(easy_request& request, response_type type) const;

private:
    static size_t
    write_callback(char* ptr, size_t size, size_t n, void* data);
    static size_t
    discard_callback(char* ptr, size_t size, size_t n, void* data);
    static void update_headers(CURL* curl, transfer_result& result);
    static void update_info(CURL* curl, transfer_result& result);

    std::shared_ptr<transport_share> shared;
};
}
#endif // HERMES_HTTP_CLIENT_HPP
