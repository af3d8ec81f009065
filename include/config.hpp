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

#ifndef HERMES_CONFIG_HPP
#define HERMES_CONFIG_HPP
#include "metrics.hpp"
#include "utils.hpp"

#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace corespace {

/**
 * @struct tls_config
 * @brief TLS settings of a client.
 *
 * `private_key` and `certificate` are paths to PEM files and must be given
 * together.
 */
struct tls_config {
    bool insecure_skip_verify = false;
    std::string private_key;
    std::string certificate;
};

/**
 * @struct client_config
 * @brief Settings shared by every request made through one client.
 *
 * Durations are whole seconds; 0 selects the transport default. The
 * operation timeout of a transfer is `write_timeout + read_timeout` when
 * either is set.
 *
 * Network policy:
 *  - `blacklist_ips`: CIDR ranges peers may not be connected to.
 *  - `block_hostnames`: exact host names or `*.suffix` patterns that are
 *    never resolved.
 */
struct client_config {
    static constexpr int default_dial_timeout = 5;
    static constexpr int default_max_conns_per_host = 1;

    int dial_timeout = 0;
    std::string proxy;
    int max_conn_duration = 0;
    std::string user_agent;
    int read_buffer_size = 0;
    int write_buffer_size = 0;
    int read_timeout = 0;
    int write_timeout = 0;
    int max_conns_per_host = 0;
    tls_config tls;
    std::vector<std::string> blacklist_ips;
    std::vector<std::string> block_hostnames;

    [[nodiscard]] std::chrono::seconds effective_dial_timeout() const noexcept;
    [[nodiscard]] int effective_max_conns_per_host() const noexcept;

    /**
     * @brief Reject inconsistent settings.
     *
     * @throws std::invalid_argument on a key without certificate ("blank
     *         certificate"), a certificate without key ("blank private key"),
     *         unreadable key/cert files, negative sizes or durations, and
     *         malformed network policy entries.
     */
    void validate() const;
};

/**
 * @struct request_options
 * @brief Per-request-definition settings.
 *
 *  - `throw_on_error`: a failed round trip raises `request_error` instead of
 *    returning a response carrying the error code.
 *  - `host`: overrides the Host header.
 *  - `body`: bytes sent with methods that carry a body.
 *  - `tags`: extra tags attached to this request's samples.
 */
struct request_options {
    bool throw_on_error = false;
    bool disable_keep_alive = false;
    std::string host;
    parameter_list headers;
    response_type type = response_type::text;
    std::optional<std::string> body;
    tag_map tags;
};

void from_json(const nlohmann::json& j, tls_config& config);
void from_json(const nlohmann::json& j, client_config& config);
void from_json(const nlohmann::json& j, request_options& options);

/**
 * @brief Parse and validate a client configuration document.
 * @throws std::invalid_argument on malformed JSON, wrong value types or
 *         failed validation.
 */
client_config parse_client_config(std::string_view text);

/**
 * @brief Parse a request options document.
 * @throws std::invalid_argument on malformed JSON or wrong value types.
 */
request_options parse_request_options(std::string_view text);

}
#endif // HERMES_CONFIG_HPP
