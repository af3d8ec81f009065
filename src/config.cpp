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

#include "config.hpp"
#include "net_policy.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace corespace {
namespace {
    void require_readable(const std::string& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw std::invalid_argument(
                "failed to load key/cert; " + path + " is not a readable file"
            );
        }
    }

    void require_non_negative(const int value, const char* name) {
        if (value < 0) {
            throw std::invalid_argument(
                std::string(name) + " must not be negative"
            );
        }
    }

    template <typename T>
    T parse_document(const std::string_view text, const char* what) {
        try {
            return nlohmann::json::parse(text).get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument(
                std::string(what) + " expects a valid document, got error "
                + e.what()
            );
        }
    }
}

std::chrono::seconds client_config::effective_dial_timeout() const noexcept {
    return std::chrono::seconds(
        dial_timeout > 0 ? dial_timeout : default_dial_timeout
    );
}

int client_config::effective_max_conns_per_host() const noexcept {
    return max_conns_per_host > 0 ? max_conns_per_host
                                  : default_max_conns_per_host;
}

void client_config::validate() const {
    if (!tls.private_key.empty() && tls.certificate.empty()) {
        throw std::invalid_argument("blank certificate");
    }
    if (tls.private_key.empty() && !tls.certificate.empty()) {
        throw std::invalid_argument("blank private key");
    }
    if (!tls.certificate.empty()) {
        require_readable(tls.certificate);
        require_readable(tls.private_key);
    }
    require_non_negative(dial_timeout, "dial_timeout");
    require_non_negative(max_conn_duration, "max_conn_duration");
    require_non_negative(read_buffer_size, "read_buffer_size");
    require_non_negative(write_buffer_size, "write_buffer_size");
    require_non_negative(read_timeout, "read_timeout");
    require_non_negative(write_timeout, "write_timeout");
    require_non_negative(max_conns_per_host, "max_conns_per_host");
    // throws on malformed entries
    [[maybe_unused]] const net_policy policy(blacklist_ips, block_hostnames);
}

void from_json(const nlohmann::json& j, tls_config& config) {
    config.insecure_skip_verify = j.value("insecure_skip_verify", false);
    config.private_key = j.value("private_key", std::string {});
    config.certificate = j.value("certificate", std::string {});
}

void from_json(const nlohmann::json& j, client_config& config) {
    config.dial_timeout = j.value("dial_timeout", 0);
    config.proxy = j.value("proxy", std::string {});
    config.max_conn_duration = j.value("max_conn_duration", 0);
    config.user_agent = j.value("user_agent", std::string {});
    config.read_buffer_size = j.value("read_buffer_size", 0);
    config.write_buffer_size = j.value("write_buffer_size", 0);
    config.read_timeout = j.value("read_timeout", 0);
    config.write_timeout = j.value("write_timeout", 0);
    config.max_conns_per_host = j.value("max_conns_per_host", 0);
    if (const auto it = j.find("tls_config"); it != j.end()) {
        it->get_to(config.tls);
    }
    config.blacklist_ips
        = j.value("blacklist_ips", std::vector<std::string> {});
    config.block_hostnames
        = j.value("block_hostnames", std::vector<std::string> {});
}

void from_json(const nlohmann::json& j, request_options& options) {
    options.throw_on_error = j.value("throw", false);
    options.disable_keep_alive = j.value("disable_keep_alive", false);
    options.host = j.value("host", std::string {});
    options.headers.clear();
    if (const auto it = j.find("headers"); it != j.end()) {
        for (const auto& [name, value] : it->items()) {
            options.headers.emplace_back(name, value.get<std::string>());
        }
    }
    options.type
        = parse_response_type(j.value("response_type", std::string {}));
    options.body.reset();
    if (const auto it = j.find("body"); it != j.end() && !it->is_null()) {
        options.body = it->get<std::string>();
    }
    options.tags = j.value("tags", tag_map {});
}

client_config parse_client_config(const std::string_view text) {
    auto config = parse_document<client_config>(text, "client config");
    config.validate();
    return config;
}

request_options parse_request_options(const std::string_view text) {
    return parse_document<request_options>(text, "request options");
}
}
