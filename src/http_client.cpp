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

#include "http_client.hpp"
#include "net_policy.hpp"

#include <algorithm>
#include <array>
#include <mutex>
#include <stdexcept>
#include <sys/socket.h>

namespace corespace {
namespace {
    std::once_flag global_curl;

    void curl_inited() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != 0) {
            throw std::runtime_error("curl_global_init failed");
        }
    }

    std::chrono::microseconds info_time(CURL* curl, const CURLINFO info) {
        curl_off_t value = 0;
        if (curl_easy_getinfo(curl, info, &value) != CURLE_OK) {
            return std::chrono::microseconds { 0 };
        }
        return std::chrono::microseconds { value };
    }
}

/**
 * @class transport_share
 * @brief State shared by a client and every easy handle it created.
 *
 * libcurl calls `lock`/`unlock` around each access to the shared
 * connection, DNS and TLS session caches.
 */
class transport_share final {
public:
    explicit transport_share(client_config config)
        : config(std::move(config))
        , policy(this->config.blacklist_ips, this->config.block_hostnames) {
        share.reset(curl_share_init());
        if (!share) {
            throw std::runtime_error("curl_share_init failed");
        }
        CURLSH* sh = share.get();
        curl_share_setopt(sh, CURLSHOPT_LOCKFUNC, lock);
        curl_share_setopt(sh, CURLSHOPT_UNLOCKFUNC, unlock);
        curl_share_setopt(sh, CURLSHOPT_USERDATA, this);
        curl_share_setopt(sh, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(sh, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        curl_share_setopt(sh, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    }

    [[nodiscard]] CURLSH* handle() const noexcept { return share.get(); }

    const client_config config;
    const net_policy policy;

private:
    static void
    lock(CURL*, const curl_lock_data data, curl_lock_access, void* user) {
        static_cast<transport_share*>(user)->locks.at(data).lock();
    }

    static void unlock(CURL*, const curl_lock_data data, void* user) {
        static_cast<transport_share*>(user)->locks.at(data).unlock();
    }

    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;
    std::unique_ptr<CURLSH, decltype(&curl_share_cleanup)> share {
        nullptr, &curl_share_cleanup
    };
};

easy_request::easy_request(std::shared_ptr<transport_share> owner)
    : owner(std::move(owner)) {
    curl.reset(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("curl_easy_init failed");
    }
    CURL* h = curl.get();
    const client_config& opt = this->owner->config;

    curl_easy_setopt(h, CURLOPT_SHARE, this->owner->handle());
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(h, CURLOPT_READFUNCTION, read_callback);
    curl_easy_setopt(h, CURLOPT_READDATA, this);
    curl_easy_setopt(h, CURLOPT_OPENSOCKETFUNCTION, open_socket);
    curl_easy_setopt(h, CURLOPT_OPENSOCKETDATA, this);

    if (!opt.user_agent.empty()) {
        curl_easy_setopt(h, CURLOPT_USERAGENT, opt.user_agent.c_str());
    }
    curl_easy_setopt(
        h, CURLOPT_CONNECTTIMEOUT_MS,
        static_cast<long>(
            std::chrono::milliseconds(opt.effective_dial_timeout()).count()
        )
    );
    if (const long total = opt.read_timeout + opt.write_timeout; total > 0) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, total * 1000L);
    }
    if (opt.read_buffer_size > 0) {
        curl_easy_setopt(
            h, CURLOPT_BUFFERSIZE, static_cast<long>(opt.read_buffer_size)
        );
    }
    if (opt.write_buffer_size > 0) {
        curl_easy_setopt(
            h, CURLOPT_UPLOAD_BUFFERSIZE,
            static_cast<long>(opt.write_buffer_size)
        );
    }
    if (opt.max_conn_duration > 0) {
        curl_easy_setopt(
            h, CURLOPT_MAXLIFETIME_CONN,
            static_cast<long>(opt.max_conn_duration)
        );
    }
    curl_easy_setopt(
        h, CURLOPT_MAXCONNECTS,
        static_cast<long>(opt.effective_max_conns_per_host())
    );
    if (!opt.proxy.empty()) {
        curl_easy_setopt(h, CURLOPT_PROXY, opt.proxy.c_str());
    }
    if (opt.tls.insecure_skip_verify) {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (!opt.tls.certificate.empty()) {
        curl_easy_setopt(h, CURLOPT_SSLCERT, opt.tls.certificate.c_str());
        curl_easy_setopt(h, CURLOPT_SSLKEY, opt.tls.private_key.c_str());
    }
}

easy_request::~easy_request() {
    if (curl) {
        // detach before the share handle can go away with `owner`
        curl_easy_setopt(curl.get(), CURLOPT_SHARE, nullptr);
    }
}

void easy_request::set_uri(std::string uri) { target = std::move(uri); }

void easy_request::set_host(std::string host) {
    host_override = std::move(host);
    headers_dirty = true;
}

void easy_request::set_headers(parameter_list headers) {
    header_fields = std::move(headers);
    headers_dirty = true;
}

void easy_request::set_keep_alive(const bool enabled) {
    if (keep != enabled) {
        keep = enabled;
        headers_dirty = true;
    }
}

void easy_request::set_method(const http_method method) { verb = method; }

void easy_request::clear_body() {
    kind = body_kind::none;
    payload.clear();
    stream.reset();
}

void easy_request::set_body(std::string bytes) {
    kind = body_kind::bytes;
    payload = std::move(bytes);
    stream.reset();
}

void easy_request::set_body(std::shared_ptr<body_source> source) {
    if (!source) {
        clear_body();
        return;
    }
    kind = body_kind::stream;
    payload.clear();
    stream = std::move(source);
}

void easy_request::rebuild_headers() {
    curl_slist* list = nullptr;
    const auto append = [&list](const std::string& line) {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) {
            curl_slist_free_all(list);
            throw std::runtime_error("failed to allocate curl headers");
        }
        list = next;
    };
    for (const auto& [name, value] : header_fields) {
        append(name + ": " + value);
    }
    if (!host_override.empty()) {
        append("Host: " + host_override);
    }
    if (!keep) {
        append("Connection: close");
    }
    header_list.reset(list);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    headers_dirty = false;
}

void easy_request::apply() {
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, target.c_str());
    if (headers_dirty) {
        rebuild_headers();
    }
    curl_easy_setopt(h, CURLOPT_FORBID_REUSE, keep ? 0L : 1L);

    // Start from a plain GET; setting POSTFIELDS switches libcurl to POST,
    // so it is cleared before HTTPGET.
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, curl_off_t { -1 });
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, nullptr);
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, nullptr);
    curl_easy_setopt(h, CURLOPT_NOBODY, 0L);
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);

    if (verb == http_method::get) {
        return;
    }
    if (verb == http_method::head) {
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        return;
    }
    switch (kind) {
    case body_kind::stream: {
        const auto length = stream->size();
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(
            h, CURLOPT_POSTFIELDSIZE_LARGE,
            length ? static_cast<curl_off_t>(*length) : curl_off_t { -1 }
        );
        break;
    }
    case body_kind::bytes:
    case body_kind::none:
        curl_easy_setopt(
            h, CURLOPT_POSTFIELDSIZE_LARGE,
            static_cast<curl_off_t>(payload.size())
        );
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.data());
        break;
    }
    if (verb != http_method::post) {
        curl_easy_setopt(
            h, CURLOPT_CUSTOMREQUEST, std::string(to_string(verb)).c_str()
        );
    }
}

size_t easy_request::read_callback(
    char* buffer, const size_t size, const size_t n, void* data
) {
    auto* self = static_cast<easy_request*>(data);
    if (self->kind != body_kind::stream || !self->stream) {
        return 0;
    }
    try {
        return self->stream->read(buffer, size * n);
    } catch (const std::exception& e) {
        self->rejected = failure::wrap(
            "reading request body", failure::generic(e.what())
        );
        return CURL_READFUNC_ABORT;
    }
}

curl_socket_t easy_request::open_socket(
    void* data, const curlsocktype purpose, curl_sockaddr* address
) {
    auto* self = static_cast<easy_request*>(data);
    if (purpose == CURLSOCKTYPE_IPCXN) {
        if (const ip_network* network
            = self->owner->policy.blocked_ip(&address->addr)) {
            self->rejected = failure::blocked_ip(
                address_string(&address->addr), network->text
            );
            return CURL_SOCKET_BAD;
        }
    }
    return ::socket(address->family, address->socktype, address->protocol);
}

std::string url_host(const std::string_view uri) {
    std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> url(
        curl_url(), &curl_url_cleanup
    );
    if (!url
        || curl_url_set(
               url.get(), CURLUPART_URL, std::string(uri).c_str(), 0
           )
            != CURLUE_OK) {
        return {};
    }
    char* host = nullptr;
    if (curl_url_get(url.get(), CURLUPART_HOST, &host, 0) != CURLUE_OK
        || !host) {
        return {};
    }
    std::string out(host);
    curl_free(host);
    return out;
}

bool transfer_result::connected() const noexcept {
    return status > 0 || (!primary_ip.empty() && connect.count() > 0);
}

std::chrono::microseconds transfer_result::conn_duration() const noexcept {
    const auto done = std::max(connect, app_connect);
    return done > name_lookup ? done - name_lookup
                              : std::chrono::microseconds { 0 };
}

std::optional<std::string> transfer_result::remote_addr() const {
    if (primary_ip.empty()) {
        return std::nullopt;
    }
    return join_host_port(primary_ip, primary_port);
}

http_client::http_client(client_config config) {
    std::call_once(global_curl, curl_inited);
    config.validate();
    shared = std::make_shared<transport_share>(std::move(config));
}

std::unique_ptr<easy_request> http_client::new_request() const {
    return std::unique_ptr<easy_request>(new easy_request(shared));
}

bool http_client::owns(const easy_request& request) const noexcept {
    return request.owner == shared;
}

transfer_result
http_client::perform(easy_request& request, const response_type type) const {
    transfer_result result;

    if (const std::string host = url_host(request.uri()); !host.empty()) {
        if (auto pattern = shared->policy.blocked_hostname(host)) {
            result.code = CURLE_COULDNT_RESOLVE_HOST;
            result.error_message = "hostname is blocked";
            result.rejection
                = failure::blocked_hostname(host, std::move(*pattern));
            return result;
        }
    }

    request.apply();
    request.rejected.reset();
    request.error_buffer[0] = '\0';

    CURL* h = request.curl.get();
    if (type == response_type::none) {
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, discard_callback);
    } else {
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    }
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &result);

    result.code = curl_easy_perform(h);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, nullptr);

    update_info(h, result);
    update_headers(h, result);
    if (result.code != CURLE_OK) {
        result.error_message = request.error_buffer[0] != '\0'
            ? std::string(request.error_buffer)
            : std::string(curl_easy_strerror(result.code));
    }
    // libcurl may skip a blocked address and connect to the next one.
    if (result.code != CURLE_OK) {
        result.rejection = std::move(request.rejected);
    }
    request.rejected.reset();
    return result;
}

void http_client::update_info(CURL* curl, transfer_result& result) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);
    curl_easy_getinfo(curl, CURLINFO_OS_ERRNO, &result.os_errno);
    curl_easy_getinfo(
        curl, CURLINFO_SSL_VERIFYRESULT, &result.ssl_verify_result
    );
    if (char* ip = nullptr;
        curl_easy_getinfo(curl, CURLINFO_PRIMARY_IP, &ip) == CURLE_OK && ip) {
        result.primary_ip = ip;
    }
    curl_easy_getinfo(curl, CURLINFO_PRIMARY_PORT, &result.primary_port);
    if (char* url = nullptr;
        curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &url) == CURLE_OK
        && url) {
        result.effective_url = url;
    }
    result.name_lookup = info_time(curl, CURLINFO_NAMELOOKUP_TIME_T);
    result.connect = info_time(curl, CURLINFO_CONNECT_TIME_T);
    result.app_connect = info_time(curl, CURLINFO_APPCONNECT_TIME_T);
}

void http_client::update_headers(CURL* curl, transfer_result& result) {
    result.headers.clear();
    if (result.status == 0) {
        return;
    }
    for (curl_header* header = nullptr;;) {
        header = curl_easy_nextheader(curl, CURLH_HEADER, -1, header);
        if (!header) {
            break;
        }
        result.headers.emplace(header->name, header->value);
    }
}

size_t http_client::write_callback(
    char* ptr, const size_t size, const size_t n, void* data
) {
    const size_t total = size * n;
    auto* result = static_cast<transfer_result*>(data);
    result->body.append(ptr, total);
    result->bytes_received += total;
    return total;
}

size_t http_client::discard_callback(
    char*, const size_t size, const size_t n, void* data
) {
    const size_t total = size * n;
    static_cast<transfer_result*>(data)->bytes_received += total;
    return total;
}
}
