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

#include "transfer_failure.hpp"

#include <cerrno>
#include <charconv>
#include <optional>

namespace corespace {
namespace {
    // X509_V_ERR_* values reported through CURLINFO_SSL_VERIFYRESULT
    constexpr long x509_unable_to_get_issuer_cert = 2;
    constexpr long x509_depth_zero_self_signed = 18;
    constexpr long x509_self_signed_in_chain = 19;
    constexpr long x509_unable_to_get_issuer_locally = 20;
    constexpr long x509_unable_to_verify_leaf = 21;
    constexpr long x509_hostname_mismatch = 62;

    bool contains(const std::string_view text, const std::string_view what) {
        return text.find(what) != std::string_view::npos;
    }

    /**
     * @brief Lookup failure for an unresolved host.
     *
     * The threaded resolver only reports "Could not resolve host: <name>",
     * which is taken as a missing name. c-ares appends the reason in
     * parentheses; anything but "not found" keeps libcurl's text.
     */
    failure resolve_failure(const transfer_result& result) {
        const std::string host = url_host(result.effective_url);
        const std::string_view text = result.error_message;
        const bool nxdomain = text.empty() || !contains(text, "(")
            || contains(text, "not found") || contains(text, "NXDOMAIN")
            || contains(text, "Name or service not known");
        if (nxdomain) {
            return failure::dns(host, "no such host");
        }
        return failure::dns(host, std::string(text));
    }

    /// @brief First unsigned number following @p key in @p text.
    std::optional<std::uint32_t>
    number_after(const std::string_view text, const std::string_view key) {
        const std::size_t at = text.find(key);
        if (at == std::string_view::npos) {
            return std::nullopt;
        }
        std::string_view rest = text.substr(at + key.size());
        while (!rest.empty() && rest.front() == ' ') {
            rest.remove_prefix(1);
        }
        int base = 10;
        if (rest.starts_with("0x")) {
            rest.remove_prefix(2);
            base = 16;
        }
        std::uint32_t value = 0;
        const auto [end, ec] = std::from_chars(
            rest.data(), rest.data() + rest.size(), value, base
        );
        if (ec != std::errc {} || end == rest.data()) {
            return std::nullopt;
        }
        return value;
    }

    /// @brief HTTP/2 error code named in a libcurl message.
    std::uint32_t http2_code_in(const std::string_view text) {
        if (auto code = number_after(text, "err ")) {
            return *code;
        }
        if (auto code = number_after(text, "error code")) {
            return *code;
        }
        for (std::uint32_t code = 0;
             code <= static_cast<std::uint32_t>(http2_code::http_1_1_required);
             ++code) {
            if (contains(text, http2_code_name(code))) {
                return code;
            }
        }
        // out of the known range: classified as the partition's unknown code
        return 0xff;
    }

    std::string peer_address(const transfer_result& result) {
        return result.remote_addr().value_or("");
    }

    failure socket_failure(
        const transfer_result& result, std::string op,
        const std::string& name
    ) {
        const int err = static_cast<int>(result.os_errno);
        failure inner = failure::generic(result.error_message);
        if (err == EPIPE || err == ECONNRESET) {
            inner = failure::syscall(name, err);
        } else if (err != 0) {
            inner = failure::os_errno(err);
        }
        return failure::net_op(
            std::move(op), "tcp", peer_address(result), std::move(inner)
        );
    }

    failure tls_failure(const transfer_result& result) {
        const std::string_view text = result.error_message;
        if (result.ssl_verify_result == x509_hostname_mismatch
            || contains(text, "subject name")
            || contains(text, "does not match")) {
            return failure::x509_hostname(url_host(result.effective_url));
        }
        switch (result.ssl_verify_result) {
        case x509_unable_to_get_issuer_cert:
        case x509_depth_zero_self_signed:
        case x509_self_signed_in_chain:
        case x509_unable_to_get_issuer_locally:
        case x509_unable_to_verify_leaf:
            return failure::x509_unknown_authority(result.error_message);
        default:
            break;
        }
        if (contains(text, "issuer") || contains(text, "unknown ca")
            || contains(text, "self-signed") || contains(text, "self signed")) {
            return failure::x509_unknown_authority(result.error_message);
        }
        return failure::generic(result.error_message);
    }

    failure http2_failure(const transfer_result& result) {
        const std::string_view text = result.error_message;
        if (result.code == CURLE_HTTP2_STREAM) {
            return failure::http2_stream(
                number_after(text, "stream").value_or(0), http2_code_in(text)
            );
        }
        if (contains(text, "GOAWAY") || contains(text, "GoAway")) {
            return failure::http2_goaway(http2_code_in(text));
        }
        return failure::http2_connection(http2_code_in(text));
    }

    failure inner_failure(const transfer_result& result) {
        const std::string addr = peer_address(result);
        switch (result.code) {
        case CURLE_COULDNT_RESOLVE_HOST:
            return failure::net_op(
                "dial", "tcp", "", resolve_failure(result)
            );
        case CURLE_COULDNT_RESOLVE_PROXY:
            return failure::dns("proxy", result.error_message);
        case CURLE_COULDNT_CONNECT:
            if (result.os_errno != 0) {
                return failure::net_op(
                    "dial", "tcp", addr,
                    failure::syscall(
                        "connect", static_cast<int>(result.os_errno)
                    )
                );
            }
            return failure::net_op(
                "dial", "tcp", addr, failure::generic(result.error_message)
            );
        case CURLE_OPERATION_TIMEDOUT:
            if (!result.connected()) {
                return failure::preclassified(
                    error_code::tcp_dial_timeout, "dial: i/o timeout"
                );
            }
            return failure::preclassified(
                error_code::request_timeout, "request timeout"
            );
        case CURLE_SEND_ERROR:
            return socket_failure(result, "write", "write");
        case CURLE_RECV_ERROR:
            return socket_failure(result, "read", "read");
        case CURLE_PEER_FAILED_VERIFICATION:
            return tls_failure(result);
        case CURLE_SSL_CONNECT_ERROR:
            if (contains(result.error_message, "wrong version number")
                || contains(result.error_message, "record")) {
                return failure::tls_record_header(result.error_message);
            }
            return tls_failure(result);
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return http2_failure(result);
        case CURLE_BAD_CONTENT_ENCODING:
            return failure::preclassified(
                error_code::response_decompression,
                "error decompressing response body",
                failure::generic(result.error_message)
            );
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return failure::preclassified(
                error_code::invalid_url, "invalid URL",
                failure::generic(result.error_message)
            );
        default:
            break;
        }
        return failure::generic(
            result.error_message.empty()
                ? std::string(curl_easy_strerror(result.code))
                : result.error_message
        );
    }
}

failure translate_transfer_failure(
    const transfer_result& result, const http_method method,
    const std::string_view uri
) {
    failure inner;
    if (result.rejection) {
        const failure_kind kind = result.rejection->kind;
        if (kind == failure_kind::blocked_ip
            || kind == failure_kind::blocked_hostname) {
            inner = failure::net_op(
                "dial", "tcp", peer_address(result), *result.rejection
            );
        } else {
            inner = *result.rejection;
        }
    } else {
        inner = inner_failure(result);
    }
    return failure::url(
        std::string(operation_name(method)), std::string(uri),
        std::move(inner)
    );
}

bool body_phase_failure(const transfer_result& result) noexcept {
    if (result.status <= 0 || result.rejection) {
        return false;
    }
    switch (result.code) {
    case CURLE_BAD_CONTENT_ENCODING:
    case CURLE_PARTIAL_FILE:
    case CURLE_RECV_ERROR:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_HTTP2_STREAM:
    case CURLE_WRITE_ERROR:
        return true;
    default:
        return false;
    }
}
}
