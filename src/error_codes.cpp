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

#include "error_codes.hpp"
#include "utils.hpp"

#include <array>
#include <cerrno>
#include <system_error>

namespace corespace {
namespace {
#if defined(_WIN32)
    constexpr bool on_windows = true;
#else
    constexpr bool on_windows = false;
#endif
    constexpr int wsa_connection_reset = 10054;
    constexpr int wsa_connection_refused = 10061;

    std::string errno_message(const int err) {
        return std::system_category().message(err);
    }

    bool connection_reset(const int err) {
        return err == ECONNRESET || (on_windows && err == wsa_connection_reset);
    }

    bool connection_refused(const int err) {
        return err == ECONNREFUSED
            || (on_windows && err == wsa_connection_refused);
    }

    std::shared_ptr<const failure> boxed(failure inner) {
        return std::make_shared<const failure>(std::move(inner));
    }

    classified fallback(const failure& f) {
        if (const failure* inner = f.unwrap()) {
            return classify(*inner);
        }
        return { error_code::default_error, f.text() };
    }

    // A bare syscall failure reports only the errno text.
    classified from_syscall(const failure& f) {
        if (f.sys_errno == 0) {
            return { error_code::default_error, f.text() };
        }
        return { error_code::default_error, errno_message(f.sys_errno) };
    }

    classified pre_classified(const failure& f) {
        return { f.code, f.message };
    }

    classified from_dns(const failure& f) {
        if (f.detail == "no such host") {
            return { error_code::dns_no_such_host, "lookup: no such host" };
        }
        return { error_code::dns_default, f.text() };
    }

    classified from_blocked_ip(const failure&) {
        return { error_code::blacklisted_ip, "ip is blacklisted" };
    }

    classified from_blocked_hostname(const failure&) {
        return { error_code::blocked_hostname, "hostname is blocked" };
    }

    classified in_http2_partition(
        const error_code base, const std::uint32_t code,
        const std::string_view what
    ) {
        return { static_cast<error_code>(
                     to_underlying(base) + http2_code_offset(code)
                 ),
                 "http2: " + std::string(what) + " with http2 ErrCode "
                     + http2_code_name(code) };
    }

    classified from_http2_goaway(const failure& f) {
        return in_http2_partition(
            error_code::http2_goaway_unknown, f.http2, "received GoAway"
        );
    }

    classified from_http2_stream(const failure& f) {
        return in_http2_partition(
            error_code::http2_stream_unknown, f.http2, "stream error"
        );
    }

    classified from_http2_connection(const failure& f) {
        return in_http2_partition(
            error_code::http2_connection_unknown, f.http2, "connection error"
        );
    }

    classified from_net_op(const failure& f) {
        if (f.net != "tcp" && f.net != "tcp6") {
            return { error_code::net_non_tcp, f.text() };
        }
        const failure* inner = f.unwrap();
        const bool inner_syscall
            = inner && inner->kind == failure_kind::syscall;
        if (inner_syscall) {
            if (connection_reset(inner->sys_errno)) {
                return { error_code::tcp_reset_by_peer,
                         f.op + ": connection reset by peer" };
            }
            if (inner->sys_errno == EPIPE) {
                return { error_code::tcp_broken_pipe, f.op + ": broken pipe" };
            }
        }
        if (f.op != "dial") {
            if (inner && inner->kind == failure_kind::os_errno) {
                return { error_code::net_unknown_errno,
                         f.op + ": unknown errno `"
                             + std::to_string(inner->sys_errno) + "` on "
                             + std::string(platform_name())
                             + " with message `"
                             + errno_message(inner->sys_errno) + "`" };
            }
            return { error_code::tcp_default, f.text() };
        }
        if (inner_syscall && inner->sys_errno != 0) {
            if (connection_refused(inner->sys_errno)) {
                return { error_code::tcp_dial_refused,
                         "dial: connection refused" };
            }
            return { error_code::tcp_dial_unknown_errno,
                     "dial: unknown errno " + std::to_string(inner->sys_errno)
                         + " error with msg `"
                         + errno_message(inner->sys_errno) + "`" };
        }
        // the cause may be something more specific, e.g. a DNS failure
        if (inner) {
            classified wrapped = classify(*inner);
            if (wrapped.code != error_code::default_error) {
                return wrapped;
            }
        }
        return { error_code::tcp_dial, f.text() };
    }

    classified from_x509_unknown_authority(const failure&) {
        return { error_code::x509_unknown_authority,
                 "x509: unknown authority" };
    }

    classified from_x509_hostname(const failure&) {
        return { error_code::x509_hostname,
                 "x509: certificate doesn't match hostname" };
    }

    classified from_tls_record_header(const failure& f) {
        return { error_code::tls_header, f.text() };
    }

    struct rule {
        failure_kind kind;
        classified (*extract)(const failure&);
    };

    // Evaluated in order; kinds without a rule use `fallback`.
    constexpr std::array<rule, 14> rules { {
        { failure_kind::classified, pre_classified },
        { failure_kind::dns, from_dns },
        { failure_kind::blocked_ip, from_blocked_ip },
        { failure_kind::blocked_hostname, from_blocked_hostname },
        { failure_kind::http2_goaway, from_http2_goaway },
        { failure_kind::http2_stream, from_http2_stream },
        { failure_kind::http2_connection, from_http2_connection },
        { failure_kind::net_op, from_net_op },
        { failure_kind::x509_unknown_authority, from_x509_unknown_authority },
        { failure_kind::x509_hostname, from_x509_hostname },
        { failure_kind::tls_record_header, from_tls_record_header },
        { failure_kind::url, fallback },
        { failure_kind::syscall, from_syscall },
        { failure_kind::os_errno, fallback },
    } };
}

std::string http2_code_name(const std::uint32_t code) {
    static constexpr std::array<std::string_view, 14> names {
        "NO_ERROR",          "PROTOCOL_ERROR",      "INTERNAL_ERROR",
        "FLOW_CONTROL_ERROR", "SETTINGS_TIMEOUT",    "STREAM_CLOSED",
        "FRAME_SIZE_ERROR",  "REFUSED_STREAM",      "CANCEL",
        "COMPRESSION_ERROR", "CONNECT_ERROR",       "ENHANCE_YOUR_CALM",
        "INADEQUATE_SECURITY", "HTTP_1_1_REQUIRED",
    };
    if (code < names.size()) {
        return std::string(names[code]);
    }
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    for (std::uint32_t rest = code; rest != 0; rest >>= 4) {
        hex.insert(hex.begin(), digits[rest & 0xf]);
    }
    return "unknown error code 0x" + hex;
}

std::string failure::text() const {
    const std::string inner = cause ? cause->text() : std::string {};
    switch (kind) {
    case failure_kind::generic:
        if (message.empty()) {
            return inner;
        }
        return inner.empty() ? message : message + ": " + inner;
    case failure_kind::classified:
        return message;
    case failure_kind::dns:
        return "lookup " + host + ": " + detail;
    case failure_kind::blocked_ip:
        return "IP (" + addr + ") is in a blacklisted range (" + detail + ")";
    case failure_kind::blocked_hostname:
        return "hostname (" + host + ") is in a blocked pattern (" + detail
            + ")";
    case failure_kind::http2_goaway:
        return "http2: server sent GOAWAY and closed the connection; ErrCode="
            + http2_code_name(http2) + ", debug=\"" + detail + "\"";
    case failure_kind::http2_stream:
        return "stream error: stream ID " + std::to_string(stream_id) + "; "
            + http2_code_name(http2);
    case failure_kind::http2_connection:
        return "connection error: " + http2_code_name(http2);
    case failure_kind::net_op: {
        std::string out = op + " " + net;
        if (!addr.empty()) {
            out += " " + addr;
        }
        return inner.empty() ? out : out + ": " + inner;
    }
    case failure_kind::syscall:
        return op + ": " + errno_message(sys_errno);
    case failure_kind::os_errno:
        return errno_message(sys_errno);
    case failure_kind::x509_unknown_authority:
        return detail.empty()
            ? "x509: certificate signed by unknown authority"
            : "x509: certificate signed by unknown authority (" + detail + ")";
    case failure_kind::x509_hostname:
        return "x509: certificate is not valid for " + host;
    case failure_kind::tls_record_header:
        return detail.empty()
            ? "tls: first record does not look like a TLS handshake"
            : "tls: " + detail;
    case failure_kind::url:
        return op + " \"" + addr + "\": " + inner;
    }
    return message;
}

failure failure::generic(std::string message) {
    failure f;
    f.message = std::move(message);
    return f;
}

failure failure::wrap(std::string message, failure inner) {
    failure f;
    f.message = std::move(message);
    f.cause = boxed(std::move(inner));
    return f;
}

failure failure::preclassified(
    const error_code code, std::string message, failure inner
) {
    failure f = preclassified(code, std::move(message));
    f.cause = boxed(std::move(inner));
    return f;
}

failure
failure::preclassified(const error_code code, std::string message) {
    failure f;
    f.kind = failure_kind::classified;
    f.code = code;
    f.message = std::move(message);
    return f;
}

failure failure::dns(std::string host, std::string reason) {
    failure f;
    f.kind = failure_kind::dns;
    f.host = std::move(host);
    f.detail = std::move(reason);
    return f;
}

failure failure::blocked_ip(std::string ip, std::string network) {
    failure f;
    f.kind = failure_kind::blocked_ip;
    f.addr = std::move(ip);
    f.detail = std::move(network);
    return f;
}

failure failure::blocked_hostname(std::string host, std::string pattern) {
    failure f;
    f.kind = failure_kind::blocked_hostname;
    f.host = std::move(host);
    f.detail = std::move(pattern);
    return f;
}

failure failure::http2_goaway(const std::uint32_t code, std::string debug) {
    failure f;
    f.kind = failure_kind::http2_goaway;
    f.http2 = code;
    f.detail = std::move(debug);
    return f;
}

failure
failure::http2_stream(const std::uint32_t stream_id, const std::uint32_t code) {
    failure f;
    f.kind = failure_kind::http2_stream;
    f.stream_id = stream_id;
    f.http2 = code;
    return f;
}

failure failure::http2_connection(const std::uint32_t code) {
    failure f;
    f.kind = failure_kind::http2_connection;
    f.http2 = code;
    return f;
}

failure failure::net_op(
    std::string op, std::string net, std::string addr, failure inner
) {
    failure f;
    f.kind = failure_kind::net_op;
    f.op = std::move(op);
    f.net = std::move(net);
    f.addr = std::move(addr);
    f.cause = boxed(std::move(inner));
    return f;
}

failure failure::syscall(std::string name, const int err) {
    failure f;
    f.kind = failure_kind::syscall;
    f.op = std::move(name);
    f.sys_errno = err;
    return f;
}

failure failure::os_errno(const int err) {
    failure f;
    f.kind = failure_kind::os_errno;
    f.sys_errno = err;
    return f;
}

failure failure::x509_unknown_authority(std::string detail) {
    failure f;
    f.kind = failure_kind::x509_unknown_authority;
    f.detail = std::move(detail);
    return f;
}

failure failure::x509_hostname(std::string host) {
    failure f;
    f.kind = failure_kind::x509_hostname;
    f.host = std::move(host);
    return f;
}

failure failure::tls_record_header(std::string detail) {
    failure f;
    f.kind = failure_kind::tls_record_header;
    f.detail = std::move(detail);
    return f;
}

failure failure::url(std::string op, std::string url, failure inner) {
    failure f;
    f.kind = failure_kind::url;
    f.op = std::move(op);
    f.addr = std::move(url);
    f.cause = boxed(std::move(inner));
    return f;
}

classified classify(const failure& f) {
    for (const auto& [kind, extract] : rules) {
        if (kind == f.kind) {
            return extract(f);
        }
    }
    return fallback(f);
}

request_error::request_error(failure reason)
    : std::runtime_error(reason.text())
    , raw(std::move(reason))
    , result(classify(raw)) { }

const failure& request_error::reason() const noexcept { return raw; }

error_code request_error::code() const noexcept { return result.code; }

const std::string& request_error::message() const noexcept {
    return result.message;
}
}
