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

#ifndef HERMES_ERROR_CODES_HPP
#define HERMES_ERROR_CODES_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace corespace {

/**
 * @brief Stable numeric failure codes, partitioned by leading digit band.
 *
 *  - 1000s: non-specific failures.
 *  - 1100s: DNS resolution and name/address policy.
 *  - 1200s: TCP.
 *  - 1300s: TLS and certificates.
 *  - 1610+, 1630+, 1650+: HTTP/2 GoAway, stream and connection errors; the
 *    unknown code of each partition is followed by one code per HTTP/2 error
 *    code from NO_ERROR (offset 1) to HTTP_1_1_REQUIRED (offset 14).
 *  - 1700s: content errors.
 *
 * Responses with status >= 400 are reported as `1000 + status`; see
 * `status_error_code`.
 */
enum class error_code : std::uint32_t {
    none = 0,
    // non specific
    default_error = 1000,
    net_non_tcp = 1010,
    invalid_url = 1020,
    request_timeout = 1050,
    // DNS
    dns_default = 1100,
    dns_no_such_host = 1101,
    blacklisted_ip = 1110,
    blocked_hostname = 1111,
    // TCP
    tcp_default = 1200,
    tcp_broken_pipe = 1201,
    net_unknown_errno = 1202,
    tcp_dial = 1210,
    tcp_dial_timeout = 1211,
    tcp_dial_refused = 1212,
    tcp_dial_unknown_errno = 1213,
    tcp_reset_by_peer = 1220,
    // TLS
    tls_default = 1300,
    tls_header = 1301,
    x509_unknown_authority = 1310,
    x509_hostname = 1311,
    // HTTP/2
    http2_goaway_unknown = 1610,
    http2_stream_unknown = 1630,
    http2_connection_unknown = 1650,
    // content
    response_decompression = 1701,
};

/// @brief Raw numeric value of @p code.
constexpr std::uint32_t to_underlying(const error_code code) noexcept {
    return static_cast<std::uint32_t>(code);
}

/// @brief Synthetic code for an HTTP status (`1000 + status`).
constexpr error_code status_error_code(const long status) noexcept {
    return static_cast<error_code>(1000 + status);
}

/// @brief HTTP/2 error codes as defined by RFC 9113, section 7.
enum class http2_code : std::uint32_t {
    no_error = 0x0,
    protocol_error = 0x1,
    internal_error = 0x2,
    flow_control_error = 0x3,
    settings_timeout = 0x4,
    stream_closed = 0x5,
    frame_size_error = 0x6,
    refused_stream = 0x7,
    cancel = 0x8,
    compression_error = 0x9,
    connect_error = 0xa,
    enhance_your_calm = 0xb,
    inadequate_security = 0xc,
    http_1_1_required = 0xd,
};

/// @brief Protocol name of an HTTP/2 error code, or "unknown error code 0x..".
std::string http2_code_name(std::uint32_t code);

/**
 * @brief Offset of an HTTP/2 error code within its partition.
 *
 * Codes past HTTP_1_1_REQUIRED collapse to 0, the partition's unknown code.
 */
constexpr std::uint32_t http2_code_offset(const std::uint32_t code) noexcept {
    if (code > static_cast<std::uint32_t>(http2_code::http_1_1_required)) {
        return 0;
    }
    return 1 + code;
}

/// @brief Closed set of failure kinds the classifier recognizes.
enum class failure_kind {
    generic, ///< Plain message, optionally wrapping a cause.
    classified, ///< Carries its own code and message.
    dns, ///< Name resolution failed for `host`; `detail` holds the reason.
    blocked_ip, ///< Peer address `addr` lies in the blacklisted `detail` net.
    blocked_hostname, ///< `host` matched the blocked `detail` pattern.
    http2_goaway, ///< GOAWAY received with `http2`.
    http2_stream, ///< RST_STREAM on stream `stream_id` with `http2`.
    http2_connection, ///< Connection-level protocol error `http2`.
    net_op, ///< Network operation `op` on network `net` to `addr` failed.
    syscall, ///< Named system call `op` failed with `sys_errno`.
    os_errno, ///< Bare OS error number `sys_errno`.
    x509_unknown_authority, ///< Certificate signed by an unknown authority.
    x509_hostname, ///< Certificate does not cover `host`.
    tls_record_header, ///< Peer did not answer with a TLS record.
    url, ///< Operation `op` on URL `addr` failed with `cause`.
};

/**
 * @struct failure
 * @brief One node of a failure chain.
 *
 * Failures are plain values; the optional `cause` points at the wrapped,
 * lower-level failure (URL errors wrap network operation errors, which wrap
 * system call errors, and so on). Which fields are meaningful depends on
 * `kind`, see `failure_kind`.
 */
struct failure {
    failure_kind kind = failure_kind::generic;
    std::string message; ///< Own text (generic, classified, wrapped detail).
    error_code code = error_code::none; ///< Only for `classified`.
    std::string op;
    std::string net;
    std::string addr;
    std::string host;
    std::string detail;
    int sys_errno = 0;
    std::uint32_t http2 = 0;
    std::uint32_t stream_id = 0;
    std::shared_ptr<const failure> cause;

    /// @brief Wrapped failure or nullptr.
    [[nodiscard]] const failure* unwrap() const noexcept {
        return cause.get();
    }

    /// @brief Human readable rendering of the whole chain.
    [[nodiscard]] std::string text() const;

    static failure generic(std::string message);
    static failure wrap(std::string message, failure inner);
    static failure
    preclassified(error_code code, std::string message, failure inner);
    static failure preclassified(error_code code, std::string message);
    static failure dns(std::string host, std::string reason);
    static failure blocked_ip(std::string ip, std::string network);
    static failure blocked_hostname(std::string host, std::string pattern);
    static failure http2_goaway(std::uint32_t code, std::string debug = {});
    static failure http2_stream(std::uint32_t stream_id, std::uint32_t code);
    static failure http2_connection(std::uint32_t code);
    static failure
    net_op(std::string op, std::string net, std::string addr, failure inner);
    static failure syscall(std::string name, int err);
    static failure os_errno(int err);
    static failure x509_unknown_authority(std::string detail = {});
    static failure x509_hostname(std::string host);
    static failure tls_record_header(std::string detail);
    static failure url(std::string op, std::string url, failure inner);
};

/// @brief Result of classifying a failure.
struct classified {
    error_code code = error_code::default_error;
    std::string message;
};

/**
 * @brief Translate @p f into a stable code and message.
 *
 * Rules are tried in a fixed order keyed by the failure kind; wrappers
 * (URL errors, generic wrappers, unmatched dial errors) delegate to their
 * cause so the most specific classification wins. Unrecognized failures fall
 * back to `error_code::default_error` with the failure's rendered text. The
 * function does not throw on well-formed input.
 */
classified classify(const failure& f);

/**
 * @class request_error
 * @brief Raised by the request engine for a failed round trip when the
 * request asks failures to be fatal.
 */
class request_error final : public std::runtime_error {
public:
    explicit request_error(failure reason);

    [[nodiscard]] const failure& reason() const noexcept;
    [[nodiscard]] error_code code() const noexcept;
    /// @brief Classified message (the exception's `what()` is the raw text).
    [[nodiscard]] const std::string& message() const noexcept;

private:
    failure raw;
    classified result;
};

}
#endif // HERMES_ERROR_CODES_HPP
