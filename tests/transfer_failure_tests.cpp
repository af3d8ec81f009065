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
#include <gtest/gtest.h>

using namespace corespace;

namespace {
transfer_result failed_with(const CURLcode code, std::string message = {}) {
    transfer_result result;
    result.code = code;
    result.error_message = std::move(message);
    result.effective_url = "http://service.test:8080/items";
    return result;
}

transfer_result connected(transfer_result result) {
    result.primary_ip = "127.0.0.1";
    result.primary_port = 8080;
    result.connect = std::chrono::microseconds(120);
    return result;
}

classified translate(
    const transfer_result& result, const http_method method = http_method::get
) {
    return classify(
        translate_transfer_failure(result, method, result.effective_url)
    );
}
}

TEST(TransferFailure, WrapsInUrlError) {
    const failure f = translate_transfer_failure(
        failed_with(CURLE_COULDNT_RESOLVE_HOST), http_method::post,
        "http://service.test:8080/items"
    );
    EXPECT_EQ(f.kind, failure_kind::url);
    EXPECT_EQ(
        f.text(),
        "Post \"http://service.test:8080/items\": dial tcp: lookup "
        "service.test: no such host"
    );
}

TEST(TransferFailure, UnresolvedHost) {
    const classified c = translate(failed_with(CURLE_COULDNT_RESOLVE_HOST));
    EXPECT_EQ(c.code, error_code::dns_no_such_host);
    EXPECT_EQ(c.message, "lookup: no such host");

    const classified threaded = translate(failed_with(
        CURLE_COULDNT_RESOLVE_HOST, "Could not resolve host: service.test"
    ));
    EXPECT_EQ(threaded.code, error_code::dns_no_such_host);

    const classified ares = translate(failed_with(
        CURLE_COULDNT_RESOLVE_HOST,
        "Could not resolve host: service.test (Domain name not found)"
    ));
    EXPECT_EQ(ares.code, error_code::dns_no_such_host);
}

TEST(TransferFailure, ResolverErrorKeepsText) {
    const std::string text
        = "Could not resolve host: service.test (Server failed)";
    const classified c
        = translate(failed_with(CURLE_COULDNT_RESOLVE_HOST, text));
    EXPECT_EQ(c.code, error_code::dns_default);
    EXPECT_EQ(c.message, "lookup service.test: " + text);
}

TEST(TransferFailure, ConnectionRefused) {
    transfer_result result = failed_with(CURLE_COULDNT_CONNECT);
    result.os_errno = ECONNREFUSED;
    result.primary_ip = "127.0.0.1";
    result.primary_port = 1;
    const classified c = translate(result);
    EXPECT_EQ(c.code, error_code::tcp_dial_refused);
    EXPECT_EQ(c.message, "dial: connection refused");
}

TEST(TransferFailure, ConnectWithoutErrno) {
    const classified c
        = translate(failed_with(CURLE_COULDNT_CONNECT, "proxy said no"));
    EXPECT_EQ(c.code, error_code::tcp_dial);
}

TEST(TransferFailure, TimeoutBeforeAndAfterConnect) {
    const classified dial = translate(failed_with(CURLE_OPERATION_TIMEDOUT));
    EXPECT_EQ(dial.code, error_code::tcp_dial_timeout);
    EXPECT_EQ(dial.message, "dial: i/o timeout");

    const classified request
        = translate(connected(failed_with(CURLE_OPERATION_TIMEDOUT)));
    EXPECT_EQ(request.code, error_code::request_timeout);
    EXPECT_EQ(request.message, "request timeout");
}

TEST(TransferFailure, SocketErrors) {
    transfer_result reset = connected(failed_with(CURLE_RECV_ERROR));
    reset.os_errno = ECONNRESET;
    EXPECT_EQ(translate(reset).message, "read: connection reset by peer");

    transfer_result pipe = connected(failed_with(CURLE_SEND_ERROR));
    pipe.os_errno = EPIPE;
    EXPECT_EQ(translate(pipe).code, error_code::tcp_broken_pipe);
    EXPECT_EQ(translate(pipe).message, "write: broken pipe");

    transfer_result other = connected(failed_with(CURLE_RECV_ERROR));
    other.os_errno = EIO;
    EXPECT_EQ(translate(other).code, error_code::net_unknown_errno);

    const classified plain
        = translate(connected(failed_with(CURLE_RECV_ERROR, "recv failure")));
    EXPECT_EQ(plain.code, error_code::tcp_default);
    EXPECT_EQ(plain.message, "read tcp 127.0.0.1:8080: recv failure");
}

TEST(TransferFailure, CertificateProblems) {
    transfer_result hostname
        = failed_with(CURLE_PEER_FAILED_VERIFICATION, "SSL: no alternative");
    hostname.ssl_verify_result = 62;
    EXPECT_EQ(translate(hostname).code, error_code::x509_hostname);

    transfer_result issuer = failed_with(
        CURLE_PEER_FAILED_VERIFICATION, "SSL certificate problem"
    );
    issuer.ssl_verify_result = 20;
    EXPECT_EQ(translate(issuer).code, error_code::x509_unknown_authority);

    const classified self_signed = translate(failed_with(
        CURLE_PEER_FAILED_VERIFICATION,
        "SSL certificate problem: self-signed certificate"
    ));
    EXPECT_EQ(self_signed.code, error_code::x509_unknown_authority);
    EXPECT_EQ(self_signed.message, "x509: unknown authority");
}

TEST(TransferFailure, PlainTextPeer) {
    const classified c = translate(failed_with(
        CURLE_SSL_CONNECT_ERROR,
        "error:0A00010B:SSL routines::wrong version number"
    ));
    EXPECT_EQ(c.code, error_code::tls_header);
}

TEST(TransferFailure, Http2) {
    const classified goaway = translate(failed_with(
        CURLE_HTTP2, "Received GOAWAY: PROTOCOL_ERROR (err 1)"
    ));
    EXPECT_EQ(to_underlying(goaway.code), 1612u);

    const classified stream = translate(failed_with(
        CURLE_HTTP2_STREAM,
        "HTTP/2 stream 5 was not closed cleanly: INTERNAL_ERROR (err 2)"
    ));
    EXPECT_EQ(to_underlying(stream.code), 1633u);

    const classified connection = translate(
        failed_with(CURLE_HTTP2, "Error in the HTTP2 framing layer")
    );
    EXPECT_EQ(connection.code, error_code::http2_connection_unknown);
}

TEST(TransferFailure, ContentAndUrl) {
    const classified decoding = translate(
        connected(failed_with(CURLE_BAD_CONTENT_ENCODING, "gzip failed"))
    );
    EXPECT_EQ(decoding.code, error_code::response_decompression);
    EXPECT_EQ(decoding.message, "error decompressing response body");

    EXPECT_EQ(
        translate(failed_with(CURLE_URL_MALFORMAT)).code,
        error_code::invalid_url
    );
    EXPECT_EQ(
        translate(failed_with(CURLE_UNSUPPORTED_PROTOCOL)).message,
        "invalid URL"
    );
}

TEST(TransferFailure, OtherCodesKeepCurlText) {
    const classified c = translate(failed_with(CURLE_TOO_MANY_REDIRECTS));
    EXPECT_EQ(c.code, error_code::default_error);
    EXPECT_EQ(c.message, curl_easy_strerror(CURLE_TOO_MANY_REDIRECTS));
}

TEST(TransferFailure, RejectionWins) {
    transfer_result blocked = failed_with(CURLE_COULDNT_CONNECT);
    blocked.os_errno = ECONNREFUSED;
    blocked.rejection = failure::blocked_ip("10.1.1.1", "10.0.0.0/8");
    EXPECT_EQ(translate(blocked).code, error_code::blacklisted_ip);

    transfer_result hostname = failed_with(CURLE_COULDNT_RESOLVE_HOST);
    hostname.rejection = failure::blocked_hostname("service.test", "*.test");
    const classified c = translate(hostname);
    EXPECT_EQ(c.code, error_code::blocked_hostname);
    EXPECT_EQ(c.message, "hostname is blocked");
}

TEST(TransferFailure, BodyPhase) {
    transfer_result partial = connected(failed_with(CURLE_PARTIAL_FILE));
    partial.status = 200;
    EXPECT_TRUE(body_phase_failure(partial));

    transfer_result before_head = connected(failed_with(CURLE_RECV_ERROR));
    EXPECT_FALSE(body_phase_failure(before_head));

    transfer_result refused = failed_with(CURLE_COULDNT_CONNECT);
    refused.status = 200;
    EXPECT_FALSE(body_phase_failure(refused));
}
