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
#include "support/http_test_server.hpp"

#include <algorithm>
#include <cerrno>
#include <gtest/gtest.h>

using namespace corespace;
using hermes_test::http_test_server;

namespace {
/// @brief Body source replaying a fixed string, optionally hiding its size.
class string_source final : public body_source {
public:
    string_source(std::string data, const bool sized)
        : data(std::move(data))
        , sized(sized) { }

    void rewind() override { offset = 0; }

    std::size_t read(char* buffer, const std::size_t size) override {
        const std::size_t n = std::min(size, data.size() - offset);
        data.copy(buffer, n, offset);
        offset += n;
        return n;
    }

    [[nodiscard]] std::optional<std::uint64_t> size() const override {
        if (!sized) {
            return std::nullopt;
        }
        return data.size();
    }

private:
    std::string data;
    bool sized;
    std::size_t offset = 0;
};

std::uint16_t unused_port() {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), len);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}
}

TEST(HttpClient, GetCollectsStatusHeadersAndBody) {
    http_test_server server;
    const http_client client({});
    auto req = client.new_request();
    req->set_uri(server.url("/json"));

    const transfer_result result = client.perform(*req, response_type::text);
    EXPECT_EQ(result.code, CURLE_OK);
    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.body, R"({"ok":true,"items":[1,2,3]})");
    EXPECT_EQ(result.bytes_received, result.body.size());
    EXPECT_EQ(
        result.remote_addr(), "127.0.0.1:" + std::to_string(server.port())
    );
    EXPECT_TRUE(result.connected());
    const auto header = result.headers.find("X-Test-Server");
    ASSERT_NE(header, result.headers.end());
    EXPECT_EQ(header->second, "hermes");

    ASSERT_EQ(server.requests().size(), 1u);
    EXPECT_EQ(server.requests()[0].method, "GET");
    EXPECT_EQ(server.requests()[0].target, "/json");
}

TEST(HttpClient, NoneResponseTypeDiscardsBody) {
    http_test_server server;
    const http_client client({});
    auto req = client.new_request();
    req->set_uri(server.url("/json"));

    const transfer_result result = client.perform(*req, response_type::none);
    EXPECT_EQ(result.code, CURLE_OK);
    EXPECT_TRUE(result.body.empty());
    EXPECT_GT(result.bytes_received, 0u);
}

TEST(HttpClient, HeadSendsNoBodyAndReadsNone) {
    http_test_server server;
    const http_client client({});
    auto req = client.new_request();
    req->set_uri(server.url("/"));
    req->set_method(http_method::head);

    const transfer_result result = client.perform(*req, response_type::text);
    EXPECT_EQ(result.code, CURLE_OK);
    EXPECT_TRUE(result.body.empty());
    ASSERT_EQ(server.requests().size(), 1u);
    EXPECT_EQ(server.requests()[0].method, "HEAD");
}

TEST(HttpClient, ReusedHandleDropsPreviousBody) {
    http_test_server server;
    const http_client client({});
    auto req = client.new_request();
    req->set_uri(server.url("/echo"));
    req->set_method(http_method::post);
    req->set_body(std::string("hello"));
    const transfer_result posted = client.perform(*req, response_type::text);
    EXPECT_EQ(posted.body, "hello");

    req->set_method(http_method::get);
    req->clear_body();
    const transfer_result got = client.perform(*req, response_type::text);
    EXPECT_EQ(got.code, CURLE_OK);

    const auto seen = server.requests();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].method, "POST");
    EXPECT_EQ(seen[0].body, "hello");
    EXPECT_EQ(seen[1].method, "GET");
    EXPECT_TRUE(seen[1].body.empty());
    EXPECT_FALSE(seen[1].has_header("content-length"));
}

TEST(HttpClient, CustomMethodsCarryBodies) {
    http_test_server server;
    const http_client client({});
    auto req = client.new_request();
    req->set_uri(server.url("/echo"));
    req->set_method(http_method::put);
    req->set_body(std::string("put-body"));
    EXPECT_EQ(client.perform(*req, response_type::text).body, "put-body");

    req->set_method(http_method::del);
    req->clear_body();
    EXPECT_EQ(client.perform(*req, response_type::text).code, CURLE_OK);

    const auto seen = server.requests();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].method, "PUT");
    EXPECT_EQ(seen[1].method, "DELETE");
    EXPECT_TRUE(seen[1].body.empty());
}

TEST(HttpClient, StreamedBodies) {
    http_test_server server;
    const http_client client({});
    auto req = client.new_request();
    req->set_uri(server.url("/echo"));
    req->set_method(http_method::post);

    const auto sized = std::make_shared<string_source>("sized body", true);
    req->set_body(sized);
    EXPECT_EQ(client.perform(*req, response_type::text).body, "sized body");

    const auto chunked = std::make_shared<string_source>("chunked body", false);
    req->set_body(chunked);
    EXPECT_EQ(client.perform(*req, response_type::text).body, "chunked body");

    const auto seen = server.requests();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_FALSE(seen[0].chunked);
    EXPECT_EQ(seen[0].header("content-length"), "10");
    EXPECT_TRUE(seen[1].chunked);
}

TEST(HttpClient, HostOverrideAndHeaders) {
    http_test_server server;
    const http_client client({});
    auto req = client.new_request();
    req->set_uri(server.url("/"));
    req->set_host("example.test");
    req->set_headers({ { "X-Request-Id", "42" }, { "Accept", "text/plain" } });
    EXPECT_EQ(client.perform(*req, response_type::text).code, CURLE_OK);

    const auto seen = server.requests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].header("host"), "example.test");
    EXPECT_EQ(seen[0].header("x-request-id"), "42");
    EXPECT_EQ(seen[0].header("accept"), "text/plain");
}

TEST(HttpClient, UserAgentFromConfig) {
    http_test_server server;
    client_config config;
    config.user_agent = "hermes-test/1.0";
    const http_client client(config);
    auto req = client.new_request();
    req->set_uri(server.url("/"));
    client.perform(*req, response_type::none);
    EXPECT_EQ(server.requests().at(0).header("user-agent"), "hermes-test/1.0");
}

TEST(HttpClient, KeepAliveReusesTheConnection) {
    http_test_server server;
    const http_client client({});
    auto req = client.new_request();
    req->set_uri(server.url("/"));
    client.perform(*req, response_type::text);
    client.perform(*req, response_type::text);
    EXPECT_EQ(server.connections(), 1u);

    req->set_keep_alive(false);
    client.perform(*req, response_type::text);
    client.perform(*req, response_type::text);
    const auto seen = server.requests();
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[2].header("connection"), "close");
    EXPECT_EQ(seen[3].header("connection"), "close");
    EXPECT_GE(server.connections(), 2u);
}

TEST(HttpClient, RefusedConnection) {
    const http_client client({});
    auto req = client.new_request();
    req->set_uri(
        "http://127.0.0.1:" + std::to_string(unused_port()) + "/"
    );
    const transfer_result result = client.perform(*req, response_type::text);
    EXPECT_EQ(result.code, CURLE_COULDNT_CONNECT);
    EXPECT_EQ(result.os_errno, ECONNREFUSED);
    EXPECT_EQ(result.status, 0);
    EXPECT_FALSE(result.error_message.empty());
}

TEST(HttpClient, BlockedHostnameIsRejectedBeforeSending) {
    http_test_server server;
    client_config config;
    config.block_hostnames = { "127.0.0.1" };
    const http_client client(config);
    auto req = client.new_request();
    req->set_uri(server.url("/"));

    const transfer_result result = client.perform(*req, response_type::text);
    ASSERT_TRUE(result.rejection.has_value());
    EXPECT_EQ(result.rejection->kind, failure_kind::blocked_hostname);
    EXPECT_NE(result.code, CURLE_OK);
    EXPECT_TRUE(server.requests().empty());
}

TEST(HttpClient, BlacklistedIpIsRejectedAtConnect) {
    http_test_server server;
    client_config config;
    config.blacklist_ips = { "127.0.0.0/8" };
    const http_client client(config);
    auto req = client.new_request();
    req->set_uri(server.url("/"));

    const transfer_result result = client.perform(*req, response_type::text);
    ASSERT_TRUE(result.rejection.has_value());
    EXPECT_EQ(result.rejection->kind, failure_kind::blocked_ip);
    EXPECT_EQ(result.rejection->detail, "127.0.0.0/8");
    EXPECT_NE(result.code, CURLE_OK);
    EXPECT_EQ(server.connections(), 0u);
}

TEST(HttpClient, BlockedCandidateAddressIsSkipped) {
    // localhost may resolve to ::1 first; the IPv4 fallback must win.
    http_test_server server;
    client_config config;
    config.blacklist_ips = { "::1/128" };
    const http_client client(config);
    auto req = client.new_request();
    req->set_uri(
        "http://localhost:" + std::to_string(server.port()) + "/"
    );

    const transfer_result result = client.perform(*req, response_type::text);
    EXPECT_EQ(result.code, CURLE_OK);
    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.primary_ip, "127.0.0.1");
    EXPECT_FALSE(result.rejection.has_value());
    EXPECT_EQ(server.requests().size(), 1u);
}

TEST(HttpClient, OwnsOnlyItsHandles) {
    const http_client first({});
    const http_client second({});
    const auto req = first.new_request();
    EXPECT_TRUE(first.owns(*req));
    EXPECT_FALSE(second.owns(*req));
}

TEST(HttpClient, RejectsInvalidConfig) {
    client_config config;
    config.tls.private_key = "key.pem";
    EXPECT_THROW(http_client { config }, std::invalid_argument);
}

TEST(UrlHost, ExtractsTheHost) {
    EXPECT_EQ(url_host("http://example.com:8080/x?y=1"), "example.com");
    EXPECT_EQ(url_host("https://user:pw@api.test/"), "api.test");
    EXPECT_EQ(url_host("not a url"), "");
}
