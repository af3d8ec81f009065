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

#include "net_policy.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>

using namespace corespace;

namespace {
sockaddr_in v4(const char* text) {
    sockaddr_in addr {};
    addr.sin_family = AF_INET;
    inet_pton(AF_INET, text, &addr.sin_addr);
    return addr;
}

sockaddr_in6 v6(const char* text) {
    sockaddr_in6 addr {};
    addr.sin6_family = AF_INET6;
    inet_pton(AF_INET6, text, &addr.sin6_addr);
    return addr;
}

const sockaddr* as_sockaddr(const sockaddr_in& addr) {
    return reinterpret_cast<const sockaddr*>(&addr);
}

const sockaddr* as_sockaddr(const sockaddr_in6& addr) {
    return reinterpret_cast<const sockaddr*>(&addr);
}
}

TEST(IpNetwork, ParseRejectsGarbage) {
    EXPECT_THROW(ip_network::parse("not-an-ip"), std::invalid_argument);
    EXPECT_THROW(ip_network::parse("10.0.0.0/33"), std::invalid_argument);
    EXPECT_THROW(ip_network::parse("10.0.0.0/"), std::invalid_argument);
    EXPECT_THROW(ip_network::parse("fd00::/129"), std::invalid_argument);
    EXPECT_NO_THROW(ip_network::parse("192.168.1.1"));
    EXPECT_EQ(ip_network::parse("10.0.0.0/8").text, "10.0.0.0/8");
}

TEST(NetPolicy, BlocksIpv4Ranges) {
    const net_policy policy({ "10.0.0.0/8", "192.168.1.7" }, {});
    const auto inside = v4("10.20.30.40");
    const auto outside = v4("11.0.0.1");
    const auto exact = v4("192.168.1.7");
    const auto neighbour = v4("192.168.1.8");

    const ip_network* hit = policy.blocked_ip(as_sockaddr(inside));
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->text, "10.0.0.0/8");
    EXPECT_EQ(policy.blocked_ip(as_sockaddr(outside)), nullptr);
    EXPECT_NE(policy.blocked_ip(as_sockaddr(exact)), nullptr);
    EXPECT_EQ(policy.blocked_ip(as_sockaddr(neighbour)), nullptr);
}

TEST(NetPolicy, BlocksIpv6Ranges) {
    const net_policy policy({ "fd00::/8" }, {});
    EXPECT_NE(policy.blocked_ip(as_sockaddr(v6("fd12::1"))), nullptr);
    EXPECT_EQ(policy.blocked_ip(as_sockaddr(v6("2001:db8::1"))), nullptr);
}

TEST(NetPolicy, Ipv4RangeMatchesMappedIpv6) {
    const net_policy policy({ "127.0.0.0/8" }, {});
    EXPECT_NE(
        policy.blocked_ip(as_sockaddr(v6("::ffff:127.0.0.1"))), nullptr
    );
}

TEST(NetPolicy, BlocksHostnamePatterns) {
    const net_policy policy({}, { "Example.COM", "*.internal.test" });
    EXPECT_EQ(policy.blocked_hostname("example.com"), "example.com");
    EXPECT_EQ(policy.blocked_hostname("EXAMPLE.com"), "example.com");
    EXPECT_EQ(policy.blocked_hostname("api.internal.test"), "*.internal.test");
    EXPECT_FALSE(policy.blocked_hostname("internal.test").has_value());
    EXPECT_FALSE(policy.blocked_hostname("www.example.com").has_value());
}

TEST(NetPolicy, RejectsBadPatterns) {
    EXPECT_THROW(net_policy({}, { "*" }), std::invalid_argument);
    EXPECT_THROW(net_policy({}, { "a.*.test" }), std::invalid_argument);
    EXPECT_THROW(net_policy({ "300.1.1.1" }, {}), std::invalid_argument);
}

TEST(NetPolicy, EmptyPolicy) {
    const net_policy policy;
    EXPECT_TRUE(policy.empty());
    EXPECT_EQ(policy.blocked_ip(nullptr), nullptr);
    EXPECT_FALSE(net_policy({ "10.0.0.0/8" }, {}).empty());
}

TEST(AddressString, FormatsBothFamilies) {
    EXPECT_EQ(address_string(as_sockaddr(v4("10.1.2.3"))), "10.1.2.3");
    EXPECT_EQ(address_string(as_sockaddr(v6("fd00::1"))), "fd00::1");
    EXPECT_EQ(address_string(nullptr), "");
}
