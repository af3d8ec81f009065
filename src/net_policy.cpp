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
#include "utils.hpp"

#include <arpa/inet.h>
#include <charconv>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>

namespace corespace {
namespace {
    using address_bytes = std::array<std::uint8_t, 16>;

    address_bytes mapped_v4(const in_addr& v4) {
        address_bytes out {};
        out[10] = 0xff;
        out[11] = 0xff;
        std::memcpy(out.data() + 12, &v4, 4);
        return out;
    }

    std::optional<address_bytes> to_bytes(const sockaddr* address) {
        if (!address) {
            return std::nullopt;
        }
        if (address->sa_family == AF_INET) {
            const auto* v4 = reinterpret_cast<const sockaddr_in*>(address);
            return mapped_v4(v4->sin_addr);
        }
        if (address->sa_family == AF_INET6) {
            const auto* v6 = reinterpret_cast<const sockaddr_in6*>(address);
            address_bytes out {};
            std::memcpy(out.data(), &v6->sin6_addr, out.size());
            return out;
        }
        return std::nullopt;
    }

    bool valid_pattern(const std::string_view pattern) {
        std::string_view rest = pattern;
        if (rest.starts_with("*.")) {
            rest.remove_prefix(2);
        }
        return !rest.empty() && rest.find('*') == std::string_view::npos;
    }
}

ip_network ip_network::parse(const std::string_view cidr) {
    const auto slash = cidr.find('/');
    const std::string host(cidr.substr(0, slash));
    ip_network network;
    network.text = std::string(cidr);

    unsigned max_bits = 128;
    in_addr v4 {};
    in6_addr v6 {};
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        network.prefix = mapped_v4(v4);
        max_bits = 32;
    } else if (inet_pton(AF_INET6, host.c_str(), &v6) == 1) {
        std::memcpy(network.prefix.data(), &v6, network.prefix.size());
    } else {
        throw std::invalid_argument(
            "invalid IP range: " + std::string(cidr)
        );
    }

    unsigned bits = max_bits;
    if (slash != std::string_view::npos) {
        const std::string_view digits = cidr.substr(slash + 1);
        const auto [end, ec] = std::from_chars(
            digits.data(), digits.data() + digits.size(), bits
        );
        if (digits.empty() || ec != std::errc {}
            || end != digits.data() + digits.size() || bits > max_bits) {
            throw std::invalid_argument(
                "invalid IP range prefix: " + std::string(cidr)
            );
        }
    }
    network.bits = max_bits == 32 ? bits + 96 : bits;
    return network;
}

bool ip_network::contains(const address_bytes& address) const noexcept {
    unsigned left = bits;
    for (std::size_t i = 0; i < prefix.size() && left > 0; ++i) {
        const unsigned take = left >= 8 ? 8 : left;
        const auto mask = static_cast<std::uint8_t>(0xff << (8 - take));
        if ((address[i] & mask) != (prefix[i] & mask)) {
            return false;
        }
        left -= take;
    }
    return true;
}

net_policy::net_policy(
    const std::vector<std::string>& blacklist_ips,
    const std::vector<std::string>& block_hostnames
) {
    for (const auto& cidr : blacklist_ips) {
        networks.push_back(ip_network::parse(cidr));
    }
    for (const auto& pattern : block_hostnames) {
        if (!valid_pattern(pattern)) {
            throw std::invalid_argument(
                "invalid blocked hostname pattern: " + pattern
            );
        }
        patterns.push_back(to_lower(pattern));
    }
}

const ip_network* net_policy::blocked_ip(const sockaddr* address) const {
    const auto bytes = to_bytes(address);
    if (!bytes) {
        return nullptr;
    }
    for (const auto& network : networks) {
        if (network.contains(*bytes)) {
            return &network;
        }
    }
    return nullptr;
}

std::optional<std::string>
net_policy::blocked_hostname(const std::string_view host) const {
    const std::string name = to_lower(host);
    for (const auto& pattern : patterns) {
        if (pattern.starts_with("*.")) {
            const std::string_view suffix
                = std::string_view(pattern).substr(1); // ".example.com"
            if (name.size() > suffix.size() && name.ends_with(suffix)) {
                return pattern;
            }
        } else if (name == pattern) {
            return pattern;
        }
    }
    return std::nullopt;
}

bool net_policy::empty() const noexcept {
    return networks.empty() && patterns.empty();
}

std::string address_string(const sockaddr* address) {
    char buffer[INET6_ADDRSTRLEN] = {};
    if (!address) {
        return {};
    }
    if (address->sa_family == AF_INET) {
        const auto* v4 = reinterpret_cast<const sockaddr_in*>(address);
        inet_ntop(AF_INET, &v4->sin_addr, buffer, sizeof(buffer));
    } else if (address->sa_family == AF_INET6) {
        const auto* v6 = reinterpret_cast<const sockaddr_in6*>(address);
        inet_ntop(AF_INET6, &v6->sin6_addr, buffer, sizeof(buffer));
    }
    return buffer;
}
}
