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

#ifndef HERMES_NET_POLICY_HPP
#define HERMES_NET_POLICY_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sockaddr;

namespace corespace {

/**
 * @struct ip_network
 * @brief An IPv4 or IPv6 CIDR range.
 *
 * IPv4 addresses are kept in their IPv4-mapped IPv6 form so that a single
 * comparison covers both families.
 */
struct ip_network {
    std::array<std::uint8_t, 16> prefix {};
    unsigned bits = 0;
    std::string text; ///< Range as written in the configuration.

    /**
     * @brief Parse "10.0.0.0/8", "fd00::/8" or a bare address.
     * @throws std::invalid_argument on malformed input.
     */
    static ip_network parse(std::string_view cidr);

    [[nodiscard]] bool
    contains(const std::array<std::uint8_t, 16>& address) const noexcept;
};

/**
 * @class net_policy
 * @brief Denylist of peer addresses and host names.
 *
 * Host patterns are exact names or `*.suffix`, where the wildcard matches one
 * or more leading labels. Matching is case-insensitive.
 */
class net_policy {
public:
    net_policy() = default;
    /// @throws std::invalid_argument on a malformed range or pattern.
    net_policy(
        const std::vector<std::string>& blacklist_ips,
        const std::vector<std::string>& block_hostnames
    );

    /// @brief Range containing @p address, if it is blacklisted.
    [[nodiscard]] const ip_network* blocked_ip(const sockaddr* address) const;

    /// @brief Pattern matching @p host, if it is blocked.
    [[nodiscard]] std::optional<std::string>
    blocked_hostname(std::string_view host) const;

    [[nodiscard]] bool empty() const noexcept;

private:
    std::vector<ip_network> networks;
    std::vector<std::string> patterns;
};

/// @brief Printable form of an IPv4/IPv6 socket address ("" otherwise).
std::string address_string(const sockaddr* address);

}
#endif // HERMES_NET_POLICY_HPP
