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

#ifndef HERMES_CHECKS_HPP
#define HERMES_CHECKS_HPP

#include "client.hpp"
#include "metrics.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace hermespace {
/// @brief Named check with its pass/fail counters.
struct check {
    explicit check(std::string name)
        : name(std::move(name)) { }

    const std::string name;
    std::atomic<std::int64_t> passes { 0 };
    std::atomic<std::int64_t> fails { 0 };
};

/**
 * @class check_group
 * @brief Registry of checks recorded under one group.
 *
 * `get` returns the same record for the same name, so counters accumulate
 * across calls and threads.
 */
class check_group {
public:
    explicit check_group(std::string name = {})
        : group_name(std::move(name)) { }

    /**
     * @brief Record for check @p name, created on first use.
     * @throws std::invalid_argument if @p name contains "::".
     */
    check& get(std::string_view name);

    [[nodiscard]] const std::string& name() const noexcept {
        return group_name;
    }

private:
    std::string group_name;
    std::mutex mu;
    std::map<std::string, std::unique_ptr<check>, std::less<>> checks;
};

/**
 * @brief Check that @p r has status @p want.
 *
 * Records a `checks` sample (1 on pass, 0 on fail) tagged with the run's
 * tags, @p extra and, when the `check` system tag is enabled,
 * `check = "check status is <want>"`. The sample is dropped if the run is
 * already done.
 *
 * @return Whether the status matched.
 */
bool check_status(
    long want, const response& r, const corespace::run_state& state,
    check_group& group, const corespace::tag_map& extra = {}
);
}
#endif // HERMES_CHECKS_HPP
