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

#include "checks.hpp"

#include <chrono>
#include <stdexcept>

namespace hermespace {
using namespace corespace;

check& check_group::get(const std::string_view name) {
    if (name.find("::") != std::string_view::npos) {
        throw std::invalid_argument(
            "check name can't contain '::': " + std::string(name)
        );
    }
    std::lock_guard lk(mu);
    auto it = checks.find(name);
    if (it == checks.end()) {
        it = checks
                 .emplace(
                     std::string(name),
                     std::make_unique<check>(std::string(name))
                 )
                 .first;
    }
    return *it->second;
}

bool check_status(
    const long want, const response& r, const run_state& state,
    check_group& group, const tag_map& extra
) {
    const auto now = std::chrono::system_clock::now();
    tags_and_meta ctm = state.tags.clone();
    for (const auto& [name, value] : extra) {
        ctm.set_tag(name, value);
    }

    check& record = group.get("check status is " + std::to_string(want));
    if (state.system_tags.has(system_tag::check)) {
        ctm.set_tag(to_string(system_tag::check), record.name);
    }

    const bool pass = r.status == want;
    if (pass) {
        record.passes.fetch_add(1, std::memory_order_relaxed);
    } else {
        record.fails.fetch_add(1, std::memory_order_relaxed);
    }

    if (state.samples) {
        std::vector<sample> batch;
        batch.push_back(
            { .series = &state.builtin.checks,
              .tags = std::move(ctm.tags),
              .metadata = std::move(ctm.metadata),
              .time = now,
              .value = pass ? 1.0 : 0.0 }
        );
        try {
            push_if_not_done(state.done, *state.samples, std::move(batch));
        } catch (const std::exception& e) {
            state.log().warn("dropping check sample: {}", e.what());
        }
    }
    return pass;
}
}
