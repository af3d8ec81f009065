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

#ifndef HERMES_POOL_HPP
#define HERMES_POOL_HPP

#include <memory>
#include <mutex>
#include <vector>

namespace hermespace {
/**
 * @class object_pool
 * @brief Thread-safe free list of reusable heap objects.
 *
 * `get` hands out an idle object or nullptr when none is left; the caller
 * creates a fresh one in that case and returns it with `put` when done.
 */
template <class T> class object_pool {
public:
    std::unique_ptr<T> get() {
        std::lock_guard lk(mu);
        if (items.empty()) {
            return nullptr;
        }
        auto item = std::move(items.back());
        items.pop_back();
        return item;
    }

    void put(std::unique_ptr<T> item) {
        if (!item) {
            return;
        }
        std::lock_guard lk(mu);
        items.push_back(std::move(item));
    }

    /// @brief Number of objects waiting to be reused.
    [[nodiscard]] std::size_t idle() const {
        std::lock_guard lk(mu);
        return items.size();
    }

private:
    mutable std::mutex mu;
    std::vector<std::unique_ptr<T>> items;
};

/**
 * @class pool_lease
 * @brief Scoped ownership of a pooled object; returns it to its pool when
 * the lease goes out of scope, on every path.
 */
template <class T> class pool_lease {
public:
    pool_lease(object_pool<T>& pool, std::unique_ptr<T> item)
        : pool(pool)
        , item(std::move(item)) { }
    ~pool_lease() { pool.put(std::move(item)); }
    pool_lease(const pool_lease&) = delete;
    pool_lease& operator=(const pool_lease&) = delete;

    T& operator*() const noexcept { return *item; }
    T* operator->() const noexcept { return item.get(); }

private:
    object_pool<T>& pool;
    std::unique_ptr<T> item;
};
}
#endif // HERMES_POOL_HPP
