// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/blocking_queue.hpp"
#include "util/common/thread_pool.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <thread>

class blocking_queue_test : public ::testing::Test {
  protected:
    dagpool::blocking_queue<int> m_queue;
};

TEST_F(blocking_queue_test, fifo_order) {
    m_queue.push(1);
    m_queue.push(2);
    ASSERT_EQ(m_queue.size(), 2UL);

    int v{};
    ASSERT_TRUE(m_queue.pop(v));
    ASSERT_EQ(v, 1);
    ASSERT_TRUE(m_queue.pop(v));
    ASSERT_EQ(v, 2);
}

TEST_F(blocking_queue_test, pop_until_times_out) {
    int v{};
    auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(
        m_queue.pop_until(v, start + std::chrono::milliseconds(20)));
    ASSERT_GE(std::chrono::steady_clock::now() - start,
              std::chrono::milliseconds(20));
}

TEST_F(blocking_queue_test, clear_wakes_waiter) {
    std::atomic_bool done{false};
    auto t = std::thread([&]() {
        int v{};
        [[maybe_unused]] auto res = m_queue.pop(v);
        done = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    m_queue.clear();
    t.join();
    ASSERT_TRUE(done);
}

TEST(thread_pool_test, runs_all_tasks) {
    std::atomic<size_t> count{0};
    dagpool::blocking_queue<size_t> results;
    {
        dagpool::thread_pool pool(3);
        ASSERT_EQ(pool.size(), 3UL);
        for(size_t i{0}; i < 10; i++) {
            pool.push([&, i]() {
                count++;
                results.push(i);
            });
        }
        for(size_t i{0}; i < 10; i++) {
            size_t v{};
            ASSERT_TRUE(results.pop(v));
        }
    }
    ASSERT_EQ(count, 10UL);
}
