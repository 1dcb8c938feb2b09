// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "thread_pool.hpp"

namespace dagpool {
    thread_pool::thread_pool(size_t n_threads) {
        m_threads.reserve(n_threads);
        for(size_t i{0}; i < n_threads; i++) {
            m_threads.emplace_back([this]() {
                thread_loop();
            });
        }
    }

    thread_pool::~thread_pool() {
        m_running = false;
        m_queue.clear();
        for(auto& t : m_threads) {
            if(t.joinable()) {
                t.join();
            }
        }
    }

    void thread_pool::push(std::function<void()> fn) {
        if(m_running) {
            m_queue.push(std::move(fn));
        }
    }

    auto thread_pool::size() const -> size_t {
        return m_threads.size();
    }

    void thread_pool::thread_loop() {
        auto f = std::function<void()>();
        while(m_running && m_queue.pop(f)) {
            if(f) {
                f();
            }
        }
    }
}
