// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_COMMON_THREAD_POOL_H_
#define DAGPOOL_SRC_COMMON_THREAD_POOL_H_

#include "blocking_queue.hpp"

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

namespace dagpool {
    /// Fixed-size pool of worker threads draining a shared task queue.
    /// Tasks still queued when the pool is destroyed are discarded.
    class thread_pool {
      public:
        /// Starts the worker threads.
        /// \param n_threads number of workers. Must be at least one.
        explicit thread_pool(size_t n_threads);

        /// Discards pending tasks and joins the workers.
        ~thread_pool();

        thread_pool(const thread_pool&) = delete;
        auto operator=(const thread_pool&) -> thread_pool& = delete;
        thread_pool(thread_pool&&) = delete;
        auto operator=(thread_pool&&) -> thread_pool& = delete;

        /// Queues a task for execution by the next idle worker.
        /// \param fn task to run.
        void push(std::function<void()> fn);

        /// Returns the number of worker threads.
        [[nodiscard]] auto size() const -> size_t;

      private:
        std::atomic_bool m_running{true};
        blocking_queue<std::function<void()>> m_queue;
        std::vector<std::thread> m_threads;

        void thread_loop();
    };
}

#endif // DAGPOOL_SRC_COMMON_THREAD_POOL_H_
