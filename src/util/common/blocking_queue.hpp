// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_COMMON_BLOCKING_QUEUE_H_
#define DAGPOOL_SRC_COMMON_BLOCKING_QUEUE_H_

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace dagpool {
    /// Thread-safe producer-consumer FIFO queue supporting multiple
    /// concurrent producers and consumers. Serves as the channel type
    /// between the primary's threads.
    /// \tparam T type of object stored in the queue.
    template<typename T>
    class blocking_queue {
      public:
        blocking_queue() = default;

        blocking_queue(const blocking_queue&) = delete;
        auto operator=(const blocking_queue&) -> blocking_queue& = delete;

        blocking_queue(blocking_queue&&) = delete;
        auto operator=(blocking_queue&&) -> blocking_queue& = delete;

        /// \brief Destructor.
        ///
        /// Clears the queue and unblocks any waiting consumers.
        ~blocking_queue() {
            clear();
        }

        /// Pushes an element onto the queue and notifies at most one waiting
        /// consumer.
        /// \param item object to push onto the queue.
        /// \return the number of elements in the queue after the push.
        auto push(T item) -> size_t {
            auto sz = [&]() {
                std::unique_lock<std::mutex> lck(m_mut);
                m_buffer.push(std::move(item));
                m_wake = true;
                return m_buffer.size();
            }();
            m_cv.notify_one();
            return sz;
        }

        /// \brief Pops an element from the queue.
        ///
        /// Blocks if the queue is empty. Unblocks on destruction or \ref
        /// clear without returning an element.
        /// \param item object into which to move the popped element.
        /// \return true on success, false if interrupted by \ref clear() or
        ///         destruction.
        [[nodiscard]] auto pop(T& item) -> bool {
            std::unique_lock<std::mutex> lck(m_mut);
            if(m_buffer.empty()) {
                m_cv.wait(lck, [&] {
                    return m_wake;
                });
            }
            return take(item);
        }

        /// \brief Pops an element from the queue, waiting at most until the
        ///        given deadline.
        /// \param item object into which to move the popped element.
        /// \param deadline time after which to give up waiting.
        /// \return true on success, false on timeout or if interrupted by
        ///         \ref clear() or destruction.
        template<typename Clock, typename Duration>
        [[nodiscard]] auto
        pop_until(T& item,
                  const std::chrono::time_point<Clock, Duration>& deadline)
            -> bool {
            std::unique_lock<std::mutex> lck(m_mut);
            if(m_buffer.empty()) {
                if(!m_cv.wait_until(lck, deadline, [&] {
                       return m_wake;
                   })) {
                    return false;
                }
            }
            return take(item);
        }

        /// Returns the number of elements waiting in the queue.
        [[nodiscard]] auto size() -> size_t {
            std::unique_lock<std::mutex> lck(m_mut);
            return m_buffer.size();
        }

        /// Clears the queue and unblocks waiting consumers.
        void clear() {
            {
                std::unique_lock<std::mutex> lck(m_mut);
                m_buffer = decltype(m_buffer)();
                m_wake = true;
            }
            m_cv.notify_all();
        }

        /// Removes the wakeup flag for consumers. Must be called after
        /// \ref clear() before re-using the queue. All consumers must have
        /// returned from \ref pop() before calling this method.
        void reset() {
            std::unique_lock<std::mutex> l(m_mut);
            m_wake = false;
        }

      private:
        // Requires m_mut to be held.
        auto take(T& item) -> bool {
            if(m_buffer.empty()) {
                return false;
            }
            item = std::move(m_buffer.front());
            m_buffer.pop();
            m_wake = !m_buffer.empty();
            return true;
        }

        std::queue<T> m_buffer;
        std::mutex m_mut;
        std::condition_variable m_cv;
        bool m_wake{false};
    };
}

#endif // DAGPOOL_SRC_COMMON_BLOCKING_QUEUE_H_
