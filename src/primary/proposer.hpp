// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_PROPOSER_H_
#define DAGPOOL_SRC_PRIMARY_PROPOSER_H_

#include "messages.hpp"
#include "signature_service.hpp"
#include "util/common/blocking_queue.hpp"
#include "util/common/logging.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace dagpool::primary {
    /// \brief Creates the headers of the local authority.
    ///
    /// Buffers the batch digests sealed by our workers and seals them into
    /// a header once their serialized size reaches the header size, or once
    /// the maximum header delay has elapsed with at least one digest
    /// pending. Never proposes an empty header.
    class proposer {
      public:
        /// Batch digests and the workers that sealed them.
        using batch_digests = std::vector<std::pair<hash_t, worker_id_t>>;

        /// Hands a new header to the core. Returns false if the core is
        /// gone.
        using header_sink_t = std::function<bool(header)>;

        /// Constructor.
        /// \param name public key of the local authority.
        /// \param signer signing key of the local authority.
        /// \param header_size payload size in bytes that triggers a header.
        /// \param max_header_delay longest a pending digest waits.
        /// \param parents parents of the first header, usually the genesis
        ///                certificates.
        /// \param sink channel to the core.
        /// \param log log instance.
        proposer(const pubkey_t& name,
                 std::shared_ptr<const signature_service> signer,
                 size_t header_size,
                 std::chrono::milliseconds max_header_delay,
                 parents_t parents,
                 header_sink_t sink,
                 std::shared_ptr<logging::log> log);

        ~proposer();

        proposer(const proposer&) = delete;
        auto operator=(const proposer&) -> proposer& = delete;
        proposer(proposer&&) = delete;
        auto operator=(proposer&&) -> proposer& = delete;

        /// Starts the proposer thread.
        void start();

        /// Stops and joins the proposer thread.
        void stop();

        /// Queues digests of batches sealed by our workers.
        /// \param digests batch digests and worker IDs.
        void add_digests(batch_digests digests);

        /// Queues a round update from the core. The next header belongs to
        /// round + 1 and references the given parents. Updates for rounds
        /// before the current round are ignored.
        /// \param parents certificate digests of the given round.
        /// \param round round of the parents.
        void advance_round(parents_t parents, round_t round);

        /// \brief Runs one iteration of the proposer loop.
        ///
        /// Waits for the next queued update, or until the header delay
        /// elapses, then proposes a header if one is due.
        /// \return false if the proposer was stopped.
        auto run_once() -> bool;

        /// Returns the round of the next header. Only meaningful when
        /// called from the thread running the loop.
        [[nodiscard]] auto round() const -> round_t;

      private:
        struct parents_update {
            parents_t m_parents;
            round_t m_round{};
        };

        using event_t = std::variant<batch_digests, parents_update>;

        void handle(event_t event);
        void propose_if_ready();
        void make_header();

        pubkey_t m_name;
        std::shared_ptr<const signature_service> m_signer;
        size_t m_header_size;
        std::chrono::milliseconds m_max_header_delay;
        header_sink_t m_sink;
        std::shared_ptr<logging::log> m_log;

        round_t m_round{1};
        parents_t m_parents;
        batch_digests m_digests;
        size_t m_payload_size{0};
        std::chrono::steady_clock::time_point m_deadline;

        blocking_queue<event_t> m_events;
        std::atomic_bool m_running{true};
        std::thread m_thread;
    };
}

#endif // DAGPOOL_SRC_PRIMARY_PROPOSER_H_
