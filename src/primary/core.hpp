// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_CORE_H_
#define DAGPOOL_SRC_PRIMARY_CORE_H_

#include "aggregators.hpp"
#include "committee.hpp"
#include "error.hpp"
#include "messages.hpp"
#include "network.hpp"
#include "signature_service.hpp"
#include "store.hpp"
#include "synchronizer.hpp"
#include "util/common/blocking_queue.hpp"
#include "util/common/hashmap.hpp"
#include "util/common/logging.hpp"
#include "util/common/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace dagpool::primary {
    /// \brief Processes the headers, votes and certificates of a primary.
    ///
    /// Votes for valid headers, aggregates the votes for our own headers
    /// into certificates, stores headers and certificates and forwards every
    /// certificate to the consensus layer. All state is owned by a single
    /// event loop. The only work done elsewhere is the verification of
    /// certificates received from peers, which runs on a thread pool and
    /// re-enters the loop as a \ref verified_certificate event.
    ///
    /// Per-round state older than the consensus round minus the garbage
    /// collection depth is discarded after every event. Storage failures
    /// terminate the process.
    class core {
      public:
        /// Delivers a certificate to the consensus layer. Returns false if
        /// the certificate could not be delivered.
        using certificate_sink_t = std::function<bool(const certificate&)>;

        /// Header whose missing batches arrived, from the header waiter.
        struct loopback_header {
            /// Header to resume processing.
            header m_header;
        };

        /// Certificate whose missing ancestors arrived, from the
        /// certificate waiter.
        struct loopback_certificate {
            /// Certificate to resume processing.
            certificate m_certificate;
        };

        /// Header created by our proposer.
        struct own_header {
            /// The new header.
            header m_header;
        };

        /// Certificate from a peer whose signatures have been checked.
        struct verified_certificate {
            /// The verified certificate.
            certificate m_certificate;
        };

        /// Events processed by the loop.
        using event_t = std::variant<primary_message,
                                     loopback_header,
                                     loopback_certificate,
                                     own_header,
                                     verified_certificate>;

        /// Constructor.
        /// \param name public key of the local authority.
        /// \param c committee of the current epoch.
        /// \param st store for headers and certificates.
        /// \param sync payload availability check.
        /// \param signer signing key of the local authority.
        /// \param consensus_round latest round committed by consensus.
        /// \param gc_depth rounds of state kept behind consensus_round.
        /// \param verifier_threads number of certificate verification
        ///                         threads.
        /// \param network sender to the other primaries.
        /// \param sink channel to the consensus layer.
        /// \param log log instance.
        core(const pubkey_t& name,
             std::shared_ptr<const committee> c,
             std::shared_ptr<store> st,
             std::shared_ptr<synchronizer> sync,
             std::shared_ptr<const signature_service> signer,
             std::shared_ptr<std::atomic<round_t>> consensus_round,
             round_t gc_depth,
             size_t verifier_threads,
             std::shared_ptr<reliable_sender> network,
             certificate_sink_t sink,
             std::shared_ptr<logging::log> log);

        /// Stops the event loop.
        ~core();

        core(const core&) = delete;
        auto operator=(const core&) -> core& = delete;
        core(core&&) = delete;
        auto operator=(core&&) -> core& = delete;

        /// Starts the event loop thread.
        void start();

        /// Stops and joins the event loop thread.
        void stop();

        /// Queues an event for the loop. Thread-safe.
        /// \param event event to queue.
        void post(event_t event);

        /// Processes the next queued event, waiting at most the given time
        /// for one to arrive. For driving the core without its thread.
        /// \param timeout longest time to wait.
        /// \return true if an event was processed.
        auto run_once(std::chrono::milliseconds timeout) -> bool;

        /// \brief Processes one event and all local work it generates.
        ///
        /// Our own votes and certificates are processed before returning,
        /// rather than sent over the network. Garbage collection runs
        /// afterwards. Errors are logged, and a store_error terminates the
        /// process.
        /// \param event event to process.
        /// \return the first error raised while processing the event.
        auto handle(event_t event) -> std::optional<error>;

        /// Returns the garbage collection floor.
        [[nodiscard]] auto gc_round() const -> round_t;

        /// Returns the number of our headers waiting for a quorum.
        [[nodiscard]] auto in_flight() const -> size_t;

        /// Returns the number of deliveries held open to peers.
        [[nodiscard]] auto pending_deliveries() const -> size_t;

        /// Returns the number of rounds with vote bookkeeping.
        [[nodiscard]] auto voted_rounds() const -> size_t;

      private:
        struct pending_header {
            header m_header;
            votes_aggregator m_aggregator;
        };

        using local_work_t = std::variant<vote, certificate>;

        auto handle_message(primary_message& msg) -> std::optional<error>;

        auto process_own_header(const header& h) -> std::optional<error>;
        auto process_header(const header& h) -> std::optional<error>;
        auto process_vote(const vote& v) -> std::optional<error>;
        auto process_certificate(const certificate& c)
            -> std::optional<error>;

        auto sanitize_header(const header& h) -> std::optional<error>;
        auto sanitize_vote(const vote& v) -> std::optional<error>;
        auto sanitize_certificate(const certificate& c)
            -> std::optional<error>;

        void report(const error& err);
        void collect_garbage();

        static auto encode(const primary_message& msg) -> packet_t;

        pubkey_t m_name;
        std::shared_ptr<const committee> m_committee;
        std::shared_ptr<store> m_store;
        std::shared_ptr<synchronizer> m_synchronizer;
        std::shared_ptr<const signature_service> m_signer;
        std::shared_ptr<std::atomic<round_t>> m_consensus_round;
        round_t m_gc_depth;
        std::shared_ptr<reliable_sender> m_network;
        certificate_sink_t m_sink;
        std::shared_ptr<logging::log> m_log;

        round_t m_gc_round{0};
        std::map<round_t, std::unordered_set<hash_t, hashing::null>>
            m_last_voted;
        std::map<round_t, std::vector<cancel_handler>> m_cancel_handlers;
        std::unordered_map<hash_t, pending_header, hashing::null>
            m_processing;
        std::deque<local_work_t> m_local;

        blocking_queue<event_t> m_events;
        std::atomic_bool m_running{false};
        std::thread m_thread;

        thread_pool m_verifier;
    };
}

#endif // DAGPOOL_SRC_PRIMARY_CORE_H_
