// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_CONTROLLER_H_
#define DAGPOOL_SRC_PRIMARY_CONTROLLER_H_

#include "committee.hpp"
#include "core.hpp"
#include "network.hpp"
#include "proposer.hpp"
#include "store.hpp"
#include "synchronizer.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <atomic>
#include <memory>

namespace dagpool::primary {
    /// \brief Wires together the components of one primary.
    ///
    /// Owns the store, committee, synchronizer, core and proposer of an
    /// authority. The transport, the worker tier, the header and certificate
    /// waiters and the consensus layer are supplied by the caller.
    class controller {
      public:
        controller() = delete;
        controller(const controller&) = delete;
        auto operator=(const controller&) -> controller& = delete;
        controller(controller&&) = delete;
        auto operator=(controller&&) -> controller& = delete;

        /// Constructor.
        /// \param authority_id index of the local authority in the
        ///                     configuration.
        /// \param opts configuration options.
        /// \param network sender to the other primaries.
        /// \param consensus channel to the consensus layer.
        /// \param header_waiter channel to the header waiter.
        /// \param logger log instance.
        controller(size_t authority_id,
                   config::options opts,
                   std::shared_ptr<reliable_sender> network,
                   core::certificate_sink_t consensus,
                   synchronizer::waiter_t header_waiter,
                   std::shared_ptr<logging::log> logger);

        /// Stops the proposer and then the core.
        ~controller();

        /// Opens the store, builds the components and starts the core and
        /// proposer threads. If initialization fails, returns false and logs
        /// errors.
        /// \return true if initialization succeeded.
        auto init() -> bool;

        /// Decodes a packet from another primary and queues it for the
        /// core.
        /// \param pkt serialized primary_message.
        /// \return false if the packet could not be decoded.
        auto deliver(buffer pkt) -> bool;

        /// Records a batch sealed by one of our workers for the next header.
        /// \param digest batch digest.
        /// \param worker_id worker holding the batch.
        void our_batch(const hash_t& digest, worker_id_t worker_id);

        /// Records that one of our workers stored a batch created by
        /// another authority. Terminates the process if the store fails.
        /// \param digest batch digest.
        /// \param worker_id worker holding the batch.
        void others_batch(const hash_t& digest, worker_id_t worker_id);

        /// Resumes processing of a header whose batches have arrived.
        void header_ready(header h);

        /// Resumes processing of a certificate whose ancestors have arrived.
        void certificate_ready(certificate c);

        /// Moves the proposer to the round after the given one.
        /// \param parents certificate digests of the given round.
        /// \param round round of the parents.
        void advance_round(parents_t parents, round_t round);

        /// Publishes the latest round committed by consensus, which drives
        /// garbage collection in the core.
        void set_consensus_round(round_t round);

        /// Returns the public key of the local authority. Valid after
        /// init().
        [[nodiscard]] auto name() const -> const pubkey_t&;

      private:
        size_t m_authority_id;
        config::options m_opts;
        std::shared_ptr<reliable_sender> m_network;
        core::certificate_sink_t m_consensus;
        synchronizer::waiter_t m_header_waiter;
        std::shared_ptr<logging::log> m_logger;

        pubkey_t m_name{};
        std::shared_ptr<const committee> m_committee;
        std::shared_ptr<store> m_store;
        std::shared_ptr<std::atomic<round_t>> m_consensus_round{
            std::make_shared<std::atomic<round_t>>(0)};
        std::shared_ptr<synchronizer> m_synchronizer;

        std::unique_ptr<core> m_core;
        std::unique_ptr<proposer> m_proposer;
    };
}

#endif // DAGPOOL_SRC_PRIMARY_CONTROLLER_H_
