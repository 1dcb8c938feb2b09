// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_NETWORK_H_
#define DAGPOOL_SRC_PRIMARY_NETWORK_H_

#include "util/common/buffer.hpp"
#include "util/common/keys.hpp"

#include <memory>
#include <vector>

namespace dagpool::primary {
    /// Packet sent to a peer.
    using packet_t = std::shared_ptr<const buffer>;

    /// \brief A delivery in progress.
    ///
    /// Transports hold a std::weak_ptr to each delivery and keep retrying
    /// it until it succeeds or every \ref cancel_handler referencing it is
    /// gone.
    struct delivery {
        /// Peer receiving the packet.
        pubkey_t m_recipient{};
        /// Packet to deliver.
        packet_t m_packet;
    };

    /// Handle keeping a delivery alive. Dropping the last copy cancels the
    /// delivery.
    using cancel_handler = std::shared_ptr<delivery>;

    /// Sends packets to peers, retrying until they are delivered or
    /// cancelled.
    class reliable_sender {
      public:
        virtual ~reliable_sender() = default;

        reliable_sender() = default;
        reliable_sender(const reliable_sender&) = delete;
        auto operator=(const reliable_sender&) -> reliable_sender& = delete;
        reliable_sender(reliable_sender&&) = delete;
        auto operator=(reliable_sender&&) -> reliable_sender& = delete;

        /// Starts delivering a packet to one peer.
        /// \param to public key of the recipient.
        /// \param pkt packet to deliver.
        /// \return handle keeping the delivery alive.
        virtual auto send(const pubkey_t& to, packet_t pkt)
            -> cancel_handler
            = 0;

        /// Starts delivering a packet to several peers.
        /// \param to public keys of the recipients.
        /// \param pkt packet to deliver.
        /// \return one handle per recipient.
        virtual auto broadcast(const std::vector<pubkey_t>& to, packet_t pkt)
            -> std::vector<cancel_handler> {
            auto ret = std::vector<cancel_handler>();
            ret.reserve(to.size());
            for(const auto& peer : to) {
                ret.push_back(send(peer, pkt));
            }
            return ret;
        }
    };
}

#endif // DAGPOOL_SRC_PRIMARY_NETWORK_H_
