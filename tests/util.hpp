// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_TESTS_UTIL_H_
#define DAGPOOL_TESTS_UTIL_H_

#include "primary/committee.hpp"
#include "primary/messages.hpp"
#include "primary/network.hpp"
#include "primary/signature_service.hpp"
#include "util/common/config.hpp"

#include <functional>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace dagpool::test {
    /// Key material of an authority used in tests.
    struct test_authority {
        privkey_t m_privkey{};
        pubkey_t m_name{};
        std::shared_ptr<const primary::signature_service> m_signer;
    };

    /// Returns the deterministic private key {n, 0, 0, ...}.
    auto test_privkey(uint8_t n) -> privkey_t;

    /// Creates n authorities with the keys {1}, {2}, ..., {n}, sorted by
    /// public key so index i is also the authority's bitmap position.
    auto make_authorities(size_t n) -> std::vector<test_authority>;

    /// Creates a committee of the given authorities with unit stakes.
    auto make_committee(const std::vector<test_authority>& authorities,
                        std::optional<primary::stake_t> validity_threshold
                        = std::nullopt)
        -> std::shared_ptr<const primary::committee>;

    /// Creates options for a committee of the given authorities, with the
    /// private key of every authority.
    auto make_options(const std::vector<test_authority>& authorities)
        -> config::options;

    /// Returns a digest whose first byte is n.
    auto test_digest(uint8_t n) -> hash_t;

    /// Decodes a primary message, failing the test if it is malformed.
    auto decode(const primary::packet_t& pkt) -> primary::primary_message;

    /// Sender recording every packet instead of delivering it.
    class recording_sender : public primary::reliable_sender {
      public:
        /// A recorded send.
        struct sent_packet {
            pubkey_t m_to{};
            primary::packet_t m_packet;
            std::weak_ptr<primary::delivery> m_delivery;
        };

        auto send(const pubkey_t& to, primary::packet_t pkt)
            -> primary::cancel_handler override;

        /// Returns a copy of the recorded sends.
        [[nodiscard]] auto sent() const -> std::vector<sent_packet>;

        /// Forgets the recorded sends.
        void clear();

      private:
        mutable std::mutex m_mut;
        std::vector<sent_packet> m_sent;
    };

    /// \brief In-process network connecting several primaries.
    ///
    /// Packets are handed to the recipient's handler synchronously, in the
    /// sender's thread. Handlers must not send.
    class loopback_network {
      public:
        /// Receives packets addressed to one authority.
        using handler_t = std::function<void(primary::packet_t)>;

        /// Registers the handler of an authority.
        void attach(const pubkey_t& name, handler_t handler);

        /// Removes the handler of an authority. Packets addressed to it are
        /// dropped from then on.
        void detach(const pubkey_t& name);

        /// Returns a sender delivering through this network.
        auto sender() -> std::shared_ptr<primary::reliable_sender>;

      private:
        class sender_impl : public primary::reliable_sender {
          public:
            explicit sender_impl(loopback_network& net);
            auto send(const pubkey_t& to, primary::packet_t pkt)
                -> primary::cancel_handler override;

          private:
            loopback_network& m_net;
        };

        void route(const pubkey_t& to, const primary::packet_t& pkt);

        std::mutex m_mut;
        std::map<pubkey_t, handler_t> m_handlers;
    };
}

#endif // DAGPOOL_TESTS_UTIL_H_
