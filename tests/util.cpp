// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include "primary/format.hpp"
#include "util/serialization/util.hpp"

#include <algorithm>

namespace dagpool::test {
    auto test_privkey(uint8_t n) -> privkey_t {
        auto ret = privkey_t();
        ret[0] = n;
        return ret;
    }

    auto make_authorities(size_t n) -> std::vector<test_authority> {
        auto ret = std::vector<test_authority>();
        for(size_t i{0}; i < n; i++) {
            auto a = test_authority();
            a.m_privkey = test_privkey(static_cast<uint8_t>(i + 1));
            auto signer = primary::signature_service::create(a.m_privkey);
            EXPECT_TRUE(signer.has_value());
            a.m_signer = std::make_shared<const primary::signature_service>(
                signer.value());
            a.m_name = a.m_signer->public_key();
            ret.push_back(std::move(a));
        }
        std::sort(ret.begin(),
                  ret.end(),
                  [](const test_authority& lhs, const test_authority& rhs) {
                      return lhs.m_name < rhs.m_name;
                  });
        return ret;
    }

    auto make_committee(const std::vector<test_authority>& authorities,
                        std::optional<primary::stake_t> validity_threshold)
        -> std::shared_ptr<const primary::committee> {
        auto members = std::vector<primary::authority>();
        for(const auto& a : authorities) {
            members.push_back(primary::authority{a.m_name, 1});
        }
        return std::make_shared<const primary::committee>(members,
                                                          validity_threshold);
    }

    auto make_options(const std::vector<test_authority>& authorities)
        -> config::options {
        auto opts = config::options();
        for(size_t i{0}; i < authorities.size(); i++) {
            opts.m_authority_public_keys.push_back(authorities[i].m_name);
            opts.m_authority_stakes.push_back(1);
            opts.m_authority_private_keys.emplace(i,
                                                  authorities[i].m_privkey);
        }
        return opts;
    }

    auto test_digest(uint8_t n) -> hash_t {
        auto ret = hash_t();
        ret[0] = n;
        return ret;
    }

    auto decode(const primary::packet_t& pkt) -> primary::primary_message {
        auto buf = *pkt;
        auto msg = from_buffer<primary::primary_message>(buf);
        EXPECT_TRUE(msg.has_value());
        return msg.value_or(primary::primary_message());
    }

    auto recording_sender::send(const pubkey_t& to, primary::packet_t pkt)
        -> primary::cancel_handler {
        auto handler
            = std::make_shared<primary::delivery>(primary::delivery{to, pkt});
        std::unique_lock<std::mutex> l(m_mut);
        m_sent.push_back(sent_packet{to, std::move(pkt), handler});
        return handler;
    }

    auto recording_sender::sent() const -> std::vector<sent_packet> {
        std::unique_lock<std::mutex> l(m_mut);
        return m_sent;
    }

    void recording_sender::clear() {
        std::unique_lock<std::mutex> l(m_mut);
        m_sent.clear();
    }

    void loopback_network::attach(const pubkey_t& name, handler_t handler) {
        std::unique_lock<std::mutex> l(m_mut);
        m_handlers[name] = std::move(handler);
    }

    auto loopback_network::sender()
        -> std::shared_ptr<primary::reliable_sender> {
        return std::make_shared<sender_impl>(*this);
    }

    loopback_network::sender_impl::sender_impl(loopback_network& net)
        : m_net(net) {}

    auto loopback_network::sender_impl::send(const pubkey_t& to,
                                             primary::packet_t pkt)
        -> primary::cancel_handler {
        auto handler
            = std::make_shared<primary::delivery>(primary::delivery{to, pkt});
        m_net.route(to, pkt);
        return handler;
    }

    void loopback_network::detach(const pubkey_t& name) {
        std::unique_lock<std::mutex> l(m_mut);
        m_handlers.erase(name);
    }

    void loopback_network::route(const pubkey_t& to,
                                 const primary::packet_t& pkt) {
        // Handlers run under the lock so detach() waits for in-progress
        // deliveries.
        std::unique_lock<std::mutex> l(m_mut);
        auto it = m_handlers.find(to);
        if(it == m_handlers.end()) {
            return;
        }
        it->second(pkt);
    }
}
