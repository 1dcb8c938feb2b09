// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace dagpool {
    namespace {
        constexpr size_t bitmap_bytes = config::max_authorities / 8;
    }

    auto operator<<(serializer& ser, const primary::header& h)
        -> serializer& {
        return ser << h.m_author << h.m_round << h.m_payload << h.m_parents
                   << h.m_id << h.m_signature;
    }

    auto operator>>(serializer& deser, primary::header& h) -> serializer& {
        return deser >> h.m_author >> h.m_round >> h.m_payload >> h.m_parents
            >> h.m_id >> h.m_signature;
    }

    auto operator<<(serializer& ser, const primary::vote& v) -> serializer& {
        return ser << v.m_id << v.m_round << v.m_origin << v.m_author
                   << v.m_signature;
    }

    auto operator>>(serializer& deser, primary::vote& v) -> serializer& {
        return deser >> v.m_id >> v.m_round >> v.m_origin >> v.m_author
            >> v.m_signature;
    }

    auto operator<<(serializer& ser, const primary::aggregate_signature& sig)
        -> serializer& {
        auto bytes = std::array<uint8_t, bitmap_bytes>();
        for(size_t i{0}; i < sig.m_signers.size(); i++) {
            if(sig.m_signers.test(i)) {
                bytes[i / 8] |= static_cast<uint8_t>(1U << (i % 8));
            }
        }
        return ser << bytes << sig.m_shares;
    }

    auto operator>>(serializer& deser, primary::aggregate_signature& sig)
        -> serializer& {
        auto bytes = std::array<uint8_t, bitmap_bytes>();
        if(!(deser >> bytes >> sig.m_shares)) {
            return deser;
        }
        sig.m_signers.reset();
        for(size_t i{0}; i < sig.m_signers.size(); i++) {
            if((bytes[i / 8] & (1U << (i % 8))) != 0) {
                sig.m_signers.set(i);
            }
        }
        if(sig.m_signers.count() != sig.m_shares.size()) {
            deser.invalidate();
        }
        return deser;
    }

    auto operator<<(serializer& ser, const primary::certificate& c)
        -> serializer& {
        return ser << c.m_id << c.m_round << c.m_origin << c.m_votes;
    }

    auto operator>>(serializer& deser, primary::certificate& c)
        -> serializer& {
        return deser >> c.m_id >> c.m_round >> c.m_origin >> c.m_votes;
    }
}
