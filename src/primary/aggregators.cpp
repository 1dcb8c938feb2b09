// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "aggregators.hpp"

namespace dagpool::primary {
    auto votes_aggregator::append(const vote& v,
                                  const committee& c,
                                  const header& h)
        -> std::variant<std::optional<certificate>, error> {
        if(m_used.find(v.m_author) != m_used.end()) {
            return authority_reuse{v.m_author};
        }

        auto idx = c.index_of(v.m_author);
        if(!idx.has_value()) {
            return unknown_authority{v.m_author};
        }

        if(m_sent) {
            m_used.insert(v.m_author);
            return std::optional<certificate>();
        }

        if(auto err = v.verify(c)) {
            return err.value();
        }

        m_used.insert(v.m_author);
        m_weight += c.stake(v.m_author);
        m_aggregate.add(idx.value(), v.m_signature);

        if(m_weight < c.validity_threshold()) {
            return std::optional<certificate>();
        }

        // Quorum is only reached once.
        m_weight = 0;
        m_sent = true;

        auto cert = certificate();
        cert.m_id = h.m_id;
        cert.m_round = h.m_round;
        cert.m_origin = h.m_author;
        cert.m_votes = m_aggregate;
        return std::optional<certificate>(std::move(cert));
    }

    auto votes_aggregator::aggregate() const -> const aggregate_signature& {
        return m_aggregate;
    }

    auto votes_aggregator::sent() const -> bool {
        return m_sent;
    }
}
