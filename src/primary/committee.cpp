// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "committee.hpp"

#include <algorithm>

namespace dagpool::primary {
    committee::committee(const std::vector<authority>& authorities,
                         std::optional<stake_t> validity_threshold)
        : m_authorities(authorities) {
        std::sort(m_authorities.begin(),
                  m_authorities.end(),
                  [](const authority& lhs, const authority& rhs) {
                      return lhs.m_name < rhs.m_name;
                  });
        for(const auto& a : m_authorities) {
            m_total_stake += a.m_stake;
        }
        // 2 * total / 3 + 1 without overflowing 2 * total
        m_validity_threshold = validity_threshold.value_or(
            m_total_stake / 3 * 2 + m_total_stake % 3 * 2 / 3 + 1);
    }

    auto committee::from_options(const config::options& opts)
        -> std::shared_ptr<const committee> {
        auto authorities = std::vector<authority>();
        authorities.reserve(opts.m_authority_public_keys.size());
        for(size_t i{0}; i < opts.m_authority_public_keys.size(); i++) {
            authorities.push_back(authority{opts.m_authority_public_keys[i],
                                            opts.m_authority_stakes[i]});
        }
        return std::make_shared<const committee>(authorities,
                                                 opts.m_validity_threshold);
    }

    auto committee::stake(const pubkey_t& name) const -> stake_t {
        auto idx = index_of(name);
        if(!idx.has_value()) {
            return 0;
        }
        return m_authorities[idx.value()].m_stake;
    }

    auto committee::total_stake() const -> stake_t {
        return m_total_stake;
    }

    auto committee::validity_threshold() const -> stake_t {
        return m_validity_threshold;
    }

    auto committee::index_of(const pubkey_t& name) const
        -> std::optional<size_t> {
        auto it = std::lower_bound(m_authorities.begin(),
                                   m_authorities.end(),
                                   name,
                                   [](const authority& a, const pubkey_t& k) {
                                       return a.m_name < k;
                                   });
        if(it == m_authorities.end() || it->m_name != name) {
            return std::nullopt;
        }
        return static_cast<size_t>(std::distance(m_authorities.begin(), it));
    }

    auto committee::key_at(size_t index) const -> const pubkey_t& {
        return m_authorities.at(index).m_name;
    }

    auto committee::contains(const pubkey_t& name) const -> bool {
        return index_of(name).has_value();
    }

    auto committee::others(const pubkey_t& name) const
        -> std::vector<pubkey_t> {
        auto ret = std::vector<pubkey_t>();
        ret.reserve(m_authorities.size());
        for(const auto& a : m_authorities) {
            if(a.m_name != name) {
                ret.push_back(a.m_name);
            }
        }
        return ret;
    }

    auto committee::size() const -> size_t {
        return m_authorities.size();
    }
}
