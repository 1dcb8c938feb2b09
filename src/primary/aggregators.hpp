// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_AGGREGATORS_H_
#define DAGPOOL_SRC_PRIMARY_AGGREGATORS_H_

#include "committee.hpp"
#include "error.hpp"
#include "messages.hpp"
#include "util/common/hashmap.hpp"

#include <optional>
#include <unordered_set>
#include <variant>

namespace dagpool::primary {
    /// \brief Collects the votes for one header into a certificate.
    ///
    /// Each authority may vote once. Once the stake of the voters reaches
    /// the committee's validity threshold the aggregator returns a
    /// certificate, exactly once. Later votes are recorded but never
    /// verified or aggregated.
    class votes_aggregator {
      public:
        votes_aggregator() = default;

        /// Adds a vote for the header.
        /// \param v vote to add. Must reference h.
        /// \param c committee of the current epoch.
        /// \param h header being voted for.
        /// \return the certificate if this vote completed the quorum,
        ///         std::nullopt if it did not, or authority_reuse,
        ///         unknown_authority or invalid_signature. Rejected votes
        ///         leave the aggregator unchanged.
        auto append(const vote& v, const committee& c, const header& h)
            -> std::variant<std::optional<certificate>, error>;

        /// Returns the shares aggregated so far.
        [[nodiscard]] auto aggregate() const -> const aggregate_signature&;

        /// Returns true once the certificate has been returned.
        [[nodiscard]] auto sent() const -> bool;

      private:
        stake_t m_weight{0};
        std::unordered_set<pubkey_t, hashing::null> m_used;
        aggregate_signature m_aggregate;
        bool m_sent{false};
    };
}

#endif // DAGPOOL_SRC_PRIMARY_AGGREGATORS_H_
