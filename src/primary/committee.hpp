// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_COMMITTEE_H_
#define DAGPOOL_SRC_PRIMARY_COMMITTEE_H_

#include "types.hpp"
#include "util/common/config.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace dagpool::primary {
    /// A member of the committee.
    struct authority {
        /// Public key identifying the authority.
        pubkey_t m_name{};
        /// Voting weight of the authority.
        stake_t m_stake{};
    };

    /// \brief Immutable set of authorities for one epoch.
    ///
    /// Authorities are ordered by ascending public key. The position of an
    /// authority in that ordering is its bit in the signer bitmap of a
    /// certificate. Instances are shared read-only between the core loop and
    /// the certificate verification workers.
    class committee {
      public:
        /// Constructor.
        /// \param authorities members of the committee. Keys must be
        ///                    distinct.
        /// \param validity_threshold stake required for a quorum. Defaults
        ///                           to 2f+1, i.e. 2 * total / 3 + 1.
        explicit committee(const std::vector<authority>& authorities,
                           std::optional<stake_t> validity_threshold
                           = std::nullopt);

        /// Builds a committee from the authorities in the configuration.
        /// \param opts options previously validated by check_options.
        /// \return the committee.
        static auto from_options(const config::options& opts)
            -> std::shared_ptr<const committee>;

        /// Returns the stake of an authority.
        /// \param name public key of the authority.
        /// \return stake, or zero if the authority is not a member.
        [[nodiscard]] auto stake(const pubkey_t& name) const -> stake_t;

        /// Returns the sum of all stakes.
        [[nodiscard]] auto total_stake() const -> stake_t;

        /// Returns the stake required to certify a header.
        [[nodiscard]] auto validity_threshold() const -> stake_t;

        /// Returns the bitmap position of an authority.
        /// \param name public key of the authority.
        /// \return index in ascending key order, or std::nullopt if the
        ///         authority is not a member.
        [[nodiscard]] auto index_of(const pubkey_t& name) const
            -> std::optional<size_t>;

        /// Returns the public key at the given bitmap position.
        /// \param index position in ascending key order. Must be less than
        ///              size().
        [[nodiscard]] auto key_at(size_t index) const -> const pubkey_t&;

        /// Checks whether an authority is a member.
        [[nodiscard]] auto contains(const pubkey_t& name) const -> bool;

        /// Returns every member except the given one, in key order.
        [[nodiscard]] auto others(const pubkey_t& name) const
            -> std::vector<pubkey_t>;

        /// Returns the number of members.
        [[nodiscard]] auto size() const -> size_t;

      private:
        std::vector<authority> m_authorities;
        stake_t m_total_stake{};
        stake_t m_validity_threshold{};
    };
}

#endif // DAGPOOL_SRC_PRIMARY_COMMITTEE_H_
