// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_MESSAGES_H_
#define DAGPOOL_SRC_PRIMARY_MESSAGES_H_

#include "error.hpp"
#include "types.hpp"

#include <optional>
#include <variant>
#include <vector>

namespace dagpool::primary {
    class committee;
    class signature_service;

    /// \brief A proposal for one round of the DAG.
    ///
    /// References batches of transactions held by the author's workers and
    /// the certificates of the previous round it extends. Identified by the
    /// digest of its contents.
    ///
    /// \see \ref dagpool::operator<<(serializer&, const primary::header&)
    struct header {
        /// Authority that created the header.
        pubkey_t m_author{};
        /// Round of the header.
        round_t m_round{};
        /// Batch digests and the worker holding each batch.
        payload_t m_payload;
        /// Certificate digests from the previous round.
        parents_t m_parents;
        /// Digest of the fields above.
        hash_t m_id{};
        /// Author's signature over m_id.
        signature_t m_signature{};

        /// Creates and signs a header.
        /// \param author public key of the local authority.
        /// \param round round of the header.
        /// \param payload batches to include.
        /// \param parents certificates the header extends.
        /// \param signer signing key of the author.
        /// \return the signed header.
        static auto make(const pubkey_t& author,
                         round_t round,
                         payload_t payload,
                         parents_t parents,
                         const signature_service& signer) -> header;

        /// Recomputes the header ID from the header contents.
        [[nodiscard]] auto digest() const -> hash_t;

        /// Checks that the author is in the committee, the ID matches the
        /// contents and the signature is valid.
        /// \param c committee to verify against.
        /// \return std::nullopt if the header is valid.
        [[nodiscard]] auto verify(const committee& c) const
            -> std::optional<error>;

        auto operator==(const header& rhs) const -> bool;
        auto operator!=(const header& rhs) const -> bool;
    };

    /// Returns the digest signed by every vote for the given header.
    /// \param id header ID.
    /// \param round header round.
    /// \param origin header author.
    /// \return digest of the vote.
    auto vote_digest(const hash_t& id, round_t round, const pubkey_t& origin)
        -> hash_t;

    /// A promise by one authority to certify a header.
    struct vote {
        /// ID of the voted header.
        hash_t m_id{};
        /// Round of the voted header.
        round_t m_round{};
        /// Author of the voted header.
        pubkey_t m_origin{};
        /// Authority casting the vote.
        pubkey_t m_author{};
        /// Voter's signature share over \ref digest.
        signature_t m_signature{};

        /// Creates and signs a vote for a header.
        /// \param h header to vote for.
        /// \param author public key of the voter.
        /// \param signer signing key of the voter.
        /// \return the signed vote.
        static auto make(const header& h,
                         const pubkey_t& author,
                         const signature_service& signer) -> vote;

        /// Returns the digest signed by the voter.
        [[nodiscard]] auto digest() const -> hash_t;

        /// Checks that the voter is in the committee and the signature
        /// share is valid.
        [[nodiscard]] auto verify(const committee& c) const
            -> std::optional<error>;

        auto operator==(const vote& rhs) const -> bool;
    };

    /// \brief Signature shares of a quorum of votes.
    ///
    /// Shares are kept in bitmap order: the i-th share belongs to the
    /// authority of the i-th set bit. Adding shares therefore gives the same
    /// result in any order.
    struct aggregate_signature {
        /// Committee positions of the signers.
        signer_bitmap_t m_signers;
        /// One signature share per set bit, in ascending bit order.
        std::vector<signature_t> m_shares;

        /// Combines a share into the aggregate. Ignored if the signer has
        /// already contributed.
        /// \param index committee position of the signer.
        /// \param share signer's signature share.
        void add(size_t index, const signature_t& share);

        /// Returns the number of signers.
        [[nodiscard]] auto signer_count() const -> size_t;

        auto operator==(const aggregate_signature& rhs) const -> bool;
    };

    /// Proof that a quorum of the committee voted for a header.
    struct certificate {
        /// ID of the certified header.
        hash_t m_id{};
        /// Round of the certified header.
        round_t m_round{};
        /// Author of the certified header.
        pubkey_t m_origin{};
        /// Signers and their shares.
        aggregate_signature m_votes;

        /// Returns the certificate digest, used as the certificate's key in
        /// the store and as a parent reference in later headers.
        [[nodiscard]] auto digest() const -> hash_t;

        /// Checks the certificate carries valid shares from authorities
        /// holding at least the validity threshold. Genesis certificates
        /// are valid without signatures.
        [[nodiscard]] auto verify(const committee& c) const
            -> std::optional<error>;

        /// Returns the round-zero certificates of every authority. The
        /// first headers reference their digests as parents.
        static auto genesis(const committee& c) -> std::vector<certificate>;

        auto operator==(const certificate& rhs) const -> bool;
        auto operator!=(const certificate& rhs) const -> bool;
    };

    /// Messages exchanged between primaries.
    using primary_message = std::variant<header, vote, certificate>;
}

#endif // DAGPOOL_SRC_PRIMARY_MESSAGES_H_
