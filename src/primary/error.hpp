// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_ERROR_H_
#define DAGPOOL_SRC_PRIMARY_ERROR_H_

#include "types.hpp"

#include <string>
#include <variant>

namespace dagpool::primary {
    /// Header from a round below the garbage collection floor.
    struct header_too_old {
        /// Header ID.
        hash_t m_id{};
        /// Round of the header.
        round_t m_round{};
    };

    /// Vote for a header from a round below the garbage collection floor.
    struct vote_too_old {
        /// ID of the voted header.
        hash_t m_id{};
        /// Round of the voted header.
        round_t m_round{};
    };

    /// Certificate from a round below the garbage collection floor.
    struct certificate_too_old {
        /// Certificate digest.
        hash_t m_digest{};
        /// Round of the certificate.
        round_t m_round{};
    };

    /// An authority voted twice for the same header.
    struct authority_reuse {
        /// Authority that voted twice.
        pubkey_t m_authority{};
    };

    /// A vote does not match the header it claims to vote for.
    struct unexpected_vote {
        /// ID of the voted header.
        hash_t m_id{};
    };

    /// A message was signed by an authority outside the committee.
    struct unknown_authority {
        /// Claimed author.
        pubkey_t m_authority{};
    };

    /// A header ID does not match the header's contents.
    struct invalid_header_id {
        /// Claimed header ID.
        hash_t m_id{};
    };

    /// A signature or signature share failed verification.
    struct invalid_signature {
        /// Digest of the signed message.
        hash_t m_digest{};
    };

    /// A certificate lacks a quorum or its signer bitmap is malformed.
    /// Genesis certificates received from peers are invalid as well.
    struct invalid_certificate {
        /// Certificate digest.
        hash_t m_digest{};
    };

    /// The persistent store failed to read or write.
    struct store_error {
        /// Description of the failure.
        std::string m_what;
    };

    /// Failures while processing primary messages.
    using error = std::variant<header_too_old,
                               vote_too_old,
                               certificate_too_old,
                               authority_reuse,
                               unexpected_vote,
                               unknown_authority,
                               invalid_header_id,
                               invalid_signature,
                               invalid_certificate,
                               store_error>;

    /// Returns a human-readable description of an error.
    /// \param err error to describe.
    /// \return description suitable for the log.
    auto to_string(const error& err) -> std::string;
}

#endif // DAGPOOL_SRC_PRIMARY_ERROR_H_
