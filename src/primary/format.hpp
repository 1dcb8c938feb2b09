// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_FORMAT_H_
#define DAGPOOL_SRC_PRIMARY_FORMAT_H_

#include "messages.hpp"
#include "util/serialization/format.hpp"

namespace dagpool {
    /// \brief Serializes a header.
    ///
    /// Serializes the author, round, payload, parents, ID and then the
    /// signature.
    auto operator<<(serializer& ser, const primary::header& h) -> serializer&;

    /// Deserializes a header.
    /// \see \ref dagpool::operator<<(serializer&, const primary::header&)
    auto operator>>(serializer& deser, primary::header& h) -> serializer&;

    /// \brief Serializes a vote.
    ///
    /// Serializes the header ID, round, origin, author and then the
    /// signature share.
    auto operator<<(serializer& ser, const primary::vote& v) -> serializer&;

    /// Deserializes a vote.
    auto operator>>(serializer& deser, primary::vote& v) -> serializer&;

    /// \brief Serializes an aggregate signature.
    ///
    /// Serializes the signer bitmap as little-endian bytes, and then the
    /// vector of shares.
    auto operator<<(serializer& ser, const primary::aggregate_signature& sig)
        -> serializer&;

    /// Deserializes an aggregate signature. Fails if the number of shares
    /// differs from the number of signers in the bitmap.
    auto operator>>(serializer& deser, primary::aggregate_signature& sig)
        -> serializer&;

    /// \brief Serializes a certificate.
    ///
    /// Serializes the header ID, round, origin and then the aggregate
    /// signature.
    auto operator<<(serializer& ser, const primary::certificate& c)
        -> serializer&;

    /// Deserializes a certificate.
    auto operator>>(serializer& deser, primary::certificate& c)
        -> serializer&;
}

#endif // DAGPOOL_SRC_PRIMARY_FORMAT_H_
