// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_COMMON_HASH_H_
#define DAGPOOL_SRC_COMMON_HASH_H_

#include "buffer.hpp"

#include <array>
#include <string>

namespace dagpool {
    /// The size of the digests used throughout the system, in bytes.
    static constexpr const int hash_size = 32;

    /// SHA256 digest container.
    using hash_t = std::array<unsigned char, hash_size>;

    /// Converts a hash to a hexadecimal string.
    /// \param val hash to convert.
    /// \return hex representation of the hash.
    auto to_string(const hash_t& val) -> std::string;

    /// Calculates the BIP-340 tagged SHA256 hash of the buffer contents.
    /// Different tags give unrelated digests for identical data.
    /// \param tag domain separation tag.
    /// \param data bytes to hash.
    /// \return the tagged hash of the data.
    auto tagged_hash(const std::string& tag, const buffer& data) -> hash_t;
}

#endif // DAGPOOL_SRC_COMMON_HASH_H_
