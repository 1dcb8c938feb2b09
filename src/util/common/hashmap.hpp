// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_COMMON_HASHMAP_H_
#define DAGPOOL_SRC_COMMON_HASHMAP_H_

#include "hash.hpp"

#include <cstring>

namespace dagpool::hashing {
    /// \brief Uses the raw 64-bit prefix of a digest as its hash.
    ///
    /// Digests and public keys are already uniformly distributed so
    /// unordered containers keyed by them can skip re-hashing.
    struct null {
        auto operator()(const hash_t& hash) const noexcept -> size_t {
            size_t ret{};
            std::memcpy(&ret, hash.data(), sizeof(ret));
            return ret;
        }
    };
}

#endif // DAGPOOL_SRC_COMMON_HASHMAP_H_
