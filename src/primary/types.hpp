// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_TYPES_H_
#define DAGPOOL_SRC_PRIMARY_TYPES_H_

#include "util/common/config.hpp"
#include "util/common/hash.hpp"
#include "util/common/keys.hpp"

#include <bitset>
#include <cstdint>
#include <map>
#include <set>

namespace dagpool::primary {
    /// Layer of the DAG. Global across authorities.
    using round_t = uint64_t;

    /// Identifies one of an authority's workers.
    using worker_id_t = uint32_t;

    /// Voting weight of an authority.
    using stake_t = uint64_t;

    /// Batches referenced by a header, by batch digest.
    using payload_t = std::map<hash_t, worker_id_t>;

    /// Digests of the certificates from the previous round a header builds
    /// on.
    using parents_t = std::set<hash_t>;

    /// Bit i is set when the authority with committee index i signed.
    using signer_bitmap_t = std::bitset<config::max_authorities>;
}

#endif // DAGPOOL_SRC_PRIMARY_TYPES_H_
