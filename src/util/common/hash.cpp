// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include "keys.hpp"

#include <iomanip>
#include <secp256k1.h>
#include <sstream>

namespace dagpool {
    auto to_string(const hash_t& val) -> std::string {
        std::stringstream ret;
        ret << std::hex << std::setfill('0');

        for(const auto& byte : val) {
            ret << std::setw(2) << static_cast<int>(byte);
        }

        return ret.str();
    }

    auto tagged_hash(const std::string& tag, const buffer& data) -> hash_t {
        hash_t ret{};
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto* tag_ptr = reinterpret_cast<const unsigned char*>(tag.data());
        [[maybe_unused]] const auto res
            = ::secp256k1_tagged_sha256(secp_context(),
                                        ret.data(),
                                        tag_ptr,
                                        tag.size(),
                                        data.c_ptr(),
                                        data.size());
        return ret;
    }
}
