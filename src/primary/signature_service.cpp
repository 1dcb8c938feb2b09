// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "signature_service.hpp"

namespace dagpool::primary {
    signature_service::signature_service(const privkey_t& privkey,
                                         const pubkey_t& pubkey)
        : m_privkey(privkey),
          m_pubkey(pubkey) {}

    auto signature_service::create(const privkey_t& privkey)
        -> std::optional<signature_service> {
        auto pubkey = pubkey_from_privkey(privkey, secp_context());
        if(!pubkey.has_value()) {
            return std::nullopt;
        }
        return signature_service(privkey, pubkey.value());
    }

    auto signature_service::public_key() const -> const pubkey_t& {
        return m_pubkey;
    }

    auto signature_service::sign(const hash_t& digest) const -> signature_t {
        // The key was validated by create() so signing cannot fail.
        auto sig = sign_hash(digest, m_privkey, secp_context());
        return sig.value();
    }
}
