// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "keys.hpp"

#include <memory>
#include <secp256k1.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>

namespace dagpool {
    auto secp_context() -> secp256k1_context* {
        static const auto ctx
            = std::unique_ptr<secp256k1_context,
                              decltype(&secp256k1_context_destroy)>(
                secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                         | SECP256K1_CONTEXT_VERIFY),
                &secp256k1_context_destroy);
        return ctx.get();
    }

    auto pubkey_from_privkey(const privkey_t& privkey, secp256k1_context* ctx)
        -> std::optional<pubkey_t> {
        secp256k1_keypair keypair{};
        if(::secp256k1_keypair_create(ctx, &keypair, privkey.data()) != 1) {
            return std::nullopt;
        }

        secp256k1_xonly_pubkey xpub{};
        if(::secp256k1_keypair_xonly_pub(ctx, &xpub, nullptr, &keypair)
           != 1) {
            return std::nullopt;
        }

        pubkey_t pubkey{};
        if(::secp256k1_xonly_pubkey_serialize(ctx, pubkey.data(), &xpub)
           != 1) {
            return std::nullopt;
        }
        return pubkey;
    }

    auto sign_hash(const hash_t& msg,
                   const privkey_t& privkey,
                   secp256k1_context* ctx) -> std::optional<signature_t> {
        secp256k1_keypair keypair{};
        if(::secp256k1_keypair_create(ctx, &keypair, privkey.data()) != 1) {
            return std::nullopt;
        }

        auto sig = signature_t();
        if(::secp256k1_schnorrsig_sign32(ctx,
                                         sig.data(),
                                         msg.data(),
                                         &keypair,
                                         nullptr)
           != 1) {
            return std::nullopt;
        }
        return sig;
    }

    auto verify_hash(const hash_t& msg,
                     const signature_t& sig,
                     const pubkey_t& pubkey,
                     secp256k1_context* ctx) -> bool {
        secp256k1_xonly_pubkey xpub{};
        if(::secp256k1_xonly_pubkey_parse(ctx, &xpub, pubkey.data()) != 1) {
            return false;
        }

        return ::secp256k1_schnorrsig_verify(ctx,
                                             sig.data(),
                                             msg.data(),
                                             msg.size(),
                                             &xpub)
            == 1;
    }
}
