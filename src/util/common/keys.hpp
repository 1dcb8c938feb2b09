// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_COMMON_KEYS_H_
#define DAGPOOL_SRC_COMMON_KEYS_H_

#include "hash.hpp"

#include <array>
#include <optional>

struct secp256k1_context_struct;
using secp256k1_context = struct secp256k1_context_struct;

namespace dagpool {
    /// Size of public keys used throughout the system, in bytes.
    static constexpr size_t pubkey_len = 32;
    /// Size of signatures used throughout the system, in bytes.
    static constexpr size_t sig_len = 64;

    /// A private key of a public/private keypair.
    using privkey_t = std::array<unsigned char, pubkey_len>;
    /// An x-only public key. Identifies an authority.
    using pubkey_t = std::array<unsigned char, pubkey_len>;
    /// A Schnorr signature.
    using signature_t = std::array<unsigned char, sig_len>;

    /// Returns the process-wide secp256k1 context. The context is never
    /// randomized after creation so it is safe to share between threads.
    auto secp_context() -> secp256k1_context*;

    /// Generates a public key from the specified private key.
    /// \param privkey private key for which to generate the public key.
    /// \param ctx the secp context to use.
    /// \return the public key, or std::nullopt if the private key is not a
    ///         valid secp256k1 scalar.
    auto pubkey_from_privkey(const privkey_t& privkey, secp256k1_context* ctx)
        -> std::optional<pubkey_t>;

    /// Produces a Schnorr signature over a 32-byte digest.
    /// \param msg digest to sign.
    /// \param privkey signing key.
    /// \param ctx the secp context to use.
    /// \return the signature, or std::nullopt if the key is invalid.
    auto sign_hash(const hash_t& msg,
                   const privkey_t& privkey,
                   secp256k1_context* ctx) -> std::optional<signature_t>;

    /// Checks a Schnorr signature over a 32-byte digest.
    /// \param msg signed digest.
    /// \param sig signature to check.
    /// \param pubkey public key of the signer.
    /// \param ctx the secp context to use.
    /// \return true if the signature is valid.
    auto verify_hash(const hash_t& msg,
                     const signature_t& sig,
                     const pubkey_t& pubkey,
                     secp256k1_context* ctx) -> bool;
}

#endif // DAGPOOL_SRC_COMMON_KEYS_H_
