// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_SIGNATURE_SERVICE_H_
#define DAGPOOL_SRC_PRIMARY_SIGNATURE_SERVICE_H_

#include "util/common/keys.hpp"

#include <optional>

namespace dagpool::primary {
    /// Holds the private key of the local authority and signs digests with
    /// it. Safe to share between the core and proposer threads.
    class signature_service {
      public:
        /// Creates a signature service for the given key.
        /// \param privkey private key of the local authority.
        /// \return the service, or std::nullopt if the key is not a valid
        ///         secp256k1 scalar.
        static auto create(const privkey_t& privkey)
            -> std::optional<signature_service>;

        /// Returns the public key matching the private key.
        [[nodiscard]] auto public_key() const -> const pubkey_t&;

        /// Produces a Schnorr signature over a digest.
        /// \param digest 32-byte digest to sign.
        /// \return signature by the local authority.
        [[nodiscard]] auto sign(const hash_t& digest) const -> signature_t;

      private:
        signature_service(const privkey_t& privkey, const pubkey_t& pubkey);

        privkey_t m_privkey{};
        pubkey_t m_pubkey{};
    };
}

#endif // DAGPOOL_SRC_PRIMARY_SIGNATURE_SERVICE_H_
