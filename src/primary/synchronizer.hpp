// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_SYNCHRONIZER_H_
#define DAGPOOL_SRC_PRIMARY_SYNCHRONIZER_H_

#include "error.hpp"
#include "messages.hpp"
#include "store.hpp"
#include "util/common/logging.hpp"

#include <functional>
#include <memory>
#include <variant>

namespace dagpool::primary {
    /// Request to fetch the batches of a header that are not in the store.
    /// The waiter loops the header back to the core once they arrive.
    struct sync_batches_request {
        /// Missing batch digests and the worker expected to hold each.
        payload_t m_missing;
        /// Header waiting for the batches.
        header m_header;
    };

    /// Checks whether the batches referenced by a header are available
    /// locally, and asks the header waiter to fetch them if not.
    class synchronizer {
      public:
        /// Delivers a request to the header waiter. Returns false if the
        /// waiter is gone.
        using waiter_t = std::function<bool(sync_batches_request)>;

        /// Constructor.
        /// \param name public key of the local authority.
        /// \param st store holding the batch markers written by our
        ///           workers.
        /// \param waiter channel to the header waiter.
        /// \param log log instance.
        synchronizer(const pubkey_t& name,
                     std::shared_ptr<store> st,
                     waiter_t waiter,
                     std::shared_ptr<logging::log> log);

        /// \brief Checks whether some of a header's batches are missing.
        ///
        /// Headers by the local authority always have their payload. For
        /// other headers, each (digest, worker ID) pair is looked up in the
        /// store. If any are missing they are requested from the waiter in
        /// a single request and processing of the header must be
        /// suspended.
        /// \param h header to check.
        /// \return true if processing must wait for missing batches, or a
        ///         store_error.
        auto missing_payload(const header& h) -> std::variant<bool, error>;

      private:
        pubkey_t m_name;
        std::shared_ptr<store> m_store;
        waiter_t m_waiter;
        std::shared_ptr<logging::log> m_log;
    };
}

#endif // DAGPOOL_SRC_PRIMARY_SYNCHRONIZER_H_
