// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "synchronizer.hpp"

namespace dagpool::primary {
    synchronizer::synchronizer(const pubkey_t& name,
                               std::shared_ptr<store> st,
                               waiter_t waiter,
                               std::shared_ptr<logging::log> log)
        : m_name(name),
          m_store(std::move(st)),
          m_waiter(std::move(waiter)),
          m_log(std::move(log)) {}

    auto synchronizer::missing_payload(const header& h)
        -> std::variant<bool, error> {
        // We don't store markers for the batches of our own workers.
        if(h.m_author == m_name) {
            return false;
        }

        auto missing = payload_t();
        for(const auto& [digest, worker_id] : h.m_payload) {
            auto res = m_store->read(payload_key(digest, worker_id));
            if(std::holds_alternative<error>(res)) {
                return std::get<error>(res);
            }
            if(!std::get<std::optional<buffer>>(res).has_value()) {
                missing.emplace(digest, worker_id);
            }
        }

        if(missing.empty()) {
            return false;
        }

        m_log->debug("Header",
                     dagpool::to_string(h.m_id),
                     "is missing",
                     missing.size(),
                     "batches");
        if(!m_waiter(sync_batches_request{std::move(missing), h})) {
            m_log->fatal("Failed to send sync batch request");
        }
        return true;
    }
}
