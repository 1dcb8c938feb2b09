// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "proposer.hpp"

#include "util/common/variant_overloaded.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/util.hpp"

namespace dagpool::primary {
    proposer::proposer(const pubkey_t& name,
                       std::shared_ptr<const signature_service> signer,
                       size_t header_size,
                       std::chrono::milliseconds max_header_delay,
                       parents_t parents,
                       header_sink_t sink,
                       std::shared_ptr<logging::log> log)
        : m_name(name),
          m_signer(std::move(signer)),
          m_header_size(header_size),
          m_max_header_delay(max_header_delay),
          m_sink(std::move(sink)),
          m_log(std::move(log)),
          m_parents(std::move(parents)),
          m_deadline(std::chrono::steady_clock::now() + max_header_delay) {}

    proposer::~proposer() {
        stop();
    }

    void proposer::start() {
        m_running = true;
        m_thread = std::thread([&]() {
            while(run_once()) {}
        });
    }

    void proposer::stop() {
        m_running = false;
        m_events.clear();
        if(m_thread.joinable()) {
            m_thread.join();
        }
    }

    void proposer::add_digests(batch_digests digests) {
        m_events.push(std::move(digests));
    }

    void proposer::advance_round(parents_t parents, round_t round) {
        m_events.push(parents_update{std::move(parents), round});
    }

    auto proposer::run_once() -> bool {
        auto event = event_t();
        auto got_event = false;
        if(std::chrono::steady_clock::now() < m_deadline) {
            got_event = m_events.pop_until(event, m_deadline);
        } else if(m_payload_size == 0) {
            // The timer already fired with nothing to propose. Wait for the
            // next digest.
            got_event = m_events.pop(event);
        }

        if(!m_running) {
            return false;
        }

        if(got_event) {
            handle(std::move(event));
        }

        propose_if_ready();
        return true;
    }

    auto proposer::round() const -> round_t {
        return m_round;
    }

    void proposer::handle(event_t event) {
        std::visit(overloaded{[&](batch_digests& digests) {
                                  for(auto& d : digests) {
                                      m_payload_size += serialized_size(d);
                                      m_digests.push_back(std::move(d));
                                  }
                              },
                              [&](parents_update& update) {
                                  if(update.m_round < m_round) {
                                      return;
                                  }
                                  m_round = update.m_round + 1;
                                  m_parents = std::move(update.m_parents);
                                  m_log->debug("Dag moved to round",
                                               m_round);
                              }},
                   event);
    }

    void proposer::propose_if_ready() {
        const auto enough_digests = m_payload_size >= m_header_size;
        const auto timer_expired
            = std::chrono::steady_clock::now() >= m_deadline;
        if((timer_expired && m_payload_size > 0) || enough_digests) {
            make_header();
            m_payload_size = 0;
            m_deadline = std::chrono::steady_clock::now() + m_max_header_delay;
        }
    }

    void proposer::make_header() {
        auto payload = payload_t();
        for(auto& [digest, worker_id] : m_digests) {
            payload.emplace(digest, worker_id);
        }
        m_digests.clear();

        auto h = header::make(m_name,
                              m_round,
                              std::move(payload),
                              m_parents,
                              *m_signer);
        m_log->debug("Created header",
                     dagpool::to_string(h.m_id),
                     "for round",
                     h.m_round,
                     "with",
                     h.m_payload.size(),
                     "batches");

        if(!m_sink(std::move(h))) {
            m_log->fatal("Failed to send header to the core");
        }
    }
}
