// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core.hpp"

#include "format.hpp"
#include "util/common/variant_overloaded.hpp"
#include "util/serialization/util.hpp"

namespace dagpool::primary {
    core::core(const pubkey_t& name,
               std::shared_ptr<const committee> c,
               std::shared_ptr<store> st,
               std::shared_ptr<synchronizer> sync,
               std::shared_ptr<const signature_service> signer,
               std::shared_ptr<std::atomic<round_t>> consensus_round,
               round_t gc_depth,
               size_t verifier_threads,
               std::shared_ptr<reliable_sender> network,
               certificate_sink_t sink,
               std::shared_ptr<logging::log> log)
        : m_name(name),
          m_committee(std::move(c)),
          m_store(std::move(st)),
          m_synchronizer(std::move(sync)),
          m_signer(std::move(signer)),
          m_consensus_round(std::move(consensus_round)),
          m_gc_depth(gc_depth),
          m_network(std::move(network)),
          m_sink(std::move(sink)),
          m_log(std::move(log)),
          m_verifier(verifier_threads) {}

    core::~core() {
        stop();
    }

    void core::start() {
        m_running = true;
        m_thread = std::thread([&]() {
            while(m_running) {
                auto event = event_t();
                if(!m_events.pop(event)) {
                    continue;
                }
                [[maybe_unused]] auto err = handle(std::move(event));
            }
        });
    }

    void core::stop() {
        m_running = false;
        m_events.clear();
        if(m_thread.joinable()) {
            m_thread.join();
        }
    }

    void core::post(event_t event) {
        m_events.push(std::move(event));
    }

    auto core::run_once(std::chrono::milliseconds timeout) -> bool {
        auto event = event_t();
        if(!m_events.pop_until(event,
                               std::chrono::steady_clock::now() + timeout)) {
            return false;
        }
        [[maybe_unused]] auto err = handle(std::move(event));
        return true;
    }

    auto core::handle(event_t event) -> std::optional<error> {
        auto err = std::visit(
            overloaded{[&](primary_message& msg) -> std::optional<error> {
                           return handle_message(msg);
                       },
                       [&](loopback_header& e) -> std::optional<error> {
                           return process_header(e.m_header);
                       },
                       [&](loopback_certificate& e) -> std::optional<error> {
                           return process_certificate(e.m_certificate);
                       },
                       [&](own_header& e) -> std::optional<error> {
                           return process_own_header(e.m_header);
                       },
                       [&](verified_certificate& e) -> std::optional<error> {
                           return process_certificate(e.m_certificate);
                       }},
            event);
        if(err.has_value()) {
            report(err.value());
        }

        while(!m_local.empty()) {
            auto work = std::move(m_local.front());
            m_local.pop_front();
            auto local_err = std::visit(
                overloaded{[&](vote& v) -> std::optional<error> {
                               return process_vote(v);
                           },
                           [&](certificate& c) -> std::optional<error> {
                               return process_certificate(c);
                           }},
                work);
            if(local_err.has_value()) {
                report(local_err.value());
                if(!err.has_value()) {
                    err = std::move(local_err);
                }
            }
        }

        collect_garbage();
        return err;
    }

    auto core::gc_round() const -> round_t {
        return m_gc_round;
    }

    auto core::in_flight() const -> size_t {
        return m_processing.size();
    }

    auto core::pending_deliveries() const -> size_t {
        size_t ret{0};
        for(const auto& [round, handlers] : m_cancel_handlers) {
            ret += handlers.size();
        }
        return ret;
    }

    auto core::voted_rounds() const -> size_t {
        return m_last_voted.size();
    }

    auto core::handle_message(primary_message& msg) -> std::optional<error> {
        return std::visit(
            overloaded{[&](header& h) -> std::optional<error> {
                           if(auto err = sanitize_header(h)) {
                               return err;
                           }
                           return process_header(h);
                       },
                       [&](vote& v) -> std::optional<error> {
                           if(auto err = sanitize_vote(v)) {
                               return err;
                           }
                           return process_vote(v);
                       },
                       [&](certificate& c) -> std::optional<error> {
                           return sanitize_certificate(c);
                       }},
            msg);
    }

    auto core::process_own_header(const header& h) -> std::optional<error> {
        m_processing.emplace(h.m_id, pending_header{h, votes_aggregator()});

        auto handlers
            = m_network->broadcast(m_committee->others(m_name), encode(h));
        auto& round_handlers = m_cancel_handlers[h.m_round];
        round_handlers.insert(round_handlers.end(),
                              std::make_move_iterator(handlers.begin()),
                              std::make_move_iterator(handlers.end()));

        return process_header(h);
    }

    auto core::process_header(const header& h) -> std::optional<error> {
        m_log->trace("Processing header", dagpool::to_string(h.m_id));

        // Suspend processing until the waiter has fetched the missing
        // batches and loops the header back.
        auto missing = m_synchronizer->missing_payload(h);
        if(std::holds_alternative<error>(missing)) {
            return std::get<error>(missing);
        }
        if(std::get<bool>(missing)) {
            m_log->debug("Processing of header",
                         dagpool::to_string(h.m_id),
                         "suspended: missing payload");
            return std::nullopt;
        }

        if(auto err = m_store->write(header_key(h), make_buffer(h))) {
            return err;
        }

        // Redelivery of a header we already voted for.
        if(!m_last_voted[h.m_round].insert(h.m_id).second) {
            m_log->debug("Already voted for header",
                         dagpool::to_string(h.m_id));
            return std::nullopt;
        }

        auto v = vote::make(h, m_name, *m_signer);
        if(v.m_origin == m_name) {
            m_local.emplace_back(std::move(v));
        } else {
            auto handler = m_network->send(h.m_author, encode(v));
            m_cancel_handlers[h.m_round].push_back(std::move(handler));
        }

        return std::nullopt;
    }

    auto core::process_vote(const vote& v) -> std::optional<error> {
        auto it = m_processing.find(v.m_id);
        if(it == m_processing.end()) {
            return std::nullopt;
        }

        auto res = it->second.m_aggregator.append(v,
                                                  *m_committee,
                                                  it->second.m_header);
        if(std::holds_alternative<error>(res)) {
            return std::get<error>(res);
        }

        auto& cert = std::get<std::optional<certificate>>(res);
        if(!cert.has_value()) {
            return std::nullopt;
        }

        m_log->debug("Assembled certificate for header",
                     dagpool::to_string(cert->m_id),
                     "with",
                     cert->m_votes.signer_count(),
                     "votes");

        auto handlers = m_network->broadcast(m_committee->others(m_name),
                                             encode(cert.value()));
        auto& round_handlers = m_cancel_handlers[cert->m_round];
        round_handlers.insert(round_handlers.end(),
                              std::make_move_iterator(handlers.begin()),
                              std::make_move_iterator(handlers.end()));

        m_processing.erase(it);
        m_local.emplace_back(std::move(cert.value()));
        return std::nullopt;
    }

    auto core::process_certificate(const certificate& c)
        -> std::optional<error> {
        if(auto err = m_store->write(certificate_key(c), make_buffer(c))) {
            return err;
        }

        m_log->trace("Sending certificate for header",
                     dagpool::to_string(c.m_id),
                     "to consensus");
        if(!m_sink(c)) {
            m_log->warn("Failed to deliver certificate",
                        dagpool::to_string(c.m_id),
                        "to the consensus");
        }
        return std::nullopt;
    }

    auto core::sanitize_header(const header& h) -> std::optional<error> {
        if(h.m_round < m_gc_round) {
            return header_too_old{h.m_id, h.m_round};
        }

        // TODO: reject headers from rounds far beyond the DAG's current
        // round so peers cannot grow m_last_voted without bound.
        return h.verify(*m_committee);
    }

    auto core::sanitize_vote(const vote& v) -> std::optional<error> {
        if(v.m_round < m_gc_round) {
            return vote_too_old{v.m_id, v.m_round};
        }

        auto it = m_processing.find(v.m_id);
        if(it == m_processing.end()) {
            return std::nullopt;
        }

        const auto& h = it->second.m_header;
        if(v.m_id != h.m_id || v.m_origin != h.m_author
           || v.m_round != h.m_round) {
            return unexpected_vote{v.m_id};
        }

        return std::nullopt;
    }

    auto core::sanitize_certificate(const certificate& c)
        -> std::optional<error> {
        if(c.m_round < m_gc_round) {
            return certificate_too_old{c.digest(), c.m_round};
        }

        // Every primary creates the genesis certificates itself.
        if(c.m_round == 0) {
            return invalid_certificate{c.digest()};
        }

        m_verifier.push([this, committee = m_committee, c]() {
            if(auto err = c.verify(*committee)) {
                m_log->warn("Dropping certificate",
                            dagpool::to_string(c.digest()),
                            "which failed verification:",
                            to_string(err.value()));
                return;
            }
            m_events.push(verified_certificate{c});
        });

        return std::nullopt;
    }

    void core::report(const error& err) {
        std::visit(overloaded{[&](const store_error&) {
                                  m_log->fatal(to_string(err));
                              },
                              [&](const header_too_old&) {
                                  m_log->debug(to_string(err));
                              },
                              [&](const vote_too_old&) {
                                  m_log->debug(to_string(err));
                              },
                              [&](const certificate_too_old&) {
                                  m_log->debug(to_string(err));
                              },
                              [&](const invalid_signature&) {
                                  m_log->trace(to_string(err));
                              },
                              [&](const auto&) {
                                  m_log->warn(to_string(err));
                              }},
                   err);
    }

    void core::collect_garbage() {
        const auto round = m_consensus_round->load();
        if(round <= m_gc_depth) {
            return;
        }

        const auto gc_round = round - m_gc_depth;
        m_last_voted.erase(m_last_voted.begin(),
                           m_last_voted.lower_bound(gc_round));
        m_cancel_handlers.erase(m_cancel_handlers.begin(),
                                m_cancel_handlers.lower_bound(gc_round));
        for(auto it = m_processing.begin(); it != m_processing.end();) {
            if(it->second.m_header.m_round < gc_round) {
                it = m_processing.erase(it);
            } else {
                it++;
            }
        }
        m_gc_round = gc_round;
    }

    auto core::encode(const primary_message& msg) -> packet_t {
        return make_shared_buffer(msg);
    }
}
