// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "controller.hpp"

#include "format.hpp"
#include "signature_service.hpp"
#include "util/serialization/util.hpp"

#include <utility>

namespace dagpool::primary {
    controller::controller(size_t authority_id,
                           config::options opts,
                           std::shared_ptr<reliable_sender> network,
                           core::certificate_sink_t consensus,
                           synchronizer::waiter_t header_waiter,
                           std::shared_ptr<logging::log> logger)
        : m_authority_id(authority_id),
          m_opts(std::move(opts)),
          m_network(std::move(network)),
          m_consensus(std::move(consensus)),
          m_header_waiter(std::move(header_waiter)),
          m_logger(std::move(logger)) {}

    controller::~controller() {
        m_proposer.reset();
        m_core.reset();
    }

    auto controller::init() -> bool {
        if(auto err = config::check_options(m_opts)) {
            m_logger->error("Invalid options:", err.value());
            return false;
        }

        auto key_it = m_opts.m_authority_private_keys.find(m_authority_id);
        if(key_it == m_opts.m_authority_private_keys.end()) {
            m_logger->error("No private key configured for authority",
                            m_authority_id);
            return false;
        }

        auto signer = signature_service::create(key_it->second);
        if(!signer.has_value()) {
            m_logger->error("Invalid private key for authority",
                            m_authority_id);
            return false;
        }
        auto shared_signer
            = std::make_shared<const signature_service>(signer.value());
        m_name = shared_signer->public_key();

        m_committee = committee::from_options(m_opts);
        if(!m_committee->contains(m_name)) {
            m_logger->error("Authority",
                            m_authority_id,
                            "is not in the committee");
            return false;
        }

        if(m_opts.m_primary_db.has_value()) {
            auto res = leveldb_store::open(m_opts.m_primary_db.value());
            if(std::holds_alternative<std::string>(res)) {
                m_logger->error("Failed to open primary DB:",
                                std::get<std::string>(res));
                return false;
            }
            m_store
                = std::move(std::get<std::unique_ptr<leveldb_store>>(res));
        } else {
            m_logger->warn("No primary DB configured, keeping state in "
                           "memory");
            m_store = std::make_shared<memory_store>();
        }

        m_synchronizer = std::make_shared<synchronizer>(m_name,
                                                        m_store,
                                                        m_header_waiter,
                                                        m_logger);

        m_core = std::make_unique<core>(m_name,
                                        m_committee,
                                        m_store,
                                        m_synchronizer,
                                        shared_signer,
                                        m_consensus_round,
                                        m_opts.m_gc_depth,
                                        m_opts.m_verifier_threads,
                                        m_network,
                                        m_consensus,
                                        m_logger);

        auto parents = parents_t();
        for(const auto& cert : certificate::genesis(*m_committee)) {
            parents.insert(cert.digest());
        }

        m_proposer = std::make_unique<proposer>(
            m_name,
            shared_signer,
            m_opts.m_header_size,
            m_opts.m_max_header_delay,
            std::move(parents),
            [&](header h) {
                m_core->post(core::own_header{std::move(h)});
                return true;
            },
            m_logger);

        m_core->start();
        m_proposer->start();

        m_logger->info("Primary",
                       dagpool::to_string(m_name),
                       "started with",
                       m_committee->size(),
                       "authorities");
        return true;
    }

    auto controller::deliver(buffer pkt) -> bool {
        auto msg = from_buffer<primary_message>(pkt);
        if(!msg.has_value()) {
            m_logger->warn("Dropping undecodable primary message");
            return false;
        }
        m_core->post(std::move(msg.value()));
        return true;
    }

    void controller::our_batch(const hash_t& digest, worker_id_t worker_id) {
        m_proposer->add_digests(
            proposer::batch_digests{std::make_pair(digest, worker_id)});
    }

    void controller::others_batch(const hash_t& digest,
                                  worker_id_t worker_id) {
        auto err = m_store->write(payload_key(digest, worker_id), buffer());
        if(err.has_value()) {
            m_logger->fatal(to_string(err.value()));
        }
    }

    void controller::header_ready(header h) {
        m_core->post(core::loopback_header{std::move(h)});
    }

    void controller::certificate_ready(certificate c) {
        m_core->post(core::loopback_certificate{std::move(c)});
    }

    void controller::advance_round(parents_t parents, round_t round) {
        m_proposer->advance_round(std::move(parents), round);
    }

    void controller::set_consensus_round(round_t round) {
        m_consensus_round->store(round);
    }

    auto controller::name() const -> const pubkey_t& {
        return m_name;
    }
}
