// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "messages.hpp"

#include "committee.hpp"
#include "signature_service.hpp"
#include "util/serialization/buffer_serializer.hpp"
#include "util/serialization/format.hpp"

namespace dagpool::primary {
    namespace {
        constexpr auto header_tag = "dagpool/header";
        constexpr auto vote_tag = "dagpool/vote";
        constexpr auto certificate_tag = "dagpool/certificate";

        auto header_contents(const header& h) -> buffer {
            auto buf = buffer();
            auto ser = buffer_serializer(buf);
            ser << h.m_author << h.m_round << h.m_payload << h.m_parents;
            return buf;
        }

        auto reference_digest(const std::string& tag,
                              const hash_t& id,
                              round_t round,
                              const pubkey_t& origin) -> hash_t {
            auto buf = buffer();
            auto ser = buffer_serializer(buf);
            ser << id << round << origin;
            return tagged_hash(tag, buf);
        }
    }

    auto header::make(const pubkey_t& author,
                      round_t round,
                      payload_t payload,
                      parents_t parents,
                      const signature_service& signer) -> header {
        auto ret = header();
        ret.m_author = author;
        ret.m_round = round;
        ret.m_payload = std::move(payload);
        ret.m_parents = std::move(parents);
        ret.m_id = ret.digest();
        ret.m_signature = signer.sign(ret.m_id);
        return ret;
    }

    auto header::digest() const -> hash_t {
        return tagged_hash(header_tag, header_contents(*this));
    }

    auto header::verify(const committee& c) const -> std::optional<error> {
        if(!c.contains(m_author)) {
            return unknown_authority{m_author};
        }

        if(digest() != m_id) {
            return invalid_header_id{m_id};
        }

        if(!verify_hash(m_id, m_signature, m_author, secp_context())) {
            return invalid_signature{m_id};
        }

        return std::nullopt;
    }

    auto header::operator==(const header& rhs) const -> bool {
        return m_id == rhs.m_id && m_author == rhs.m_author
            && m_round == rhs.m_round && m_payload == rhs.m_payload
            && m_parents == rhs.m_parents && m_signature == rhs.m_signature;
    }

    auto header::operator!=(const header& rhs) const -> bool {
        return !(*this == rhs);
    }

    auto vote_digest(const hash_t& id, round_t round, const pubkey_t& origin)
        -> hash_t {
        return reference_digest(vote_tag, id, round, origin);
    }

    auto vote::make(const header& h,
                    const pubkey_t& author,
                    const signature_service& signer) -> vote {
        auto ret = vote();
        ret.m_id = h.m_id;
        ret.m_round = h.m_round;
        ret.m_origin = h.m_author;
        ret.m_author = author;
        ret.m_signature = signer.sign(ret.digest());
        return ret;
    }

    auto vote::digest() const -> hash_t {
        return vote_digest(m_id, m_round, m_origin);
    }

    auto vote::verify(const committee& c) const -> std::optional<error> {
        if(!c.contains(m_author)) {
            return unknown_authority{m_author};
        }

        auto msg = digest();
        if(!verify_hash(msg, m_signature, m_author, secp_context())) {
            return invalid_signature{msg};
        }

        return std::nullopt;
    }

    auto vote::operator==(const vote& rhs) const -> bool {
        return m_id == rhs.m_id && m_round == rhs.m_round
            && m_origin == rhs.m_origin && m_author == rhs.m_author
            && m_signature == rhs.m_signature;
    }

    void aggregate_signature::add(size_t index, const signature_t& share) {
        if(m_signers.test(index)) {
            return;
        }

        size_t pos{0};
        for(size_t i{0}; i < index; i++) {
            if(m_signers.test(i)) {
                pos++;
            }
        }

        m_shares.insert(
            m_shares.begin() + static_cast<std::ptrdiff_t>(pos),
            share);
        m_signers.set(index);
    }

    auto aggregate_signature::signer_count() const -> size_t {
        return m_signers.count();
    }

    auto aggregate_signature::operator==(const aggregate_signature& rhs) const
        -> bool {
        return m_signers == rhs.m_signers && m_shares == rhs.m_shares;
    }

    auto certificate::digest() const -> hash_t {
        return reference_digest(certificate_tag, m_id, m_round, m_origin);
    }

    auto certificate::verify(const committee& c) const
        -> std::optional<error> {
        if(!c.contains(m_origin)) {
            return unknown_authority{m_origin};
        }

        if(m_round == 0) {
            // Genesis certificates carry no votes.
            if(m_votes.m_signers.none() && m_votes.m_shares.empty()
               && m_id == hash_t{}) {
                return std::nullopt;
            }
            return invalid_certificate{digest()};
        }

        if(m_votes.m_shares.size() != m_votes.signer_count()) {
            return invalid_certificate{digest()};
        }

        auto msg = vote_digest(m_id, m_round, m_origin);
        stake_t weight{0};
        size_t share{0};
        for(size_t i{0}; i < m_votes.m_signers.size(); i++) {
            if(!m_votes.m_signers.test(i)) {
                continue;
            }
            if(i >= c.size()) {
                return invalid_certificate{digest()};
            }
            const auto& signer = c.key_at(i);
            if(!verify_hash(msg,
                            m_votes.m_shares[share],
                            signer,
                            secp_context())) {
                return invalid_signature{msg};
            }
            weight += c.stake(signer);
            share++;
        }

        if(weight < c.validity_threshold()) {
            return invalid_certificate{digest()};
        }

        return std::nullopt;
    }

    auto certificate::genesis(const committee& c) -> std::vector<certificate> {
        auto ret = std::vector<certificate>();
        ret.reserve(c.size());
        for(size_t i{0}; i < c.size(); i++) {
            auto cert = certificate();
            cert.m_origin = c.key_at(i);
            ret.push_back(std::move(cert));
        }
        return ret;
    }

    auto certificate::operator==(const certificate& rhs) const -> bool {
        return m_id == rhs.m_id && m_round == rhs.m_round
            && m_origin == rhs.m_origin && m_votes == rhs.m_votes;
    }

    auto certificate::operator!=(const certificate& rhs) const -> bool {
        return !(*this == rhs);
    }
}
