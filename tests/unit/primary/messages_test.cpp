// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primary/format.hpp"
#include "primary/messages.hpp"
#include "util.hpp"
#include "util/serialization/util.hpp"

#include <cstring>
#include <gtest/gtest.h>

using namespace dagpool::primary;

class messages_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_authorities = dagpool::test::make_authorities(4);
        m_committee = dagpool::test::make_committee(m_authorities);

        auto payload = payload_t{{dagpool::test::test_digest(1), 0},
                                 {dagpool::test::test_digest(2), 3}};
        auto parents = parents_t();
        for(const auto& g : certificate::genesis(*m_committee)) {
            parents.insert(g.digest());
        }
        m_header = header::make(m_authorities[0].m_name,
                                1,
                                payload,
                                parents,
                                *m_authorities[0].m_signer);
    }

    // Certificate over m_header signed by the given authority indexes.
    auto make_certificate(const std::vector<size_t>& signers)
        -> certificate {
        auto cert = certificate();
        cert.m_id = m_header.m_id;
        cert.m_round = m_header.m_round;
        cert.m_origin = m_header.m_author;
        for(auto i : signers) {
            auto v = vote::make(m_header,
                                m_authorities[i].m_name,
                                *m_authorities[i].m_signer);
            cert.m_votes.add(i, v.m_signature);
        }
        return cert;
    }

    std::vector<dagpool::test::test_authority> m_authorities;
    std::shared_ptr<const committee> m_committee;
    header m_header;
};

TEST_F(messages_test, header_verifies) {
    ASSERT_EQ(m_header.m_id, m_header.digest());
    ASSERT_FALSE(m_header.verify(*m_committee).has_value());
}

TEST_F(messages_test, header_digest_covers_contents) {
    auto h = m_header;
    h.m_round = 2;
    ASSERT_NE(h.digest(), m_header.m_id);

    auto err = h.verify(*m_committee);
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(std::holds_alternative<invalid_header_id>(err.value()));

    h = m_header;
    h.m_payload.emplace(dagpool::test::test_digest(9), 1);
    ASSERT_NE(h.digest(), m_header.m_id);
}

TEST_F(messages_test, header_bad_signature) {
    auto h = header::make(m_authorities[0].m_name,
                          1,
                          m_header.m_payload,
                          m_header.m_parents,
                          *m_authorities[1].m_signer);
    auto err = h.verify(*m_committee);
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(std::holds_alternative<invalid_signature>(err.value()));
}

TEST_F(messages_test, header_unknown_author) {
    auto outsider = dagpool::test::make_authorities(6);
    auto small = dagpool::test::make_committee(
        std::vector<dagpool::test::test_authority>(outsider.begin(),
                                                   outsider.begin() + 1));
    auto author = outsider[1];
    auto h = header::make(author.m_name,
                          1,
                          payload_t(),
                          parents_t(),
                          *author.m_signer);
    auto err = h.verify(*small);
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(std::holds_alternative<unknown_authority>(err.value()));
}

TEST_F(messages_test, vote_verifies) {
    auto v = vote::make(m_header,
                        m_authorities[2].m_name,
                        *m_authorities[2].m_signer);
    ASSERT_EQ(v.m_id, m_header.m_id);
    ASSERT_EQ(v.m_round, m_header.m_round);
    ASSERT_EQ(v.m_origin, m_header.m_author);
    ASSERT_EQ(v.digest(),
              vote_digest(m_header.m_id, m_header.m_round, m_header.m_author));
    ASSERT_FALSE(v.verify(*m_committee).has_value());

    // a vote claiming another author
    v.m_author = m_authorities[3].m_name;
    auto err = v.verify(*m_committee);
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(std::holds_alternative<invalid_signature>(err.value()));
}

TEST_F(messages_test, aggregate_is_order_independent) {
    auto a = make_certificate({0, 2, 3});
    auto b = make_certificate({3, 0, 2});
    ASSERT_EQ(a.m_votes, b.m_votes);
    ASSERT_EQ(a.m_votes.signer_count(), 3UL);
    ASSERT_EQ(a.m_votes.m_shares.size(), 3UL);

    // duplicates are ignored
    auto share = a.m_votes.m_shares[0];
    a.m_votes.add(0, share);
    ASSERT_EQ(a.m_votes, b.m_votes);
}

TEST_F(messages_test, certificate_verifies) {
    auto cert = make_certificate({0, 1, 3});
    ASSERT_FALSE(cert.verify(*m_committee).has_value());
    ASSERT_NE(cert.digest(), cert.m_id);
}

TEST_F(messages_test, certificate_below_threshold) {
    auto cert = make_certificate({0, 1});
    auto err = cert.verify(*m_committee);
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(std::holds_alternative<invalid_certificate>(err.value()));
}

TEST_F(messages_test, certificate_bad_share) {
    auto cert = make_certificate({0, 1, 2});
    std::swap(cert.m_votes.m_shares[0], cert.m_votes.m_shares[1]);
    auto err = cert.verify(*m_committee);
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(std::holds_alternative<invalid_signature>(err.value()));
}

TEST_F(messages_test, certificate_malformed_aggregate) {
    auto cert = make_certificate({0, 1, 2});
    cert.m_votes.m_shares.pop_back();
    auto err = cert.verify(*m_committee);
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(std::holds_alternative<invalid_certificate>(err.value()));

    cert = make_certificate({0, 1, 2});
    cert.m_votes.m_signers.reset(2);
    cert.m_votes.m_signers.set(9);
    err = cert.verify(*m_committee);
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(std::holds_alternative<invalid_certificate>(err.value()));
}

TEST_F(messages_test, genesis) {
    auto genesis = certificate::genesis(*m_committee);
    ASSERT_EQ(genesis.size(), m_committee->size());
    auto digests = parents_t();
    for(const auto& g : genesis) {
        ASSERT_EQ(g.m_round, 0UL);
        ASSERT_FALSE(g.verify(*m_committee).has_value());
        digests.insert(g.digest());
    }
    ASSERT_EQ(digests.size(), genesis.size());
    ASSERT_EQ(digests, m_header.m_parents);

    // round zero certificates with votes are not genesis
    auto forged = genesis[0];
    forged.m_id = m_header.m_id;
    ASSERT_TRUE(forged.verify(*m_committee).has_value());
}

TEST_F(messages_test, wire_format) {
    auto cert = make_certificate({1, 2, 3});
    auto v = vote::make(m_header,
                        m_authorities[1].m_name,
                        *m_authorities[1].m_signer);
    for(const auto& msg : std::vector<primary_message>{m_header, v, cert}) {
        auto buf = dagpool::make_buffer(msg);
        auto decoded = dagpool::from_buffer<primary_message>(buf);
        ASSERT_TRUE(decoded.has_value());
        ASSERT_EQ(decoded.value(), msg);
    }

    // aggregate: 16 bitmap bytes, length prefix, shares
    ASSERT_EQ(dagpool::serialized_size(cert.m_votes),
              16 + sizeof(uint64_t) + 3 * sizeof(dagpool::signature_t));
}

TEST_F(messages_test, wire_format_rejects_garbage) {
    auto cert = make_certificate({1, 2, 3});
    auto buf = dagpool::make_buffer(primary_message(cert));

    // drop one share from the length prefix
    auto bad = buf;
    auto prefix_offset = 1 + 32 + sizeof(uint64_t) + 32 + 16;
    uint64_t two{2};
    std::memcpy(bad.data_at(prefix_offset), &two, sizeof(two));
    ASSERT_FALSE(dagpool::from_buffer<primary_message>(bad).has_value());

    auto truncated = dagpool::buffer();
    truncated.append(buf.data(), buf.size() - 1);
    ASSERT_FALSE(
        dagpool::from_buffer<primary_message>(truncated).has_value());

    auto unknown = dagpool::buffer::from_hex("05").value();
    ASSERT_FALSE(dagpool::from_buffer<primary_message>(unknown).has_value());
}
