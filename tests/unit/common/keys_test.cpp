// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/keys.hpp"

#include <gtest/gtest.h>

class keys_test : public ::testing::Test {
  protected:
    dagpool::privkey_t m_key{1};
    dagpool::hash_t m_msg{7, 7, 7};
};

TEST_F(keys_test, sign_and_verify) {
    auto pub = dagpool::pubkey_from_privkey(m_key, dagpool::secp_context());
    ASSERT_TRUE(pub.has_value());

    auto sig = dagpool::sign_hash(m_msg, m_key, dagpool::secp_context());
    ASSERT_TRUE(sig.has_value());
    EXPECT_TRUE(dagpool::verify_hash(m_msg,
                                     sig.value(),
                                     pub.value(),
                                     dagpool::secp_context()));

    auto other_msg = m_msg;
    other_msg[31] = 1;
    EXPECT_FALSE(dagpool::verify_hash(other_msg,
                                      sig.value(),
                                      pub.value(),
                                      dagpool::secp_context()));
}

TEST_F(keys_test, signatures_are_deterministic) {
    auto sig0 = dagpool::sign_hash(m_msg, m_key, dagpool::secp_context());
    auto sig1 = dagpool::sign_hash(m_msg, m_key, dagpool::secp_context());
    ASSERT_TRUE(sig0.has_value());
    ASSERT_TRUE(sig1.has_value());
    EXPECT_EQ(sig0.value(), sig1.value());
}

TEST_F(keys_test, zero_key_rejected) {
    auto zero = dagpool::privkey_t();
    auto pub = dagpool::pubkey_from_privkey(zero, dagpool::secp_context());
    EXPECT_FALSE(pub.has_value());
    EXPECT_FALSE(
        dagpool::sign_hash(m_msg, zero, dagpool::secp_context()).has_value());
}
