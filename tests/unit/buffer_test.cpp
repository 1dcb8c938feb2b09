// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/buffer.hpp"
#include "util/common/hash.hpp"

#include <gtest/gtest.h>

TEST(buffer_test, key_hex_round_trip) {
    auto key = dagpool::hash_t{0xde, 0xad, 0xbe, 0xef};
    key.back() = 0x7f;

    auto buf = dagpool::buffer();
    buf.append(key.data(), key.size());
    auto hex = buf.to_hex();
    ASSERT_EQ(hex, dagpool::to_string(key));
    ASSERT_EQ(hex.substr(0, 8), "deadbeef");

    auto parsed = dagpool::buffer::from_hex(hex);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed.value(), buf);
    ASSERT_EQ(parsed->size(), key.size());
}

TEST(buffer_test, from_hex_rejects_malformed_input) {
    ASSERT_FALSE(dagpool::buffer::from_hex("ZZ11ff").has_value());
    ASSERT_FALSE(dagpool::buffer::from_hex("11ffa").has_value());
    ASSERT_FALSE(dagpool::buffer::from_hex("").has_value());
}

TEST(buffer_test, append_and_compare) {
    auto a = dagpool::buffer();
    auto b = dagpool::buffer();
    ASSERT_EQ(a, b);

    uint16_t val{0xbeef};
    a.append(&val, sizeof(val));
    ASSERT_EQ(a.size(), sizeof(val));
    ASSERT_NE(a, b);
    ASSERT_EQ(a.to_hex(), "efbe");

    a.clear();
    ASSERT_EQ(a.size(), 0);
    ASSERT_EQ(a, b);
}
