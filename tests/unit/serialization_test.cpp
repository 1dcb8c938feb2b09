// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/hash.hpp"
#include "util/serialization/buffer_serializer.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/size_serializer.hpp"
#include "util/serialization/util.hpp"

#include <gtest/gtest.h>

class serialization_test : public ::testing::Test {
  protected:
    serialization_test() : m_ser(m_buf), m_deser(m_buf) {}

    dagpool::buffer m_buf;
    dagpool::buffer_serializer m_ser;
    dagpool::buffer_serializer m_deser;
};

TEST_F(serialization_test, payload_entry_layout) {
    auto digest = dagpool::hash_t{9};
    uint32_t worker{0x01020304};
    m_ser << digest << worker;

    ASSERT_EQ(m_buf.size(), 36UL);
    ASSERT_EQ(m_buf.to_hex().substr(64), "04030201");

    auto sz = dagpool::size_serializer();
    sz << digest << worker;
    ASSERT_EQ(sz.size(), m_buf.size());
    ASSERT_EQ(dagpool::serialized_size(std::make_pair(digest, worker)), 36UL);

    auto r_digest = dagpool::hash_t();
    uint32_t r_worker{};
    m_deser >> r_digest >> r_worker;
    ASSERT_TRUE(m_deser);
    ASSERT_TRUE(m_deser.end_of_buffer());
    ASSERT_EQ(r_digest, digest);
    ASSERT_EQ(r_worker, worker);
}

TEST_F(serialization_test, failed_read_sticks_until_reset) {
    m_ser << uint64_t{2};

    uint64_t first{};
    uint64_t second{};
    m_deser >> first >> second;
    ASSERT_FALSE(m_deser);
    ASSERT_EQ(first, 2UL);

    m_deser.reset();
    m_deser.invalidate();
    m_deser >> first;
    ASSERT_FALSE(m_deser);

    m_deser.reset();
    m_deser >> first;
    ASSERT_TRUE(m_deser);
}

TEST_F(serialization_test, size_serializer_invalidate_is_ignored) {
    auto sz = dagpool::size_serializer();
    sz.advance_cursor(10);
    sz.invalidate();
    ASSERT_TRUE(sz);
    ASSERT_FALSE(sz.read(nullptr, 0));
    ASSERT_EQ(sz.size(), 10UL);
}

TEST_F(serialization_test, large_buffer_is_read_in_chunks) {
    auto payload = dagpool::buffer();
    payload.extend(dagpool::config::maximum_reservation + 3);
    m_ser << payload;

    auto r = dagpool::buffer();
    m_deser >> r;
    ASSERT_TRUE(m_deser);
    ASSERT_EQ(r, payload);
}
