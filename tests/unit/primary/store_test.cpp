// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primary/format.hpp"
#include "primary/store.hpp"
#include "util.hpp"
#include "util/serialization/util.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace dagpool::primary;

class store_test : public ::testing::Test {
  protected:
    void SetUp() override {
        std::filesystem::remove_all(m_db_dir);
        m_value = dagpool::buffer::from_hex("deadbeef").value();
    }

    void TearDown() override {
        std::filesystem::remove_all(m_db_dir);
    }

    static void check_store(store& st, const dagpool::buffer& value) {
        auto key = payload_key(dagpool::test::test_digest(4), 2);

        auto res = st.read(key);
        ASSERT_TRUE(std::holds_alternative<std::optional<dagpool::buffer>>(
            res));
        ASSERT_FALSE(std::get<std::optional<dagpool::buffer>>(res).has_value());

        ASSERT_FALSE(st.write(key, value).has_value());
        res = st.read(key);
        ASSERT_TRUE(std::holds_alternative<std::optional<dagpool::buffer>>(
            res));
        auto& got = std::get<std::optional<dagpool::buffer>>(res);
        ASSERT_TRUE(got.has_value());
        ASSERT_EQ(got.value(), value);

        // the same digest from another worker is a different batch
        res = st.read(payload_key(dagpool::test::test_digest(4), 3));
        ASSERT_FALSE(std::get<std::optional<dagpool::buffer>>(res).has_value());
    }

    const std::string m_db_dir{"primary_store_test_db"};
    dagpool::buffer m_value;
};

TEST_F(store_test, payload_key_layout) {
    auto key = payload_key(dagpool::test::test_digest(1), 0x01020304);
    ASSERT_EQ(key.size(), 36UL);
    ASSERT_EQ(key.to_hex().substr(64), "04030201");
}

TEST_F(store_test, memory_store) {
    memory_store st;
    check_store(st, m_value);
    ASSERT_EQ(st.size(), 1UL);
}

TEST_F(store_test, leveldb_store) {
    auto res = leveldb_store::open(m_db_dir);
    ASSERT_TRUE(std::holds_alternative<std::unique_ptr<leveldb_store>>(res));
    auto& st = std::get<std::unique_ptr<leveldb_store>>(res);
    check_store(*st, m_value);
}

TEST_F(store_test, leveldb_store_persists) {
    auto authorities = dagpool::test::make_authorities(1);
    auto h = header::make(authorities[0].m_name,
                          3,
                          payload_t(),
                          parents_t(),
                          *authorities[0].m_signer);
    {
        auto res = leveldb_store::open(m_db_dir);
        auto& st = std::get<std::unique_ptr<leveldb_store>>(res);
        ASSERT_FALSE(
            st->write(header_key(h), dagpool::make_buffer(h)).has_value());
    }

    auto res = leveldb_store::open(m_db_dir);
    ASSERT_TRUE(std::holds_alternative<std::unique_ptr<leveldb_store>>(res));
    auto& st = std::get<std::unique_ptr<leveldb_store>>(res);
    auto read = st->read(header_key(h));
    auto& val = std::get<std::optional<dagpool::buffer>>(read);
    ASSERT_TRUE(val.has_value());
    auto decoded = dagpool::from_buffer<header>(val.value());
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded.value(), h);
}

TEST_F(store_test, leveldb_open_failure) {
    std::filesystem::create_directory(m_db_dir);
    auto blocker = m_db_dir + "/blocked";
    {
        auto f = std::ofstream(blocker);
        f << "x";
    }
    auto res = leveldb_store::open(blocker);
    ASSERT_TRUE(std::holds_alternative<std::string>(res));
}
