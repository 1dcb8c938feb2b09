// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"
#include "util/common/config.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include <string>

class config_validation_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_authorities = dagpool::test::make_authorities(4);
        m_opts = dagpool::test::make_options(m_authorities);

        std::stringstream ss;
        ss << "header_size=500\n"
           << "max_header_delay=250\n"
           << "gc_depth=10\n"
           << "primary_loglevel=\"DEBUG\"\n"
           << "primary_db=\"primary_db\"\n"
           << "authority_count=2\n"
           << "authority0_public_key=\""
           << dagpool::to_string(m_authorities[0].m_name) << "\"\n"
           << "authority0_private_key=\""
           << dagpool::to_string(m_authorities[0].m_privkey) << "\"\n"
           << "authority1_public_key=\""
           << dagpool::to_string(m_authorities[1].m_name) << "\"\n"
           << "authority1_stake=3\n"
           << "validity_threshold=3\n"
           << "max_batch_rate=1.50\n";
        m_example_config = ss.str();
    }

    std::vector<dagpool::test::test_authority> m_authorities;
    dagpool::config::options m_opts;
    std::string m_example_config;
};

TEST_F(config_validation_test, valid_config) {
    auto err = dagpool::config::check_options(m_opts);
    ASSERT_FALSE(err.has_value());
}

TEST_F(config_validation_test, authorities_invariant) {
    m_opts.m_authority_public_keys.clear();
    m_opts.m_authority_stakes.clear();
    m_opts.m_authority_private_keys.clear();
    auto err = dagpool::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, stake_invariant) {
    m_opts.m_authority_stakes[2] = 0;
    auto err = dagpool::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());

    m_opts.m_authority_stakes.pop_back();
    err = dagpool::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, total_stake_overflow) {
    m_opts.m_authority_stakes[0] = std::numeric_limits<uint64_t>::max();
    auto err = dagpool::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());

    m_opts.m_authority_stakes = {std::numeric_limits<uint64_t>::max() - 3,
                                 1,
                                 1,
                                 1};
    ASSERT_FALSE(dagpool::config::check_options(m_opts).has_value());
}

TEST_F(config_validation_test, distinct_keys_invariant) {
    m_opts.m_authority_public_keys[1] = m_opts.m_authority_public_keys[0];
    m_opts.m_authority_private_keys.clear();
    auto err = dagpool::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, private_key_invariant) {
    m_opts.m_authority_private_keys[0] = m_authorities[1].m_privkey;
    auto err = dagpool::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());

    m_opts.m_authority_private_keys.clear();
    m_opts.m_authority_private_keys[4] = m_authorities[0].m_privkey;
    err = dagpool::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, threshold_invariant) {
    m_opts.m_validity_threshold = 4;
    ASSERT_FALSE(dagpool::config::check_options(m_opts).has_value());

    m_opts.m_validity_threshold = 5;
    ASSERT_TRUE(dagpool::config::check_options(m_opts).has_value());

    m_opts.m_validity_threshold = 0;
    ASSERT_TRUE(dagpool::config::check_options(m_opts).has_value());
}

TEST_F(config_validation_test, proposer_invariants) {
    m_opts.m_header_size = 0;
    ASSERT_TRUE(dagpool::config::check_options(m_opts).has_value());

    m_opts.m_header_size = 1;
    m_opts.m_max_header_delay = std::chrono::milliseconds(0);
    ASSERT_TRUE(dagpool::config::check_options(m_opts).has_value());

    m_opts.m_max_header_delay = std::chrono::milliseconds(1);
    m_opts.m_verifier_threads = 0;
    ASSERT_TRUE(dagpool::config::check_options(m_opts).has_value());
}

TEST_F(config_validation_test, parsing_validation) {
    std::istringstream cfg(m_example_config);
    dagpool::config::parser ex(cfg);

    auto header_size = ex.get_ulong("header_size");
    EXPECT_TRUE(header_size.has_value());
    EXPECT_EQ(header_size.value(), 500UL);

    auto db = ex.get_string("primary_db");
    EXPECT_TRUE(db.has_value());
    EXPECT_EQ(db.value(), "primary_db");

    auto loglevel = ex.get_loglevel("primary_loglevel");
    EXPECT_TRUE(loglevel.has_value());
    EXPECT_EQ(loglevel.value(), dagpool::logging::log_level::debug);

    auto decimal = ex.get_decimal("max_batch_rate");
    EXPECT_TRUE(decimal.has_value());
    EXPECT_EQ(decimal.value(), 1.5);

    auto nonexistent = ex.get_string("lorem ipsum");
    EXPECT_FALSE(nonexistent.has_value());
}

TEST_F(config_validation_test, read_options) {
    std::istringstream cfg(m_example_config);
    auto res = dagpool::config::read_options(cfg);
    ASSERT_TRUE(std::holds_alternative<dagpool::config::options>(res));
    auto& opts = std::get<dagpool::config::options>(res);

    EXPECT_EQ(opts.m_header_size, 500UL);
    EXPECT_EQ(opts.m_max_header_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(opts.m_gc_depth, 10UL);
    EXPECT_EQ(opts.m_verifier_threads,
              dagpool::config::defaults::verifier_threads);
    EXPECT_EQ(opts.m_primary_loglevel, dagpool::logging::log_level::debug);
    ASSERT_TRUE(opts.m_primary_db.has_value());
    EXPECT_EQ(opts.m_primary_db.value(), "primary_db");

    ASSERT_EQ(opts.m_authority_public_keys.size(), 2UL);
    EXPECT_EQ(opts.m_authority_public_keys[0], m_authorities[0].m_name);
    EXPECT_EQ(opts.m_authority_public_keys[1], m_authorities[1].m_name);
    EXPECT_EQ(opts.m_authority_stakes[0], dagpool::config::defaults::stake);
    EXPECT_EQ(opts.m_authority_stakes[1], 3UL);
    ASSERT_EQ(opts.m_authority_private_keys.size(), 1UL);
    EXPECT_EQ(opts.m_authority_private_keys[0], m_authorities[0].m_privkey);
    ASSERT_TRUE(opts.m_validity_threshold.has_value());
    EXPECT_EQ(opts.m_validity_threshold.value(), 3UL);

    EXPECT_FALSE(dagpool::config::check_options(opts).has_value());
}

TEST_F(config_validation_test, read_options_malformed_key) {
    std::istringstream cfg("authority_count=1\n"
                           "authority0_public_key=\"abcd\"\n");
    auto res = dagpool::config::read_options(cfg);
    ASSERT_TRUE(std::holds_alternative<std::string>(res));
}

TEST_F(config_validation_test, read_options_missing_count) {
    std::istringstream cfg("header_size=5\n");
    auto res = dagpool::config::read_options(cfg);
    ASSERT_TRUE(std::holds_alternative<std::string>(res));
}

TEST_F(config_validation_test, missing_file) {
    auto res = dagpool::config::load_options("no_such_dir/primary.cfg");
    ASSERT_TRUE(std::holds_alternative<std::string>(res));
}
