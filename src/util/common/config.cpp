// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
//               2022 MITRE Corporation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace dagpool::config {
    template<typename T>
    auto parse_key(const std::string& hex) -> std::optional<T> {
        auto buf = buffer::from_hex(hex);
        if(!buf.has_value() || buf->size() != std::tuple_size_v<T>) {
            return std::nullopt;
        }
        auto ret = T();
        std::memcpy(ret.data(), buf->data(), ret.size());
        return ret;
    }

    auto get_authority_key(size_t authority_id, const std::string& postfix)
        -> std::string {
        std::stringstream ss;
        ss << authority_prefix << authority_id << config_separator << postfix;
        return ss.str();
    }

    auto get_primary_key(const std::string& postfix) -> std::string {
        std::stringstream ss;
        ss << primary_prefix << config_separator << postfix;
        return ss.str();
    }

    auto read_authority_options(options& opts, const parser& cfg)
        -> std::optional<std::string> {
        const auto authority_count = cfg.get_ulong(authority_count_key);
        if(!authority_count.has_value()) {
            return "No authority_count specified";
        }

        for(size_t i = 0; i < authority_count.value(); i++) {
            const auto pub_key = get_authority_key(i, public_key_postfix);
            const auto pub_str = cfg.get_string(pub_key);
            if(!pub_str.has_value()) {
                return "No public key specified for authority "
                     + std::to_string(i) + " (" + pub_key + ")";
            }
            const auto pub = parse_key<pubkey_t>(pub_str.value());
            if(!pub.has_value()) {
                return "Malformed public key for authority "
                     + std::to_string(i) + " (" + pub_key + ")";
            }
            opts.m_authority_public_keys.push_back(pub.value());

            const auto stake
                = cfg.get_ulong(get_authority_key(i, stake_postfix))
                      .value_or(defaults::stake);
            opts.m_authority_stakes.push_back(stake);

            const auto priv_key = get_authority_key(i, private_key_postfix);
            const auto priv_str = cfg.get_string(priv_key);
            if(priv_str.has_value()) {
                const auto priv = parse_key<privkey_t>(priv_str.value());
                if(!priv.has_value()) {
                    return "Malformed private key for authority "
                         + std::to_string(i) + " (" + priv_key + ")";
                }
                opts.m_authority_private_keys.emplace(i, priv.value());
            }
        }

        const auto threshold = cfg.get_ulong(validity_threshold_key);
        if(threshold.has_value()) {
            opts.m_validity_threshold = threshold.value();
        }

        return std::nullopt;
    }

    void read_primary_options(options& opts, const parser& cfg) {
        opts.m_header_size
            = cfg.get_ulong(header_size_key).value_or(opts.m_header_size);
        opts.m_max_header_delay = std::chrono::milliseconds(
            cfg.get_ulong(max_header_delay_key)
                .value_or(static_cast<size_t>(
                    opts.m_max_header_delay.count())));
        opts.m_gc_depth = cfg.get_ulong(gc_depth_key).value_or(opts.m_gc_depth);
        opts.m_verifier_threads = cfg.get_ulong(verifier_threads_key)
                                      .value_or(opts.m_verifier_threads);
        opts.m_primary_loglevel
            = cfg.get_loglevel(get_primary_key(loglevel_postfix))
                  .value_or(opts.m_primary_loglevel);
        const auto db = cfg.get_string(get_primary_key(db_postfix));
        if(db.has_value()) {
            opts.m_primary_db = db.value();
        }
    }

    auto read_options(std::istream& config)
        -> std::variant<options, std::string> {
        auto opts = options{};
        auto cfg = parser(config);

        read_primary_options(opts, cfg);

        auto err = read_authority_options(opts, cfg);
        if(err.has_value()) {
            return err.value();
        }

        return opts;
    }

    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        std::ifstream file(config_file);
        if(!file.good()) {
            return "Unable to open config file " + config_file;
        }
        return read_options(file);
    }

    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto opt = read_options(config_file);
        if(std::holds_alternative<options>(opt)) {
            auto res = check_options(std::get<options>(opt));
            if(res) {
                return *res;
            }
        }
        return opt;
    }

    auto check_options(const options& opts) -> std::optional<std::string> {
        if(opts.m_authority_public_keys.empty()) {
            return "At least one authority is required";
        }
        if(opts.m_authority_public_keys.size() > max_authorities) {
            return "At most " + std::to_string(max_authorities)
                 + " authorities are supported";
        }
        if(opts.m_authority_stakes.size()
           != opts.m_authority_public_keys.size()) {
            return "Every authority needs a stake";
        }

        uint64_t total{0};
        for(auto stake : opts.m_authority_stakes) {
            if(stake == 0) {
                return "Authority stakes must be non-zero";
            }
            if(stake > std::numeric_limits<uint64_t>::max() - total) {
                return "Total authority stake overflows";
            }
            total += stake;
        }

        auto keys = std::set<pubkey_t>(opts.m_authority_public_keys.begin(),
                                       opts.m_authority_public_keys.end());
        if(keys.size() != opts.m_authority_public_keys.size()) {
            return "Authority public keys must be distinct";
        }

        for(const auto& [idx, priv] : opts.m_authority_private_keys) {
            if(idx >= opts.m_authority_public_keys.size()) {
                return "Private key for unknown authority "
                     + std::to_string(idx);
            }
            const auto pub = pubkey_from_privkey(priv, secp_context());
            if(!pub.has_value()
               || pub.value() != opts.m_authority_public_keys[idx]) {
                return "Private key of authority " + std::to_string(idx)
                     + " does not match its public key";
            }
        }

        if(opts.m_validity_threshold.has_value()
           && (opts.m_validity_threshold.value() == 0
               || opts.m_validity_threshold.value() > total)) {
            return "validity_threshold must be in (0, total stake]";
        }

        if(opts.m_header_size == 0) {
            return "header_size must be greater than zero";
        }
        if(opts.m_max_header_delay.count() <= 0) {
            return "max_header_delay must be greater than zero";
        }
        if(opts.m_verifier_threads == 0) {
            return "verifier_threads must be greater than zero";
        }

        return std::nullopt;
    }

    parser::parser(std::istream& stream) {
        std::string line;
        while(std::getline(stream, line)) {
            std::istringstream line_stream(line);
            std::string key;
            if(std::getline(line_stream, key, '=')) {
                std::string value;
                if(std::getline(line_stream, value) && !value.empty()) {
                    m_options.emplace(key, parse_value(value));
                }
            }
        }
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        return get_val<std::string>(key);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<size_t> {
        return get_val<size_t>(key);
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        const auto val_str = get_string(key);
        if(!val_str.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(val_str.value());
    }

    auto parser::get_decimal(const std::string& key) const
        -> std::optional<double> {
        return get_val<double>(key);
    }

    auto parser::find_or_env(const std::string& key) const
        -> std::optional<value_t> {
        auto upper_key = key;
        std::transform(upper_key.begin(),
                       upper_key.end(),
                       upper_key.begin(),
                       [](unsigned char c) {
                           return std::toupper(c);
                       });
        if(const auto* env_v = std::getenv(upper_key.c_str())) {
            auto value = std::string(env_v);
            if(!value.empty()) {
                return parse_value(value);
            }
        }

        auto it = m_options.find(key);
        if(it != m_options.end()) {
            return it->second;
        }

        return std::nullopt;
    }

    auto parser::parse_value(const std::string& value) -> value_t {
        if(value.size() >= 2 && value.front() == '\"'
           && value.back() == '\"') {
            return value.substr(1, value.size() - 2);
        }

        // Values that are not numbers are kept as bare strings.
        try {
            if(value.find('.') == std::string::npos) {
                size_t pos{};
                const auto as_int
                    = static_cast<size_t>(std::stoull(value, &pos));
                if(pos == value.size()) {
                    return as_int;
                }
                return value;
            }
            const auto as_dbl = std::stod(value);
            return as_dbl;
        } catch(const std::invalid_argument&) {
            return value;
        } catch(const std::out_of_range&) {
            return value;
        }
    }
}
