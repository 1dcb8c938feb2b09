// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
//               2022 MITRE Corporation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file config.hpp
 * Tools for reading options from a configuration file and building
 * the parameter set of a primary.
 */

#ifndef DAGPOOL_SRC_COMMON_CONFIG_H_
#define DAGPOOL_SRC_COMMON_CONFIG_H_

#include "hash.hpp"
#include "keys.hpp"
#include "logging.hpp"

#include <chrono>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dagpool::config {
    /// \brief Maximum bytes optimistically reserved at once during deserialization.
    /// When deserializing, we want to limit the amount of memory we reserve
    /// without the sender actually sending that amount of information. This
    /// constant is used when deserializing so that a sender must send at least
    /// X bytes of information for us to allocate X+1MiB of memory.
    static constexpr uint64_t maximum_reservation
        = static_cast<uint64_t>(1024 * 1024); // 1MiB

    /// Largest committee supported by the signer bitmap of a certificate.
    static constexpr size_t max_authorities{128};

    namespace defaults {
        static constexpr size_t header_size{1000};
        static constexpr auto max_header_delay = std::chrono::milliseconds(100);
        static constexpr uint64_t gc_depth{50};
        static constexpr size_t verifier_threads{4};
        static constexpr uint64_t stake{1};

        static constexpr auto log_level = logging::log_level::warn;
    }

    static constexpr auto header_size_key = "header_size";
    static constexpr auto max_header_delay_key = "max_header_delay";
    static constexpr auto gc_depth_key = "gc_depth";
    static constexpr auto verifier_threads_key = "verifier_threads";
    static constexpr auto primary_prefix = "primary";
    static constexpr auto authority_prefix = "authority";
    static constexpr auto authority_count_key = "authority_count";
    static constexpr auto validity_threshold_key = "validity_threshold";
    static constexpr auto config_separator = "_";
    static constexpr auto loglevel_postfix = "loglevel";
    static constexpr auto db_postfix = "db";
    static constexpr auto stake_postfix = "stake";
    static constexpr auto private_key_postfix = "private_key";
    static constexpr auto public_key_postfix = "public_key";

    /// Options of a primary and the committee it belongs to.
    struct options {
        /// Payload size in bytes at which the proposer seals a header.
        size_t m_header_size{defaults::header_size};
        /// Longest the proposer waits before sealing a non-empty header.
        std::chrono::milliseconds m_max_header_delay{
            defaults::max_header_delay};
        /// Number of rounds behind consensus for which state is retained.
        uint64_t m_gc_depth{defaults::gc_depth};
        /// Number of threads verifying certificates from peers.
        size_t m_verifier_threads{defaults::verifier_threads};
        /// Log level of the primary.
        logging::log_level m_primary_loglevel{defaults::log_level};
        /// LevelDB directory of the primary. Without one, the primary keeps
        /// its state in memory.
        std::optional<std::string> m_primary_db;

        /// Public keys of the committee, in configuration order.
        std::vector<pubkey_t> m_authority_public_keys;
        /// Stake of each authority, parallel to m_authority_public_keys.
        std::vector<uint64_t> m_authority_stakes;
        /// Private keys present in the configuration, keyed by authority
        /// index.
        std::unordered_map<size_t, privkey_t> m_authority_private_keys;
        /// Stake required to certify a header. Defaults to 2f+1 of the total
        /// stake when absent.
        std::optional<uint64_t> m_validity_threshold;
    };

    /// Reads the configuration parameters from the specified file without
    /// checking their consistency.
    /// \param config_file path to the configuration file.
    /// \return the options read from the file, or an error string.
    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Reads the configuration parameters from the given stream without
    /// checking their consistency.
    /// \see read_options(const std::string&)
    auto read_options(std::istream& config)
        -> std::variant<options, std::string>;

    /// Loads options from the given config file and checks for invariants.
    /// \param config_file path to configuration file to load.
    /// \return valid options struct, or a string describing the error.
    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Checks a fully populated options struct for invariants. Assumes
    /// struct contents were previously populated using read_options.
    /// \param opts options struct to check.
    /// \return std::nullopt on success, or a string describing the error.
    auto check_options(const options& opts) -> std::optional<std::string>;

    /// Returns the configuration key of a per-authority option.
    /// \param authority_id index of the authority.
    /// \param postfix option name.
    /// \return key of the form authority<id>_<postfix>.
    auto get_authority_key(size_t authority_id, const std::string& postfix)
        -> std::string;

    /// Reads configuration parameters line-by-line from a stream. Each line
    /// has the form key=value. Quoted values are strings, values
    /// containing a decimal point are doubles, and other values are
    /// unsigned integers. Any key may be overridden by an environment
    /// variable of the same name in upper case.
    class parser {
      public:
        /// Constructor.
        /// \param stream stream of key=value lines.
        explicit parser(std::istream& stream);

        /// Returns the given key if its value is a string.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if not found.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Returns the value for the given key if its value is an integer.
        [[nodiscard]] auto get_ulong(const std::string& key) const
            -> std::optional<size_t>;

        /// Returns the log level for the given key if its value is a
        /// valid level name.
        [[nodiscard]] auto get_loglevel(const std::string& key) const
            -> std::optional<logging::log_level>;

        /// Returns the value for the given key if its value is a double.
        [[nodiscard]] auto get_decimal(const std::string& key) const
            -> std::optional<double>;

      private:
        using value_t = std::variant<std::string, size_t, double>;

        [[nodiscard]] auto find_or_env(const std::string& key) const
            -> std::optional<value_t>;

        template<typename T>
        [[nodiscard]] auto get_val(const std::string& key) const
            -> std::optional<T> {
            const auto it = find_or_env(key);
            if(it) {
                const auto* val = std::get_if<T>(&it.value());
                if(val != nullptr) {
                    return *val;
                }
            }
            return std::nullopt;
        }

        static auto parse_value(const std::string& value) -> value_t;

        std::map<std::string, value_t> m_options;
    };
}

#endif // DAGPOOL_SRC_COMMON_CONFIG_H_
