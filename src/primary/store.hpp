// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_PRIMARY_STORE_H_
#define DAGPOOL_SRC_PRIMARY_STORE_H_

#include "error.hpp"
#include "messages.hpp"
#include "util/common/buffer.hpp"

#include <leveldb/db.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace dagpool::primary {
    /// Key under which a header is stored: its ID.
    auto header_key(const header& h) -> buffer;

    /// Key under which a certificate is stored: its digest.
    auto certificate_key(const certificate& c) -> buffer;

    /// \brief Key of the marker recording that a worker holds a batch.
    ///
    /// The batch digest followed by the worker ID as a little-endian 32-bit
    /// integer. Including the worker ID stops an author from claiming a
    /// batch is held by a worker other than the one that received it.
    auto payload_key(const hash_t& digest, worker_id_t worker_id) -> buffer;

    /// Persistent key-value storage used by the primary. Implementations
    /// are safe to use from multiple threads.
    class store {
      public:
        virtual ~store() = default;

        store() = default;
        store(const store&) = delete;
        auto operator=(const store&) -> store& = delete;
        store(store&&) = delete;
        auto operator=(store&&) -> store& = delete;

        /// Writes a value, replacing any previous value for the key.
        /// \param key key to write.
        /// \param value value to associate with the key.
        /// \return std::nullopt on success, or a store_error.
        virtual auto write(const buffer& key, const buffer& value)
            -> std::optional<error>
            = 0;

        /// Reads the value of a key.
        /// \param key key to read.
        /// \return the value, std::nullopt if the key is absent, or a
        ///         store_error.
        virtual auto read(const buffer& key)
            -> std::variant<std::optional<buffer>, error>
            = 0;
    };

    /// Store backed by a LevelDB database.
    class leveldb_store final : public store {
      public:
        /// Opens or creates the database in the given directory.
        /// \param db_dir database directory.
        /// \return the store, or the LevelDB error message.
        static auto open(const std::string& db_dir)
            -> std::variant<std::unique_ptr<leveldb_store>, std::string>;

        auto write(const buffer& key, const buffer& value)
            -> std::optional<error> final;

        auto read(const buffer& key)
            -> std::variant<std::optional<buffer>, error> final;

      private:
        explicit leveldb_store(std::unique_ptr<leveldb::DB> db);

        std::unique_ptr<leveldb::DB> m_db;
        leveldb::ReadOptions m_read_options;
        leveldb::WriteOptions m_write_options;
    };

    /// Store keeping its contents in memory. Used when the primary runs
    /// without a database directory.
    class memory_store final : public store {
      public:
        memory_store() = default;

        auto write(const buffer& key, const buffer& value)
            -> std::optional<error> final;

        auto read(const buffer& key)
            -> std::variant<std::optional<buffer>, error> final;

        /// Returns the number of keys written.
        [[nodiscard]] auto size() const -> size_t;

      private:
        mutable std::mutex m_mut;
        std::map<std::string, buffer> m_data;
    };
}

#endif // DAGPOOL_SRC_PRIMARY_STORE_H_
