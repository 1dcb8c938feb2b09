// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "store.hpp"

namespace dagpool::primary {
    namespace {
        auto to_slice(const buffer& buf) -> leveldb::Slice {
            return {buf.c_str(), buf.size()};
        }

        auto to_key(const buffer& buf) -> std::string {
            return {buf.c_str(), buf.size()};
        }

        auto hash_key(const hash_t& h) -> buffer {
            auto ret = buffer();
            ret.append(h.data(), h.size());
            return ret;
        }
    }

    auto header_key(const header& h) -> buffer {
        return hash_key(h.m_id);
    }

    auto certificate_key(const certificate& c) -> buffer {
        return hash_key(c.digest());
    }

    auto payload_key(const hash_t& digest, worker_id_t worker_id) -> buffer {
        auto ret = hash_key(digest);
        for(size_t i{0}; i < sizeof(worker_id); i++) {
            auto byte = static_cast<uint8_t>(worker_id >> (i * 8));
            ret.append(&byte, sizeof(byte));
        }
        return ret;
    }

    leveldb_store::leveldb_store(std::unique_ptr<leveldb::DB> db)
        : m_db(std::move(db)) {
        m_write_options.sync = true;
    }

    auto leveldb_store::open(const std::string& db_dir)
        -> std::variant<std::unique_ptr<leveldb_store>, std::string> {
        leveldb::Options opt;
        opt.create_if_missing = true;

        leveldb::DB* db_ptr{};
        const auto res = leveldb::DB::Open(opt, db_dir, &db_ptr);
        if(!res.ok()) {
            return res.ToString();
        }

        return std::unique_ptr<leveldb_store>(
            new leveldb_store(std::unique_ptr<leveldb::DB>(db_ptr)));
    }

    auto leveldb_store::write(const buffer& key, const buffer& value)
        -> std::optional<error> {
        const auto res
            = m_db->Put(m_write_options, to_slice(key), to_slice(value));
        if(!res.ok()) {
            return store_error{res.ToString()};
        }
        return std::nullopt;
    }

    auto leveldb_store::read(const buffer& key)
        -> std::variant<std::optional<buffer>, error> {
        std::string val;
        const auto res = m_db->Get(m_read_options, to_slice(key), &val);
        if(res.IsNotFound()) {
            return std::optional<buffer>();
        }
        if(!res.ok()) {
            return store_error{res.ToString()};
        }
        auto ret = buffer();
        ret.append(val.data(), val.size());
        return std::optional<buffer>(std::move(ret));
    }

    auto memory_store::write(const buffer& key, const buffer& value)
        -> std::optional<error> {
        std::unique_lock<std::mutex> l(m_mut);
        m_data[to_key(key)] = value;
        return std::nullopt;
    }

    auto memory_store::read(const buffer& key)
        -> std::variant<std::optional<buffer>, error> {
        std::unique_lock<std::mutex> l(m_mut);
        auto it = m_data.find(to_key(key));
        if(it == m_data.end()) {
            return std::optional<buffer>();
        }
        return std::optional<buffer>(it->second);
    }

    auto memory_store::size() const -> size_t {
        std::unique_lock<std::mutex> l(m_mut);
        return m_data.size();
    }
}
