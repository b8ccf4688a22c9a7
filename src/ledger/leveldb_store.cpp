// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "leveldb_store.hpp"

namespace erc::ledger {
    leveldb_store::leveldb_store() {
        m_write_options.sync = true;
    }

    auto leveldb_store::open(const std::string& db_dir)
        -> std::optional<std::string> {
        leveldb::Options opt;
        opt.create_if_missing = true;

        leveldb::DB* db_ptr{};
        const auto res = leveldb::DB::Open(opt, db_dir, &db_ptr);

        if(!res.ok()) {
            return res.ToString();
        }
        m_db.reset(db_ptr);

        return std::nullopt;
    }

    auto leveldb_store::get(const key_type& key) -> get_return_type {
        if(!m_db) {
            return error_code::backend;
        }

        leveldb::Slice key_slice(key.c_str(), key.size());
        std::string val;
        const auto res = m_db->Get(m_read_options, key_slice, &val);
        if(res.IsNotFound()) {
            return error_code::not_found;
        }
        if(!res.ok()) {
            return error_code::backend;
        }

        auto ret = value_type();
        ret.append(val.data(), val.size());
        return ret;
    }

    auto leveldb_store::write(const batch_type& batch) -> bool {
        if(!m_db) {
            return false;
        }

        leveldb::WriteBatch wb;
        for(const auto& [key, val] : batch) {
            leveldb::Slice key_slice(key.c_str(), key.size());
            if(val.has_value()) {
                leveldb::Slice val_slice(val->c_str(), val->size());
                wb.Put(key_slice, val_slice);
            } else {
                wb.Delete(key_slice);
            }
        }

        const auto res = m_db->Write(m_write_options, &wb);
        return res.ok();
    }
}
