// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file leveldb_store.hpp
 * Persistent ledger store backed by LevelDB.
 */

#ifndef ERC_LEDGER_SRC_LEDGER_LEVELDB_STORE_H_
#define ERC_LEDGER_SRC_LEDGER_LEVELDB_STORE_H_

#include "interface.hpp"

#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <memory>
#include <string>

namespace erc::ledger {
    /// Store implementation persisting rows in a LevelDB database. Call
    /// open() before using.
    class leveldb_store : public store {
      public:
        leveldb_store();

        /// Creates or reopens the database.
        /// \param db_dir path to the directory holding the database files.
        /// \return std::nullopt if the database opened successfully.
        ///         Otherwise, returns the LevelDB error message.
        auto open(const std::string& db_dir) -> std::optional<std::string>;

        /// Reads a single row.
        /// \param key key of the row to read.
        /// \return the row value, error_code::not_found if the row does not
        ///         exist, or error_code::backend if the database is not open
        ///         or the read failed.
        auto get(const key_type& key) -> get_return_type override;

        /// Applies the batch as a single synchronous LevelDB write.
        /// \param batch puts and erases to apply.
        /// \return true if LevelDB accepted the write.
        auto write(const batch_type& batch) -> bool override;

      private:
        std::unique_ptr<leveldb::DB> m_db;
        leveldb::ReadOptions m_read_options;
        leveldb::WriteOptions m_write_options;
    };
}

#endif // ERC_LEDGER_SRC_LEDGER_LEVELDB_STORE_H_
