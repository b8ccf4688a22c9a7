// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_LEDGER_MEMORY_STORE_H_
#define ERC_LEDGER_SRC_LEDGER_MEMORY_STORE_H_

#include "interface.hpp"

#include <mutex>

namespace erc::ledger {
    /// Store implementation keeping all rows in an ordered map. Contents are
    /// lost when the store is destroyed.
    class memory_store : public store {
      public:
        /// Reads a single row.
        /// \param key key of the row to read.
        /// \return the row value, or error_code::not_found.
        auto get(const key_type& key) -> get_return_type override;

        /// Applies the batch under the store lock.
        /// \param batch puts and erases to apply.
        /// \return true.
        auto write(const batch_type& batch) -> bool override;

        /// Returns the number of rows held by the store.
        /// \return row count.
        [[nodiscard]] auto size() const -> size_t;

      private:
        mutable std::mutex m_mut;
        std::map<key_type, value_type> m_rows;
    };
}

#endif // ERC_LEDGER_SRC_LEDGER_MEMORY_STORE_H_
