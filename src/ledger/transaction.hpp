// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_LEDGER_TRANSACTION_H_
#define ERC_LEDGER_SRC_LEDGER_TRANSACTION_H_

#include "interface.hpp"

#include <memory>

namespace erc::ledger {
    /// Overlay of pending row mutations over a store. Reads observe the
    /// transaction's own writes first. Nothing reaches the store until
    /// commit(). Destroying an uncommitted transaction discards its writes.
    class transaction {
      public:
        /// Constructor.
        /// \param st store to read from and commit to.
        explicit transaction(std::shared_ptr<store> st);

        /// Reads a row through the overlay. A backend error poisons the
        /// transaction.
        /// \param key key of the row.
        /// \return the row value, or std::nullopt if the row is absent or
        ///         could not be read.
        auto get(const key_type& key) -> std::optional<value_type>;

        /// Stages a row write.
        /// \param key key of the row.
        /// \param val new value of the row.
        void put(const key_type& key, value_type val);

        /// Stages a row removal.
        /// \param key key of the row.
        void erase(const key_type& key);

        /// Marks the transaction as unable to commit.
        void poison();

        /// Indicates whether a read failed or poison() was called.
        /// \return true if the transaction can no longer commit.
        [[nodiscard]] auto failed() const -> bool;

        /// Writes all staged mutations to the store in one batch.
        /// \return true if the batch was written. False if the transaction
        ///         is poisoned or the store rejected the batch.
        auto commit() -> bool;

        /// Returns the staged mutations.
        /// \return pending puts and erases.
        [[nodiscard]] auto pending() const -> const store::batch_type&;

      private:
        std::shared_ptr<store> m_store;
        store::batch_type m_pending;
        bool m_failed{false};
    };
}

#endif // ERC_LEDGER_SRC_LEDGER_TRANSACTION_H_
