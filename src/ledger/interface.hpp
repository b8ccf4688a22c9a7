// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_LEDGER_INTERFACE_H_
#define ERC_LEDGER_SRC_LEDGER_INTERFACE_H_

#include "util/common/buffer.hpp"

#include <map>
#include <optional>
#include <variant>

namespace erc::ledger {
    /// Type for keys of ledger rows.
    using key_type = buffer;
    /// Type for values of ledger rows.
    using value_type = buffer;

    /// Interface for a key-value backend holding ledger rows.
    class store {
      public:
        /// Error codes returned by store reads.
        enum class error_code : uint8_t {
            /// No row exists for the requested key.
            not_found,
            /// The backend failed to service the read.
            backend
        };

        /// Return type from a get operation. Either the row value or an
        /// error code.
        using get_return_type = std::variant<value_type, error_code>;

        /// Set of row mutations applied together. A value of std::nullopt
        /// erases the row.
        using batch_type = std::map<key_type, std::optional<value_type>>;

        store() = default;
        virtual ~store() = default;

        store(const store&) = delete;
        auto operator=(const store&) -> store& = delete;
        store(store&&) = delete;
        auto operator=(store&&) -> store& = delete;

        /// Reads a single row.
        /// \param key key of the row to read.
        /// \return the row value, or an error code.
        virtual auto get(const key_type& key) -> get_return_type = 0;

        /// Applies every mutation in the batch atomically.
        /// \param batch puts and erases to apply.
        /// \return true if the batch was applied. False if none of it was.
        virtual auto write(const batch_type& batch) -> bool = 0;
    };
}

#endif // ERC_LEDGER_SRC_LEDGER_INTERFACE_H_
