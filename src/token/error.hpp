// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_TOKEN_ERROR_H_
#define ERC_LEDGER_SRC_TOKEN_ERROR_H_

#include <cstdint>
#include <string>

namespace erc {
    /// Error codes returned by token engine operations. A failed operation
    /// leaves the ledger unchanged.
    enum class error_code : uint8_t {
        /// Mint requested for a token identifier that already has an owner.
        already_minted,
        /// The stated or calling owner does not own the token, or the token
        /// does not exist.
        not_owner,
        /// Caller is neither the owner, the approved address, nor an approved
        /// operator for the token.
        not_approved,
        /// Account balance is lower than the requested amount.
        insufficient_balance,
        /// Spender allowance is lower than the requested amount.
        insufficient_allowance,
        /// A 256-bit addition would wrap.
        arithmetic_overflow,
        /// A 256-bit subtraction would wrap.
        arithmetic_underflow,
        /// Query for a token identifier that has no owner.
        nonexistent_token,
        /// The configured maximum number of tokens has been minted.
        max_supply_reached,
        /// The ledger store failed to read, decode or write a row.
        storage_failure
    };

    /// Returns a stable lower-case name for an error code.
    /// \param err error code.
    /// \return name of the error code.
    auto to_string(error_code err) -> std::string;
}

#endif // ERC_LEDGER_SRC_TOKEN_ERROR_H_
