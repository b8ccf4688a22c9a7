// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_TOKEN_STATE_H_
#define ERC_LEDGER_SRC_TOKEN_STATE_H_

#include "ledger/transaction.hpp"

#include <evmc/evmc.hpp>
#include <optional>
#include <string>

/// Typed access to token ledger rows. Each mapping lives under its own
/// one-byte row prefix followed by the fixed-width key bytes. Rows that fail
/// to decode poison the transaction they were read through.
namespace erc::state {
    /// Row prefixes of the token mappings.
    enum class row : uint8_t {
        /// Token identifier to owning address.
        owner = 0x01,
        /// Address to token count or fungible balance.
        balance = 0x02,
        /// Token identifier to approved address.
        token_approval = 0x03,
        /// (owner, operator) to operator flag.
        operator_approval = 0x04,
        /// Token identifier to metadata URI.
        token_uri = 0x05,
        /// Identifier assigned by the next auto-increment mint.
        next_id = 0x06,
        /// Number of tokens ever minted.
        total_minted = 0x07,
        /// (owner, spender) to remaining allowance.
        allowance = 0x08,
        /// Fungible aggregate supply.
        total_supply = 0x09
    };

    /// Key of a singleton row.
    auto make_key(row r) -> ledger::key_type;
    /// Key of a row indexed by a 32-byte word.
    auto make_key(row r, const evmc::bytes32& id) -> ledger::key_type;
    /// Key of a row indexed by an address.
    auto make_key(row r, const evmc::address& addr) -> ledger::key_type;
    /// Key of a row indexed by an ordered address pair.
    auto make_key(row r,
                  const evmc::address& first,
                  const evmc::address& second) -> ledger::key_type;

    /// Reads an address row.
    /// \param txn transaction to read through.
    /// \param key row key.
    /// \return the address, or std::nullopt if the row is absent.
    auto read_address(ledger::transaction& txn, const ledger::key_type& key)
        -> std::optional<evmc::address>;

    /// Reads a 256-bit value row. Absent rows read as zero.
    auto read_uint256(ledger::transaction& txn, const ledger::key_type& key)
        -> evmc::uint256be;

    /// Reads a string row.
    /// \return the string, or std::nullopt if the row is absent.
    auto read_string(ledger::transaction& txn, const ledger::key_type& key)
        -> std::optional<std::string>;

    /// Reads a boolean row. Absent rows read as false.
    auto read_flag(ledger::transaction& txn, const ledger::key_type& key)
        -> bool;

    void write_address(ledger::transaction& txn,
                       const ledger::key_type& key,
                       const evmc::address& addr);

    void write_uint256(ledger::transaction& txn,
                       const ledger::key_type& key,
                       const evmc::uint256be& val);

    void write_string(ledger::transaction& txn,
                      const ledger::key_type& key,
                      const std::string& str);

    void write_flag(ledger::transaction& txn,
                    const ledger::key_type& key,
                    bool flag);
}

#endif // ERC_LEDGER_SRC_TOKEN_STATE_H_
