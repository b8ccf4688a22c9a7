// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "engine.hpp"

#include "token/math.hpp"
#include "token/state.hpp"
#include "token/util.hpp"

namespace erc::fungible {
    engine::engine(metadata meta,
                   std::shared_ptr<ledger::store> st,
                   std::shared_ptr<logging::log> logger)
        : erc::engine(std::move(st), std::move(logger)),
          m_meta(std::move(meta)) {}

    auto engine::move_balance(ledger::transaction& txn,
                              std::vector<event>& events,
                              const evmc::address& from,
                              const evmc::address& to,
                              const evmc::uint256be& value)
        -> std::optional<error_code> {
        const auto from_key = state::make_key(state::row::balance, from);
        auto from_bal = checked_sub(state::read_uint256(txn, from_key), value);
        if(!from_bal.has_value()) {
            return error_code::insufficient_balance;
        }
        state::write_uint256(txn, from_key, from_bal.value());

        const auto to_key = state::make_key(state::row::balance, to);
        auto to_bal = checked_add(state::read_uint256(txn, to_key), value);
        if(!to_bal.has_value()) {
            // Unreachable while the supply invariant holds.
            return error_code::arithmetic_overflow;
        }
        state::write_uint256(txn, to_key, to_bal.value());

        events.emplace_back(transfer_event{from, to, value});
        return std::nullopt;
    }

    auto engine::mint(const evmc::address& caller,
                      const evmc::address& to,
                      const evmc::uint256be& value)
        -> std::optional<error_code> {
        m_log->trace("mint requested by", to_hex(caller));
        return execute(
            "mint",
            [&](ledger::transaction& txn, std::vector<event>& events)
                -> std::optional<error_code> {
                const auto supply_key
                    = state::make_key(state::row::total_supply);
                auto supply
                    = checked_add(state::read_uint256(txn, supply_key), value);
                const auto bal_key = state::make_key(state::row::balance, to);
                auto bal
                    = checked_add(state::read_uint256(txn, bal_key), value);
                if(!supply.has_value() || !bal.has_value()) {
                    return error_code::arithmetic_overflow;
                }
                state::write_uint256(txn, supply_key, supply.value());
                state::write_uint256(txn, bal_key, bal.value());
                events.emplace_back(transfer_event{std::nullopt, to, value});
                return std::nullopt;
            });
    }

    auto engine::burn(const evmc::address& caller,
                      const evmc::address& from,
                      const evmc::uint256be& value)
        -> std::optional<error_code> {
        m_log->trace("burn requested by", to_hex(caller));
        return execute(
            "burn",
            [&](ledger::transaction& txn, std::vector<event>& events)
                -> std::optional<error_code> {
                const auto bal_key = state::make_key(state::row::balance, from);
                auto bal
                    = checked_sub(state::read_uint256(txn, bal_key), value);
                if(!bal.has_value()) {
                    return error_code::insufficient_balance;
                }
                const auto supply_key
                    = state::make_key(state::row::total_supply);
                auto supply
                    = checked_sub(state::read_uint256(txn, supply_key), value);
                if(!supply.has_value()) {
                    return error_code::arithmetic_underflow;
                }
                state::write_uint256(txn, bal_key, bal.value());
                state::write_uint256(txn, supply_key, supply.value());
                events.emplace_back(transfer_event{from, std::nullopt, value});
                return std::nullopt;
            });
    }

    auto engine::transfer(const evmc::address& caller,
                          const evmc::address& to,
                          const evmc::uint256be& value)
        -> std::optional<error_code> {
        return execute("transfer",
                       [&](ledger::transaction& txn,
                           std::vector<event>& events) {
                           return move_balance(txn, events, caller, to, value);
                       });
    }

    auto engine::transfer_from(const evmc::address& caller,
                               const evmc::address& from,
                               const evmc::address& to,
                               const evmc::uint256be& value)
        -> std::optional<error_code> {
        return execute(
            "transfer_from",
            [&](ledger::transaction& txn, std::vector<event>& events)
                -> std::optional<error_code> {
                const auto allowance_key
                    = state::make_key(state::row::allowance, from, caller);
                auto remaining = checked_sub(
                    state::read_uint256(txn, allowance_key),
                    value);
                if(!remaining.has_value()) {
                    return error_code::insufficient_allowance;
                }
                // Discarded with the transaction if the move fails.
                state::write_uint256(txn, allowance_key, remaining.value());
                return move_balance(txn, events, from, to, value);
            });
    }

    auto engine::approve(const evmc::address& caller,
                         const evmc::address& spender,
                         const evmc::uint256be& value)
        -> std::optional<error_code> {
        return execute(
            "approve",
            [&](ledger::transaction& txn, std::vector<event>& events)
                -> std::optional<error_code> {
                state::write_uint256(
                    txn,
                    state::make_key(state::row::allowance, caller, spender),
                    value);
                events.emplace_back(approval_event{caller, spender, value});
                return std::nullopt;
            });
    }

    auto engine::allowance(const evmc::address& owner,
                           const evmc::address& spender)
        -> std::variant<evmc::uint256be, error_code> {
        return query<evmc::uint256be>(
            [&](ledger::transaction& txn)
                -> std::variant<evmc::uint256be, error_code> {
                return state::read_uint256(
                    txn,
                    state::make_key(state::row::allowance, owner, spender));
            });
    }

    auto engine::balance_of(const evmc::address& owner)
        -> std::variant<evmc::uint256be, error_code> {
        return query<evmc::uint256be>(
            [&](ledger::transaction& txn)
                -> std::variant<evmc::uint256be, error_code> {
                return state::read_uint256(
                    txn,
                    state::make_key(state::row::balance, owner));
            });
    }

    auto engine::total_supply() -> std::variant<evmc::uint256be, error_code> {
        return query<evmc::uint256be>(
            [&](ledger::transaction& txn)
                -> std::variant<evmc::uint256be, error_code> {
                return state::read_uint256(
                    txn,
                    state::make_key(state::row::total_supply));
            });
    }

    auto engine::name() const -> const std::string& {
        return m_meta.m_name;
    }

    auto engine::symbol() const -> const std::string& {
        return m_meta.m_symbol;
    }

    auto engine::decimals() const -> uint8_t {
        return m_meta.m_decimals;
    }
}
