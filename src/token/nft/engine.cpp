// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "engine.hpp"

#include "token/math.hpp"
#include "token/state.hpp"
#include "token/util.hpp"

namespace erc::nft {
    engine::engine(metadata meta,
                   std::shared_ptr<ledger::store> st,
                   std::shared_ptr<logging::log> logger)
        : erc::engine(std::move(st), std::move(logger)),
          m_meta(std::move(meta)) {}

    auto engine::mint_token(ledger::transaction& txn,
                            std::vector<event>& events,
                            const evmc::address& to,
                            const evmc::uint256be& token_id)
        -> std::optional<error_code> {
        const auto owner_key = state::make_key(state::row::owner, token_id);
        if(state::read_address(txn, owner_key).has_value()) {
            return error_code::already_minted;
        }

        const auto total_key = state::make_key(state::row::total_minted);
        const auto total = state::read_uint256(txn, total_key);
        if(!evmc::is_zero(m_meta.m_max_supply)
           && !(total < m_meta.m_max_supply)) {
            return error_code::max_supply_reached;
        }

        const auto one = from_uint64(1);
        const auto bal_key = state::make_key(state::row::balance, to);
        auto new_bal = checked_add(state::read_uint256(txn, bal_key), one);
        auto new_total = checked_add(total, one);
        if(!new_bal.has_value() || !new_total.has_value()) {
            return error_code::arithmetic_overflow;
        }

        state::write_address(txn, owner_key, to);
        state::write_uint256(txn, bal_key, new_bal.value());
        state::write_uint256(txn, total_key, new_total.value());
        events.emplace_back(transfer_event{std::nullopt, to, token_id});
        return std::nullopt;
    }

    auto engine::mint(const evmc::address& caller,
                      const evmc::address& to,
                      const evmc::uint256be& token_id)
        -> std::optional<error_code> {
        m_log->trace("mint requested by", to_hex(caller));
        return execute("mint",
                       [&](ledger::transaction& txn,
                           std::vector<event>& events) {
                           return mint_token(txn, events, to, token_id);
                       });
    }

    auto engine::mint_next(const evmc::address& caller,
                           const evmc::address& to,
                           const std::string& uri)
        -> std::variant<evmc::uint256be, error_code> {
        m_log->trace("mint_next requested by", to_hex(caller));
        auto token_id = evmc::uint256be();
        auto err = execute(
            "mint_next",
            [&](ledger::transaction& txn, std::vector<event>& events)
                -> std::optional<error_code> {
                const auto next_key = state::make_key(state::row::next_id);
                token_id = state::read_uint256(txn, next_key);
                auto next = checked_add(token_id, from_uint64(1));
                if(!next.has_value()) {
                    return error_code::arithmetic_overflow;
                }
                if(auto mint_err = mint_token(txn, events, to, token_id)) {
                    return mint_err;
                }
                state::write_string(
                    txn,
                    state::make_key(state::row::token_uri, token_id),
                    uri);
                state::write_uint256(txn, next_key, next.value());
                return std::nullopt;
            });
        if(err.has_value()) {
            return err.value();
        }
        return token_id;
    }

    auto engine::transfer_from(const evmc::address& caller,
                               const evmc::address& from,
                               const evmc::address& to,
                               const evmc::uint256be& token_id)
        -> std::optional<error_code> {
        return execute(
            "transfer_from",
            [&](ledger::transaction& txn, std::vector<event>& events)
                -> std::optional<error_code> {
                const auto owner_key
                    = state::make_key(state::row::owner, token_id);
                const auto owner = state::read_address(txn, owner_key);
                if(!owner.has_value() || owner.value() != from) {
                    return error_code::not_owner;
                }

                const auto approval_key
                    = state::make_key(state::row::token_approval, token_id);
                const auto approved = state::read_address(txn, approval_key);
                const auto is_operator = state::read_flag(
                    txn,
                    state::make_key(state::row::operator_approval,
                                    from,
                                    caller));
                if(caller != from && approved != caller && !is_operator) {
                    return error_code::not_approved;
                }

                const auto one = from_uint64(1);
                const auto from_key
                    = state::make_key(state::row::balance, from);
                auto from_bal
                    = checked_sub(state::read_uint256(txn, from_key), one);
                if(!from_bal.has_value()) {
                    return error_code::arithmetic_underflow;
                }
                state::write_uint256(txn, from_key, from_bal.value());

                // Read after the debit so a self-transfer sees it.
                const auto to_key = state::make_key(state::row::balance, to);
                auto to_bal
                    = checked_add(state::read_uint256(txn, to_key), one);
                if(!to_bal.has_value()) {
                    return error_code::arithmetic_overflow;
                }
                state::write_uint256(txn, to_key, to_bal.value());

                if(approved.has_value()) {
                    txn.erase(approval_key);
                }
                state::write_address(txn, owner_key, to);
                events.emplace_back(transfer_event{from, to, token_id});
                return std::nullopt;
            });
    }

    auto engine::approve(const evmc::address& caller,
                         const evmc::address& spender,
                         const evmc::uint256be& token_id)
        -> std::optional<error_code> {
        return execute(
            "approve",
            [&](ledger::transaction& txn, std::vector<event>& events)
                -> std::optional<error_code> {
                const auto owner = state::read_address(
                    txn,
                    state::make_key(state::row::owner, token_id));
                if(!owner.has_value() || owner.value() != caller) {
                    return error_code::not_owner;
                }
                state::write_address(
                    txn,
                    state::make_key(state::row::token_approval, token_id),
                    spender);
                events.emplace_back(
                    approval_event{owner.value(), spender, token_id});
                return std::nullopt;
            });
    }

    auto engine::set_approval_for_all(const evmc::address& caller,
                                      const evmc::address& op,
                                      bool approved)
        -> std::optional<error_code> {
        return execute(
            "set_approval_for_all",
            [&](ledger::transaction& txn, std::vector<event>& events)
                -> std::optional<error_code> {
                state::write_flag(
                    txn,
                    state::make_key(state::row::operator_approval, caller, op),
                    approved);
                events.emplace_back(
                    approval_for_all_event{caller, op, approved});
                return std::nullopt;
            });
    }

    auto engine::name() const -> const std::string& {
        return m_meta.m_name;
    }

    auto engine::symbol() const -> const std::string& {
        return m_meta.m_symbol;
    }

    auto engine::owner_of(const evmc::uint256be& token_id)
        -> std::variant<evmc::address, error_code> {
        return query<evmc::address>(
            [&](ledger::transaction& txn)
                -> std::variant<evmc::address, error_code> {
                auto owner = state::read_address(
                    txn,
                    state::make_key(state::row::owner, token_id));
                if(!owner.has_value()) {
                    return error_code::nonexistent_token;
                }
                return owner.value();
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

    auto engine::get_approved(const evmc::uint256be& token_id)
        -> std::variant<evmc::address, error_code> {
        return query<evmc::address>(
            [&](ledger::transaction& txn)
                -> std::variant<evmc::address, error_code> {
                if(!state::read_address(
                       txn,
                       state::make_key(state::row::owner, token_id))
                        .has_value()) {
                    return error_code::nonexistent_token;
                }
                return state::read_address(
                           txn,
                           state::make_key(state::row::token_approval,
                                           token_id))
                    .value_or(evmc::address{});
            });
    }

    auto engine::is_approved_for_all(const evmc::address& owner,
                                     const evmc::address& op)
        -> std::variant<bool, error_code> {
        return query<bool>(
            [&](ledger::transaction& txn) -> std::variant<bool, error_code> {
                return state::read_flag(
                    txn,
                    state::make_key(state::row::operator_approval,
                                    owner,
                                    op));
            });
    }

    auto engine::token_uri(const evmc::uint256be& token_id)
        -> std::variant<std::string, error_code> {
        return query<std::string>(
            [&](ledger::transaction& txn)
                -> std::variant<std::string, error_code> {
                if(!state::read_address(
                       txn,
                       state::make_key(state::row::owner, token_id))
                        .has_value()) {
                    return error_code::nonexistent_token;
                }
                auto uri = state::read_string(
                    txn,
                    state::make_key(state::row::token_uri, token_id));
                if(uri.has_value()) {
                    return uri.value();
                }
                if(m_meta.m_base_uri.empty()) {
                    return std::string();
                }
                return m_meta.m_base_uri + to_decimal(token_id);
            });
    }

    auto engine::total_minted() -> std::variant<evmc::uint256be, error_code> {
        return query<evmc::uint256be>(
            [&](ledger::transaction& txn)
                -> std::variant<evmc::uint256be, error_code> {
                return state::read_uint256(
                    txn,
                    state::make_key(state::row::total_minted));
            });
    }

    auto engine::max_supply() const -> evmc::uint256be {
        return m_meta.m_max_supply;
    }

    auto engine::contract_owner() const -> evmc::address {
        return m_meta.m_owner;
    }

    auto engine::supports_interface(uint32_t interface_id) -> bool {
        return interface_id == erc165_interface_id
            || interface_id == erc721_interface_id
            || interface_id == erc721_metadata_interface_id;
    }
}
