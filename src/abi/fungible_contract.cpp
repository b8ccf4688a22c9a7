// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fungible_contract.hpp"

#include "logs.hpp"
#include "token/math.hpp"

namespace erc::abi {
    namespace {
        auto insufficient_balance_error() -> error_spec {
            return {"ERC20InsufficientBalance",
                    {{"sender", "address"},
                     {"balance", "uint256"},
                     {"needed", "uint256"}}};
        }

        auto insufficient_allowance_error() -> error_spec {
            return {"ERC20InsufficientAllowance",
                    {{"spender", "address"},
                     {"allowance", "uint256"},
                     {"needed", "uint256"}}};
        }
    }

    fungible_contract::fungible_contract(
        const evmc::address& addr,
        std::shared_ptr<fungible::engine> eng,
        std::shared_ptr<logging::log> logger)
        : contract(addr, std::move(logger)),
          m_engine(std::move(eng)) {
        register_functions();
        register_events_and_errors();
        m_listener = m_engine->add_listener([&](const event& ev) {
            record_log(erc20_log(ev));
        });
    }

    fungible_contract::~fungible_contract() {
        m_engine->remove_listener(m_listener);
    }

    void fungible_contract::register_functions() {
        add_function({"name", {}, {{"", "string"}}, mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_name(caller, dec);
                     });
        add_function({"symbol", {}, {{"", "string"}}, mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_symbol(caller, dec);
                     });
        add_function({"decimals", {}, {{"", "uint8"}}, mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_decimals(caller, dec);
                     });
        add_function({"totalSupply", {}, {{"", "uint256"}}, mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_total_supply(caller, dec);
                     });
        add_function({"balanceOf",
                      {{"account", "address"}},
                      {{"", "uint256"}},
                      mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_balance_of(caller, dec);
                     });
        add_function({"allowance",
                      {{"owner", "address"}, {"spender", "address"}},
                      {{"", "uint256"}},
                      mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_allowance(caller, dec);
                     });
        add_function({"transfer",
                      {{"to", "address"}, {"value", "uint256"}},
                      {{"", "bool"}},
                      mutability::nonpayable},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_transfer(caller, dec);
                     });
        add_function({"transferFrom",
                      {{"from", "address"},
                       {"to", "address"},
                       {"value", "uint256"}},
                      {{"", "bool"}},
                      mutability::nonpayable},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_transfer_from(caller, dec);
                     });
        add_function({"approve",
                      {{"spender", "address"}, {"value", "uint256"}},
                      {{"", "bool"}},
                      mutability::nonpayable},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_approve(caller, dec);
                     });
        add_function({"mint",
                      {{"to", "address"}, {"value", "uint256"}},
                      {},
                      mutability::nonpayable},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_mint(caller, dec);
                     });
        add_function({"burn",
                      {{"from", "address"}, {"value", "uint256"}},
                      {},
                      mutability::nonpayable},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_burn(caller, dec);
                     });
    }

    void fungible_contract::register_events_and_errors() {
        add_event({"Transfer",
                   {{"from", "address", true},
                    {"to", "address", true},
                    {"value", "uint256", false}}});
        add_event({"Approval",
                   {{"owner", "address", true},
                    {"spender", "address", true},
                    {"value", "uint256", false}}});

        add_error(insufficient_balance_error());
        add_error(insufficient_allowance_error());
    }

    auto fungible_contract::revert_for(error_code err,
                                       const evmc::address& sender,
                                       const evmc::address& spender,
                                       const evmc::uint256be& needed)
        -> call_result {
        switch(err) {
            case error_code::insufficient_balance: {
                auto bal = m_engine->balance_of(sender);
                if(std::holds_alternative<error_code>(bal)) {
                    return revert();
                }
                return revert_error(
                    insufficient_balance_error(),
                    encoder()
                        .add_address(sender)
                        .add_uint(std::get<evmc::uint256be>(bal))
                        .add_uint(needed));
            }
            case error_code::insufficient_allowance: {
                auto allowed = m_engine->allowance(sender, spender);
                if(std::holds_alternative<error_code>(allowed)) {
                    return revert();
                }
                return revert_error(
                    insufficient_allowance_error(),
                    encoder()
                        .add_address(spender)
                        .add_uint(std::get<evmc::uint256be>(allowed))
                        .add_uint(needed));
            }
            case error_code::arithmetic_overflow:
            case error_code::arithmetic_underflow:
                return panic(panic_arithmetic);
            case error_code::already_minted:
            case error_code::not_owner:
            case error_code::not_approved:
            case error_code::nonexistent_token:
            case error_code::max_supply_reached:
            case error_code::storage_failure:
                break;
        }
        return revert();
    }

    auto fungible_contract::uint_result(
        const std::variant<evmc::uint256be, error_code>& res) -> call_result {
        if(std::holds_alternative<error_code>(res)) {
            return revert();
        }
        return success(
            encoder().add_uint(std::get<evmc::uint256be>(res)).data());
    }

    auto fungible_contract::handle_name(const evmc::address& /* caller */,
                                        const decoder& /* dec */)
        -> std::optional<call_result> {
        return success(encoder().add_string(m_engine->name()).data());
    }

    auto fungible_contract::handle_symbol(const evmc::address& /* caller */,
                                          const decoder& /* dec */)
        -> std::optional<call_result> {
        return success(encoder().add_string(m_engine->symbol()).data());
    }

    auto fungible_contract::handle_decimals(const evmc::address& /* caller */,
                                            const decoder& /* dec */)
        -> std::optional<call_result> {
        return success(
            encoder().add_uint(from_uint64(m_engine->decimals())).data());
    }

    auto fungible_contract::handle_total_supply(
        const evmc::address& /* caller */,
        const decoder& /* dec */) -> std::optional<call_result> {
        return uint_result(m_engine->total_supply());
    }

    auto fungible_contract::handle_balance_of(
        const evmc::address& /* caller */,
        const decoder& dec) -> std::optional<call_result> {
        auto account = dec.get_address(0);
        if(!account.has_value()) {
            return std::nullopt;
        }
        return uint_result(m_engine->balance_of(account.value()));
    }

    auto fungible_contract::handle_allowance(
        const evmc::address& /* caller */,
        const decoder& dec) -> std::optional<call_result> {
        auto owner = dec.get_address(0);
        auto spender = dec.get_address(1);
        if(!owner.has_value() || !spender.has_value()) {
            return std::nullopt;
        }
        return uint_result(m_engine->allowance(owner.value(), spender.value()));
    }

    auto fungible_contract::handle_transfer(const evmc::address& caller,
                                            const decoder& dec)
        -> std::optional<call_result> {
        auto to = dec.get_address(0);
        auto value = dec.get_uint(1);
        if(!to.has_value() || !value.has_value()) {
            return std::nullopt;
        }
        auto err = m_engine->transfer(caller, to.value(), value.value());
        if(err.has_value()) {
            return revert_for(err.value(), caller, caller, value.value());
        }
        return success(encoder().add_bool(true).data());
    }

    auto fungible_contract::handle_transfer_from(const evmc::address& caller,
                                                 const decoder& dec)
        -> std::optional<call_result> {
        auto from = dec.get_address(0);
        auto to = dec.get_address(1);
        auto value = dec.get_uint(2);
        if(!from.has_value() || !to.has_value() || !value.has_value()) {
            return std::nullopt;
        }
        auto err = m_engine->transfer_from(caller,
                                           from.value(),
                                           to.value(),
                                           value.value());
        if(err.has_value()) {
            return revert_for(err.value(),
                              from.value(),
                              caller,
                              value.value());
        }
        return success(encoder().add_bool(true).data());
    }

    auto fungible_contract::handle_approve(const evmc::address& caller,
                                           const decoder& dec)
        -> std::optional<call_result> {
        auto spender = dec.get_address(0);
        auto value = dec.get_uint(1);
        if(!spender.has_value() || !value.has_value()) {
            return std::nullopt;
        }
        auto err = m_engine->approve(caller, spender.value(), value.value());
        if(err.has_value()) {
            return revert_for(err.value(),
                              caller,
                              spender.value(),
                              value.value());
        }
        return success(encoder().add_bool(true).data());
    }

    auto fungible_contract::handle_mint(const evmc::address& caller,
                                        const decoder& dec)
        -> std::optional<call_result> {
        auto to = dec.get_address(0);
        auto value = dec.get_uint(1);
        if(!to.has_value() || !value.has_value()) {
            return std::nullopt;
        }
        auto err = m_engine->mint(caller, to.value(), value.value());
        if(err.has_value()) {
            return revert_for(err.value(), to.value(), caller, value.value());
        }
        return success();
    }

    auto fungible_contract::handle_burn(const evmc::address& caller,
                                        const decoder& dec)
        -> std::optional<call_result> {
        auto from = dec.get_address(0);
        auto value = dec.get_uint(1);
        if(!from.has_value() || !value.has_value()) {
            return std::nullopt;
        }
        auto err = m_engine->burn(caller, from.value(), value.value());
        if(err.has_value()) {
            return revert_for(err.value(),
                              from.value(),
                              caller,
                              value.value());
        }
        return success();
    }
}
