// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "nft_contract.hpp"

#include "logs.hpp"
#include "token/math.hpp"

namespace erc::abi {
    namespace {
        auto invalid_sender_error() -> error_spec {
            return {"ERC721InvalidSender", {{"sender", "address"}}};
        }

        auto incorrect_owner_error() -> error_spec {
            return {"ERC721IncorrectOwner",
                    {{"sender", "address"},
                     {"tokenId", "uint256"},
                     {"owner", "address"}}};
        }

        auto insufficient_approval_error() -> error_spec {
            return {"ERC721InsufficientApproval",
                    {{"operator", "address"}, {"tokenId", "uint256"}}};
        }

        auto nonexistent_token_error() -> error_spec {
            return {"ERC721NonexistentToken", {{"tokenId", "uint256"}}};
        }

        auto invalid_approver_error() -> error_spec {
            return {"ERC721InvalidApprover", {{"approver", "address"}}};
        }

        auto max_supply_error() -> error_spec {
            return {"MaxSupplyReached", {{"maxSupply", "uint256"}}};
        }
    }

    nft_contract::nft_contract(const evmc::address& addr,
                               std::shared_ptr<nft::engine> eng,
                               std::shared_ptr<logging::log> logger)
        : contract(addr, std::move(logger)),
          m_engine(std::move(eng)) {
        register_functions();
        register_events_and_errors();
        m_listener = m_engine->add_listener([&](const event& ev) {
            record_log(erc721_log(ev));
        });
    }

    nft_contract::~nft_contract() {
        m_engine->remove_listener(m_listener);
    }

    void nft_contract::register_functions() {
        add_function({"name", {}, {{"", "string"}}, mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_name(caller, dec);
                     });
        add_function({"symbol", {}, {{"", "string"}}, mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_symbol(caller, dec);
                     });
        add_function({"tokenURI",
                      {{"tokenId", "uint256"}},
                      {{"", "string"}},
                      mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_token_uri(caller, dec);
                     });
        add_function({"balanceOf",
                      {{"owner", "address"}},
                      {{"", "uint256"}},
                      mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_balance_of(caller, dec);
                     });
        add_function({"ownerOf",
                      {{"tokenId", "uint256"}},
                      {{"", "address"}},
                      mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_owner_of(caller, dec);
                     });
        add_function({"getApproved",
                      {{"tokenId", "uint256"}},
                      {{"", "address"}},
                      mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_get_approved(caller, dec);
                     });
        add_function({"isApprovedForAll",
                      {{"owner", "address"}, {"operator", "address"}},
                      {{"", "bool"}},
                      mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_is_approved_for_all(caller, dec);
                     });
        add_function({"totalMinted", {}, {{"", "uint256"}}, mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_total_minted(caller, dec);
                     });
        add_function({"maxSupply", {}, {{"", "uint256"}}, mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_max_supply(caller, dec);
                     });
        add_function({"getOwner", {}, {{"", "address"}}, mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_get_owner(caller, dec);
                     });
        add_function({"supportsInterface",
                      {{"interfaceId", "bytes4"}},
                      {{"", "bool"}},
                      mutability::view},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_supports_interface(caller, dec);
                     });
        add_function({"mint",
                      {{"to", "address"}, {"tokenId", "uint256"}},
                      {},
                      mutability::nonpayable},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_mint(caller, dec);
                     });
        add_function({"mint",
                      {{"to", "address"}, {"uri", "string"}},
                      {{"", "uint256"}},
                      mutability::nonpayable},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_mint_uri(caller, dec);
                     });
        add_function({"transferFrom",
                      {{"from", "address"},
                       {"to", "address"},
                       {"tokenId", "uint256"}},
                      {},
                      mutability::nonpayable},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_transfer_from(caller, dec);
                     });
        add_function({"approve",
                      {{"to", "address"}, {"tokenId", "uint256"}},
                      {},
                      mutability::nonpayable},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_approve(caller, dec);
                     });
        add_function({"setApprovalForAll",
                      {{"operator", "address"}, {"approved", "bool"}},
                      {},
                      mutability::nonpayable},
                     [&](const evmc::address& caller, const decoder& dec) {
                         return handle_set_approval_for_all(caller, dec);
                     });
    }

    void nft_contract::register_events_and_errors() {
        add_event({"Transfer",
                   {{"from", "address", true},
                    {"to", "address", true},
                    {"tokenId", "uint256", true}}});
        add_event({"Approval",
                   {{"owner", "address", true},
                    {"approved", "address", true},
                    {"tokenId", "uint256", true}}});
        add_event({"ApprovalForAll",
                   {{"owner", "address", true},
                    {"operator", "address", true},
                    {"approved", "bool", false}}});

        add_error(invalid_sender_error());
        add_error(incorrect_owner_error());
        add_error(insufficient_approval_error());
        add_error(nonexistent_token_error());
        add_error(invalid_approver_error());
        add_error(max_supply_error());
    }

    auto nft_contract::revert_for(error_code err,
                                  const evmc::address& caller,
                                  const evmc::uint256be& token_id,
                                  const std::optional<evmc::address>& from)
        -> call_result {
        switch(err) {
            case error_code::already_minted:
                return revert_error(invalid_sender_error(),
                                    encoder().add_address(evmc::address{}));
            case error_code::not_owner: {
                auto owner = m_engine->owner_of(token_id);
                if(std::holds_alternative<error_code>(owner)) {
                    return revert_for(std::get<error_code>(owner),
                                      caller,
                                      token_id,
                                      from);
                }
                if(!from.has_value()) {
                    return revert_error(invalid_approver_error(),
                                        encoder().add_address(caller));
                }
                return revert_error(
                    incorrect_owner_error(),
                    encoder()
                        .add_address(from.value())
                        .add_uint(token_id)
                        .add_address(std::get<evmc::address>(owner)));
            }
            case error_code::not_approved:
                return revert_error(
                    insufficient_approval_error(),
                    encoder().add_address(caller).add_uint(token_id));
            case error_code::nonexistent_token:
                return revert_error(nonexistent_token_error(),
                                    encoder().add_uint(token_id));
            case error_code::max_supply_reached:
                return revert_error(
                    max_supply_error(),
                    encoder().add_uint(m_engine->max_supply()));
            case error_code::arithmetic_overflow:
            case error_code::arithmetic_underflow:
                return panic(panic_arithmetic);
            case error_code::insufficient_balance:
            case error_code::insufficient_allowance:
            case error_code::storage_failure:
                break;
        }
        return revert();
    }

    auto nft_contract::handle_name(const evmc::address& /* caller */,
                                   const decoder& /* dec */)
        -> std::optional<call_result> {
        return success(encoder().add_string(m_engine->name()).data());
    }

    auto nft_contract::handle_symbol(const evmc::address& /* caller */,
                                     const decoder& /* dec */)
        -> std::optional<call_result> {
        return success(encoder().add_string(m_engine->symbol()).data());
    }

    auto nft_contract::handle_token_uri(const evmc::address& caller,
                                        const decoder& dec)
        -> std::optional<call_result> {
        auto token_id = dec.get_uint(0);
        if(!token_id.has_value()) {
            return std::nullopt;
        }
        auto res = m_engine->token_uri(token_id.value());
        if(std::holds_alternative<error_code>(res)) {
            return revert_for(std::get<error_code>(res),
                              caller,
                              token_id.value(),
                              std::nullopt);
        }
        return success(
            encoder().add_string(std::get<std::string>(res)).data());
    }

    auto nft_contract::handle_balance_of(const evmc::address& caller,
                                         const decoder& dec)
        -> std::optional<call_result> {
        auto owner = dec.get_address(0);
        if(!owner.has_value()) {
            return std::nullopt;
        }
        auto res = m_engine->balance_of(owner.value());
        if(std::holds_alternative<error_code>(res)) {
            return revert_for(std::get<error_code>(res),
                              caller,
                              evmc::uint256be{},
                              std::nullopt);
        }
        return success(
            encoder().add_uint(std::get<evmc::uint256be>(res)).data());
    }

    auto nft_contract::handle_owner_of(const evmc::address& caller,
                                       const decoder& dec)
        -> std::optional<call_result> {
        auto token_id = dec.get_uint(0);
        if(!token_id.has_value()) {
            return std::nullopt;
        }
        auto res = m_engine->owner_of(token_id.value());
        if(std::holds_alternative<error_code>(res)) {
            return revert_for(std::get<error_code>(res),
                              caller,
                              token_id.value(),
                              std::nullopt);
        }
        return success(
            encoder().add_address(std::get<evmc::address>(res)).data());
    }

    auto nft_contract::handle_get_approved(const evmc::address& caller,
                                           const decoder& dec)
        -> std::optional<call_result> {
        auto token_id = dec.get_uint(0);
        if(!token_id.has_value()) {
            return std::nullopt;
        }
        auto res = m_engine->get_approved(token_id.value());
        if(std::holds_alternative<error_code>(res)) {
            return revert_for(std::get<error_code>(res),
                              caller,
                              token_id.value(),
                              std::nullopt);
        }
        return success(
            encoder().add_address(std::get<evmc::address>(res)).data());
    }

    auto nft_contract::handle_is_approved_for_all(const evmc::address& caller,
                                                  const decoder& dec)
        -> std::optional<call_result> {
        auto owner = dec.get_address(0);
        auto op = dec.get_address(1);
        if(!owner.has_value() || !op.has_value()) {
            return std::nullopt;
        }
        auto res = m_engine->is_approved_for_all(owner.value(), op.value());
        if(std::holds_alternative<error_code>(res)) {
            return revert_for(std::get<error_code>(res),
                              caller,
                              evmc::uint256be{},
                              std::nullopt);
        }
        return success(encoder().add_bool(std::get<bool>(res)).data());
    }

    auto nft_contract::handle_total_minted(const evmc::address& caller,
                                           const decoder& /* dec */)
        -> std::optional<call_result> {
        auto res = m_engine->total_minted();
        if(std::holds_alternative<error_code>(res)) {
            return revert_for(std::get<error_code>(res),
                              caller,
                              evmc::uint256be{},
                              std::nullopt);
        }
        return success(
            encoder().add_uint(std::get<evmc::uint256be>(res)).data());
    }

    auto nft_contract::handle_max_supply(const evmc::address& /* caller */,
                                         const decoder& /* dec */)
        -> std::optional<call_result> {
        return success(encoder().add_uint(m_engine->max_supply()).data());
    }

    auto nft_contract::handle_get_owner(const evmc::address& /* caller */,
                                        const decoder& /* dec */)
        -> std::optional<call_result> {
        return success(
            encoder().add_address(m_engine->contract_owner()).data());
    }

    auto nft_contract::handle_supports_interface(
        const evmc::address& /* caller */,
        const decoder& dec) -> std::optional<call_result> {
        auto interface_id = dec.get_bytes4(0);
        if(!interface_id.has_value()) {
            return std::nullopt;
        }
        const auto supported
            = nft::engine::supports_interface(interface_id.value());
        return success(encoder().add_bool(supported).data());
    }

    auto nft_contract::handle_mint(const evmc::address& caller,
                                   const decoder& dec)
        -> std::optional<call_result> {
        auto to = dec.get_address(0);
        auto token_id = dec.get_uint(1);
        if(!to.has_value() || !token_id.has_value()) {
            return std::nullopt;
        }
        auto err = m_engine->mint(caller, to.value(), token_id.value());
        if(err.has_value()) {
            return revert_for(err.value(),
                              caller,
                              token_id.value(),
                              std::nullopt);
        }
        return success();
    }

    auto nft_contract::handle_mint_uri(const evmc::address& caller,
                                       const decoder& dec)
        -> std::optional<call_result> {
        auto to = dec.get_address(0);
        auto uri = dec.get_string(1);
        if(!to.has_value() || !uri.has_value()) {
            return std::nullopt;
        }
        auto res = m_engine->mint_next(caller, to.value(), uri.value());
        if(std::holds_alternative<error_code>(res)) {
            return revert_for(std::get<error_code>(res),
                              caller,
                              evmc::uint256be{},
                              std::nullopt);
        }
        return success(
            encoder().add_uint(std::get<evmc::uint256be>(res)).data());
    }

    auto nft_contract::handle_transfer_from(const evmc::address& caller,
                                            const decoder& dec)
        -> std::optional<call_result> {
        auto from = dec.get_address(0);
        auto to = dec.get_address(1);
        auto token_id = dec.get_uint(2);
        if(!from.has_value() || !to.has_value() || !token_id.has_value()) {
            return std::nullopt;
        }
        auto err = m_engine->transfer_from(caller,
                                           from.value(),
                                           to.value(),
                                           token_id.value());
        if(err.has_value()) {
            return revert_for(err.value(), caller, token_id.value(), from);
        }
        return success();
    }

    auto nft_contract::handle_approve(const evmc::address& caller,
                                      const decoder& dec)
        -> std::optional<call_result> {
        auto spender = dec.get_address(0);
        auto token_id = dec.get_uint(1);
        if(!spender.has_value() || !token_id.has_value()) {
            return std::nullopt;
        }
        auto err
            = m_engine->approve(caller, spender.value(), token_id.value());
        if(err.has_value()) {
            return revert_for(err.value(),
                              caller,
                              token_id.value(),
                              std::nullopt);
        }
        return success();
    }

    auto nft_contract::handle_set_approval_for_all(const evmc::address& caller,
                                                   const decoder& dec)
        -> std::optional<call_result> {
        auto op = dec.get_address(0);
        auto approved = dec.get_bool(1);
        if(!op.has_value() || !approved.has_value()) {
            return std::nullopt;
        }
        auto err = m_engine->set_approval_for_all(caller,
                                                  op.value(),
                                                  approved.value());
        if(err.has_value()) {
            return revert_for(err.value(),
                              caller,
                              evmc::uint256be{},
                              std::nullopt);
        }
        return success();
    }
}
