// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "commands.hpp"

#include "abi/fungible_contract.hpp"
#include "abi/nft_contract.hpp"
#include "token/math.hpp"
#include "token/util.hpp"

#include <cstring>
#include <iostream>
#include <utility>

namespace erc::cli {
    namespace {
        auto parse_address(const std::string& str)
            -> std::optional<evmc::address> {
            auto addr = erc::from_hex<evmc::address>(str);
            if(!addr.has_value()) {
                std::cerr << "Invalid address: " << str << std::endl;
            }
            return addr;
        }

        auto parse_amount(const std::string& str)
            -> std::optional<evmc::uint256be> {
            auto val = erc::parse_uint256(str);
            if(!val.has_value()) {
                std::cerr << "Invalid 256-bit value: " << str << std::endl;
            }
            return val;
        }

        auto parse_bool(const std::string& str) -> std::optional<bool> {
            if(str == "true" || str == "1") {
                return true;
            }
            if(str == "false" || str == "0") {
                return false;
            }
            std::cerr << "Invalid boolean: " << str << std::endl;
            return std::nullopt;
        }

        void print_result(const erc::abi::call_result& res) {
            std::cout << (res.m_success ? "success" : "reverted") << std::endl;
            std::cout << "output: " << res.m_output.to_hex_prefixed()
                      << std::endl;
            for(const auto& log : res.m_logs) {
                std::cout << "log: " << "0x" << erc::to_hex(log.m_addr);
                for(const auto& t : log.m_topics) {
                    std::cout << " 0x" << erc::to_hex(t);
                }
                std::cout << " data: " << log.m_data.to_hex_prefixed()
                          << std::endl;
            }
        }

        /// Dispatches calldata and prints the result.
        auto invoke(erc::abi::contract& c,
                    const evmc::address& caller,
                    const erc::buffer& calldata) -> bool {
            auto res = c.call(caller, calldata);
            print_result(res);
            return res.m_success;
        }

        /// Dispatches a view call and prints its first return word with the
        /// given printer.
        template<typename F>
        auto view(erc::abi::contract& c, const erc::buffer& calldata, F&& print)
            -> bool {
            auto res = c.call(evmc::address{}, calldata);
            if(!res.m_success) {
                print_result(res);
                return false;
            }
            auto dec = erc::abi::decoder(res.m_output, 0);
            return print(dec);
        }

        /// Commands shared by both standards taking <caller> <address> <value>.
        auto caller_address_value_command(erc::abi::contract& c,
                                          const std::string& sig,
                                          const params_type& params) -> bool {
            if(params.size() < 3) {
                std::cerr << sig << " requires args <caller> <address> <value>"
                          << std::endl;
                return false;
            }
            auto caller = parse_address(params[0]);
            auto addr = parse_address(params[1]);
            auto value = parse_amount(params[2]);
            if(!caller || !addr || !value) {
                return false;
            }
            auto calldata = erc::abi::encoder()
                                .add_address(addr.value())
                                .add_uint(value.value())
                                .data(erc::abi::selector(sig));
            return invoke(c, caller.value(), calldata);
        }

        auto transfer_from_command(erc::abi::contract& c,
                                   const params_type& params) -> bool {
            if(params.size() < 4) {
                std::cerr << "transfer-from requires args <caller> <from> <to> "
                             "<value>"
                          << std::endl;
                return false;
            }
            auto caller = parse_address(params[0]);
            auto from = parse_address(params[1]);
            auto to = parse_address(params[2]);
            auto value = parse_amount(params[3]);
            if(!caller || !from || !to || !value) {
                return false;
            }
            auto calldata
                = erc::abi::encoder()
                      .add_address(from.value())
                      .add_address(to.value())
                      .add_uint(value.value())
                      .data(erc::abi::selector("transferFrom(address,address,"
                                               "uint256)"));
            return invoke(c, caller.value(), calldata);
        }

        auto balance_command(erc::abi::contract& c, const params_type& params)
            -> bool {
            if(params.empty()) {
                std::cerr << "balance requires args <owner>" << std::endl;
                return false;
            }
            auto owner = parse_address(params[0]);
            if(!owner) {
                return false;
            }
            auto calldata = erc::abi::encoder()
                                .add_address(owner.value())
                                .data(erc::abi::selector("balanceOf(address)"));
            return view(c, calldata, [](const erc::abi::decoder& dec) {
                auto bal = dec.get_uint(0);
                if(!bal) {
                    return false;
                }
                std::cout << erc::to_decimal(bal.value()) << std::endl;
                return true;
            });
        }

        auto nft_mint_command(erc::abi::contract& c, const params_type& params)
            -> bool {
            if(params.size() < 3) {
                std::cerr << "mint requires args <caller> <to> <token id>"
                          << std::endl;
                return false;
            }
            auto caller = parse_address(params[0]);
            auto to = parse_address(params[1]);
            auto token_id = parse_amount(params[2]);
            if(!caller || !to || !token_id) {
                return false;
            }
            auto calldata
                = erc::abi::encoder()
                      .add_address(to.value())
                      .add_uint(token_id.value())
                      .data(erc::abi::selector("mint(address,uint256)"));
            return invoke(c, caller.value(), calldata);
        }

        auto nft_mint_uri_command(erc::abi::contract& c,
                                  const params_type& params) -> bool {
            if(params.size() < 3) {
                std::cerr << "mint-uri requires args <caller> <to> <uri>"
                          << std::endl;
                return false;
            }
            auto caller = parse_address(params[0]);
            auto to = parse_address(params[1]);
            if(!caller || !to) {
                return false;
            }
            auto calldata
                = erc::abi::encoder()
                      .add_address(to.value())
                      .add_string(params[2])
                      .data(erc::abi::selector("mint(address,string)"));
            return invoke(c, caller.value(), calldata);
        }

        auto owner_command(erc::abi::contract& c, const params_type& params)
            -> bool {
            if(params.empty()) {
                std::cerr << "owner requires args <token id>" << std::endl;
                return false;
            }
            auto token_id = parse_amount(params[0]);
            if(!token_id) {
                return false;
            }
            auto calldata = erc::abi::encoder()
                                .add_uint(token_id.value())
                                .data(erc::abi::selector("ownerOf(uint256)"));
            return view(c, calldata, [](const erc::abi::decoder& dec) {
                auto owner = dec.get_address(0);
                if(!owner) {
                    return false;
                }
                std::cout << "0x" << erc::to_hex(owner.value()) << std::endl;
                return true;
            });
        }

        auto token_uri_command(erc::abi::contract& c, const params_type& params)
            -> bool {
            if(params.empty()) {
                std::cerr << "token-uri requires args <token id>" << std::endl;
                return false;
            }
            auto token_id = parse_amount(params[0]);
            if(!token_id) {
                return false;
            }
            auto calldata = erc::abi::encoder()
                                .add_uint(token_id.value())
                                .data(erc::abi::selector("tokenURI(uint256)"));
            return view(c, calldata, [](const erc::abi::decoder& dec) {
                auto uri = dec.get_string(0);
                if(!uri) {
                    return false;
                }
                std::cout << uri.value() << std::endl;
                return true;
            });
        }

        auto set_approval_for_all_command(erc::abi::contract& c,
                                          const params_type& params) -> bool {
            if(params.size() < 3) {
                std::cerr << "set-approval-for-all requires args <caller> "
                             "<operator> <true|false>"
                          << std::endl;
                return false;
            }
            auto caller = parse_address(params[0]);
            auto op = parse_address(params[1]);
            auto approved = parse_bool(params[2]);
            if(!caller || !op || !approved) {
                return false;
            }
            auto calldata
                = erc::abi::encoder()
                      .add_address(op.value())
                      .add_bool(approved.value())
                      .data(erc::abi::selector(
                          "setApprovalForAll(address,bool)"));
            return invoke(c, caller.value(), calldata);
        }

        auto allowance_command(erc::abi::contract& c, const params_type& params)
            -> bool {
            if(params.size() < 2) {
                std::cerr << "allowance requires args <owner> <spender>"
                          << std::endl;
                return false;
            }
            auto owner = parse_address(params[0]);
            auto spender = parse_address(params[1]);
            if(!owner || !spender) {
                return false;
            }
            auto calldata
                = erc::abi::encoder()
                      .add_address(owner.value())
                      .add_address(spender.value())
                      .data(erc::abi::selector("allowance(address,address)"));
            return view(c, calldata, [](const erc::abi::decoder& dec) {
                auto val = dec.get_uint(0);
                if(!val) {
                    return false;
                }
                std::cout << erc::to_decimal(val.value()) << std::endl;
                return true;
            });
        }
    }

    auto address_command(const std::string& key_hex) -> bool {
        auto key_buf = erc::buffer::from_hex_prefixed(key_hex);
        auto key = erc::privkey_t();
        if(!key_buf.has_value() || key_buf->size() != key.size()) {
            std::cerr << "Private key must be 32 hex-encoded bytes"
                      << std::endl;
            return false;
        }
        std::memcpy(key.data(), key_buf->data(), key.size());
        auto addr = erc::eth_addr(key, erc::make_secp_context());
        if(!addr.has_value()) {
            std::cerr << "Invalid private key" << std::endl;
            return false;
        }
        std::cout << "0x" << erc::to_hex(addr.value()) << std::endl;
        return true;
    }

    auto call_command(erc::abi::contract& c, const params_type& params)
        -> bool {
        if(params.size() < 2) {
            std::cerr << "call requires args <caller> <calldata hex>"
                      << std::endl;
            return false;
        }
        auto caller = parse_address(params[0]);
        auto calldata = erc::buffer::from_hex_prefixed(params[1]);
        if(!caller.has_value()) {
            return false;
        }
        if(!calldata.has_value()) {
            std::cerr << "Invalid calldata encoding" << std::endl;
            return false;
        }
        return invoke(c, caller.value(), calldata.value());
    }

    auto nft_command(erc::abi::contract& c,
                     const std::string& command,
                     const params_type& params) -> std::optional<bool> {
        if(command == "mint") {
            return nft_mint_command(c, params);
        }
        if(command == "mint-uri") {
            return nft_mint_uri_command(c, params);
        }
        if(command == "transfer-from") {
            return transfer_from_command(c, params);
        }
        if(command == "approve") {
            return caller_address_value_command(c,
                                                "approve(address,uint256)",
                                                params);
        }
        if(command == "balance") {
            return balance_command(c, params);
        }
        if(command == "owner") {
            return owner_command(c, params);
        }
        if(command == "token-uri") {
            return token_uri_command(c, params);
        }
        if(command == "set-approval-for-all") {
            return set_approval_for_all_command(c, params);
        }
        return std::nullopt;
    }

    auto fungible_command(erc::abi::contract& c,
                          const std::string& command,
                          const params_type& params) -> std::optional<bool> {
        if(command == "mint") {
            return caller_address_value_command(c,
                                                "mint(address,uint256)",
                                                params);
        }
        if(command == "burn") {
            return caller_address_value_command(c,
                                                "burn(address,uint256)",
                                                params);
        }
        if(command == "transfer") {
            return caller_address_value_command(c,
                                                "transfer(address,uint256)",
                                                params);
        }
        if(command == "transfer-from") {
            return transfer_from_command(c, params);
        }
        if(command == "approve") {
            return caller_address_value_command(c,
                                                "approve(address,uint256)",
                                                params);
        }
        if(command == "balance") {
            return balance_command(c, params);
        }
        if(command == "allowance") {
            return allowance_command(c, params);
        }
        return std::nullopt;
    }

    auto make_contract(const erc::config::options& opts,
                       std::shared_ptr<erc::ledger::store> st,
                       const std::shared_ptr<erc::logging::log>& logger,
                       bool fresh) -> std::unique_ptr<erc::abi::contract> {
        if(opts.m_standard == erc::config::token_standard::erc721) {
            auto meta = erc::nft::metadata{opts.m_name,
                                           opts.m_symbol,
                                           opts.m_base_uri,
                                           opts.m_max_supply,
                                           opts.m_contract_owner};
            auto eng = std::make_shared<erc::nft::engine>(std::move(meta),
                                                          std::move(st),
                                                          logger);
            return std::make_unique<erc::abi::nft_contract>(
                opts.m_contract_address,
                std::move(eng),
                logger);
        }

        auto meta = erc::fungible::metadata{opts.m_name,
                                            opts.m_symbol,
                                            opts.m_decimals};
        auto eng = std::make_shared<erc::fungible::engine>(std::move(meta),
                                                           std::move(st),
                                                           logger);
        if(fresh && !evmc::is_zero(opts.m_initial_supply)) {
            auto err = eng->mint(opts.m_contract_owner,
                                 opts.m_initial_holder.value(),
                                 opts.m_initial_supply);
            if(err.has_value()) {
                logger->error("Failed to mint the initial supply:",
                              erc::to_string(err.value()));
                return nullptr;
            }
            logger->info("Minted initial supply of",
                         erc::to_decimal(opts.m_initial_supply));
        }
        return std::make_unique<erc::abi::fungible_contract>(
            opts.m_contract_address,
            std::move(eng),
            logger);
    }
}
