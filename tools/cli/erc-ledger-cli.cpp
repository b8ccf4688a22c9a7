// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "abi/json.hpp"
#include "commands.hpp"
#include "ledger/leveldb_store.hpp"
#include "ledger/memory_store.hpp"
#include "util/common/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace {
    constexpr auto command_arg_idx = 2;
    constexpr auto first_param_idx = 3;
}

// LCOV_EXCL_START
auto main(int argc, char** argv) -> int {
    auto args = erc::config::get_args(argc, argv);
    static constexpr auto min_arg_count = 3;
    if(args.size() < min_arg_count) {
        std::cerr << "Usage: " << args[0] << " <config file> <command>"
                  << " <args...>" << std::endl;
        return EXIT_FAILURE;
    }

    const auto command = args[command_arg_idx];
    const auto params
        = erc::cli::params_type(args.begin() + first_param_idx, args.end());

    if(command == "address") {
        if(params.empty()) {
            std::cerr << "address requires args <private key hex>"
                      << std::endl;
            return EXIT_FAILURE;
        }
        return erc::cli::address_command(params[0]) ? EXIT_SUCCESS
                                                    : EXIT_FAILURE;
    }

    auto cfg_or_err = erc::config::load_options(args[1]);
    if(std::holds_alternative<std::string>(cfg_or_err)) {
        std::cerr << "Error loading config file: "
                  << std::get<std::string>(cfg_or_err) << std::endl;
        return EXIT_FAILURE;
    }
    auto opts = std::get<erc::config::options>(cfg_or_err);

    auto logger = std::make_shared<erc::logging::log>(opts.m_loglevel);

    if(command == "abi") {
        auto st = std::make_shared<erc::ledger::memory_store>();
        auto c = erc::cli::make_contract(opts, st, logger, false);
        std::cout << erc::abi::json_to_string(c->abi()) << std::endl;
        return EXIT_SUCCESS;
    }

    if(opts.m_db_dir.empty()) {
        std::cerr << "No ledger database specified ("
                  << erc::config::db_dir_key << ")" << std::endl;
        return EXIT_FAILURE;
    }

    const auto fresh = !std::filesystem::exists(opts.m_db_dir);
    auto st = std::make_shared<erc::ledger::leveldb_store>();
    if(auto err = st->open(opts.m_db_dir)) {
        logger->error("Failed to open ledger database:", err.value());
        return EXIT_FAILURE;
    }

    auto c = erc::cli::make_contract(opts, st, logger, fresh);
    if(!c) {
        return EXIT_FAILURE;
    }

    auto res = std::optional<bool>();
    if(command == "call") {
        res = erc::cli::call_command(*c, params);
    } else if(opts.m_standard == erc::config::token_standard::erc721) {
        res = erc::cli::nft_command(*c, command, params);
    } else {
        res = erc::cli::fungible_command(*c, command, params);
    }

    if(!res.has_value()) {
        std::cerr << "Unknown command: " << command << std::endl;
        return EXIT_FAILURE;
    }
    return res.value() ? EXIT_SUCCESS : EXIT_FAILURE;
}
// LCOV_EXCL_STOP
