// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_TOOLS_CLI_COMMANDS_H_
#define ERC_LEDGER_TOOLS_CLI_COMMANDS_H_

#include "abi/contract.hpp"
#include "ledger/interface.hpp"
#include "token/config.hpp"
#include "util/common/logging.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

/// Commands of the erc-ledger command line client. Results and errors are
/// printed to stdout and stderr.
namespace erc::cli {
    /// Command line arguments following the command name.
    using params_type = std::vector<std::string>;

    /// Prints the address derived from a hex-encoded private key.
    /// \param key_hex 32 byte private key, optionally 0x prefixed.
    /// \return true if the key was valid.
    auto address_command(const std::string& key_hex) -> bool;

    /// Dispatches raw calldata: <caller> <calldata hex>.
    /// \return true if the call succeeded.
    auto call_command(abi::contract& c, const params_type& params) -> bool;

    /// Runs an ERC-721 convenience command. "mint" takes a token id and
    /// "mint-uri" takes a metadata URI for the next auto-assigned id.
    /// \param c contract built over an NFT engine.
    /// \param command command name.
    /// \param params command arguments.
    /// \return whether the command succeeded, or std::nullopt if the
    ///         command is unknown.
    auto nft_command(abi::contract& c,
                     const std::string& command,
                     const params_type& params) -> std::optional<bool>;

    /// Runs an ERC-20 convenience command.
    /// \param c contract built over a fungible engine.
    /// \param command command name.
    /// \param params command arguments.
    /// \return whether the command succeeded, or std::nullopt if the
    ///         command is unknown.
    auto fungible_command(abi::contract& c,
                          const std::string& command,
                          const params_type& params) -> std::optional<bool>;

    /// Builds the contract selected by the configured token standard.
    /// \param opts loaded options.
    /// \param st ledger store.
    /// \param logger log instance.
    /// \param fresh true if the ledger was just created, in which case the
    ///              configured initial supply is minted.
    /// \return the contract, or nullptr if the initial mint failed.
    auto make_contract(const config::options& opts,
                       std::shared_ptr<ledger::store> st,
                       const std::shared_ptr<logging::log>& logger,
                       bool fresh) -> std::unique_ptr<abi::contract>;
}

#endif // ERC_LEDGER_TOOLS_CLI_COMMANDS_H_
