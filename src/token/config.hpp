// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file config.hpp
 * Token ledger options and their configuration file keys.
 */

#ifndef ERC_LEDGER_SRC_TOKEN_CONFIG_H_
#define ERC_LEDGER_SRC_TOKEN_CONFIG_H_

#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <evmc/evmc.hpp>
#include <optional>
#include <string>
#include <variant>

namespace erc::config {
    namespace defaults {
        static constexpr auto log_level = logging::log_level::warn;
        static constexpr uint8_t decimals = 18;
    }

    static constexpr auto token_standard_key = "token_standard";
    static constexpr auto name_key = "name";
    static constexpr auto symbol_key = "symbol";
    static constexpr auto decimals_key = "decimals";
    static constexpr auto base_uri_key = "base_uri";
    static constexpr auto max_supply_key = "max_supply";
    static constexpr auto contract_address_key = "contract_address";
    static constexpr auto contract_owner_key = "contract_owner";
    static constexpr auto initial_supply_key = "initial_supply";
    static constexpr auto initial_holder_key = "initial_holder";
    static constexpr auto db_dir_key = "db_dir";
    static constexpr auto loglevel_key = "loglevel";

    /// Token standard implemented by a ledger.
    enum class token_standard : uint8_t {
        /// Non-fungible tokens.
        erc721,
        /// Fungible tokens.
        erc20
    };

    /// Project-wide configuration options.
    struct options {
        /// Token standard of the ledger.
        token_standard m_standard{token_standard::erc721};
        /// Token or collection name.
        std::string m_name;
        /// Token or collection symbol.
        std::string m_symbol;
        /// Display decimals of a fungible token.
        uint8_t m_decimals{defaults::decimals};
        /// Prefix for non-fungible token URIs.
        std::string m_base_uri;
        /// Maximum number of non-fungible tokens, zero for no limit.
        evmc::uint256be m_max_supply{};
        /// Address attached to emitted logs.
        evmc::address m_contract_address{};
        /// Address reported as the collection owner.
        evmc::address m_contract_owner{};
        /// Amount minted to the initial holder when a fungible ledger is
        /// created.
        evmc::uint256be m_initial_supply{};
        /// Recipient of the initial supply.
        std::optional<evmc::address> m_initial_holder;
        /// Directory of the LevelDB ledger database.
        std::string m_db_dir;
        /// Log level.
        logging::log_level m_loglevel{defaults::log_level};
    };

    /// Parses the token standard name.
    /// \param name "erc721" or "erc20", case-insensitive.
    /// \return the standard, or std::nullopt if the name is not recognized.
    auto parse_token_standard(const std::string& name)
        -> std::optional<token_standard>;

    /// Reads the configuration parameters from the given file without
    /// checking their consistency.
    /// \param config_file path of the file to read.
    /// \return the options, or a description of the first invalid value.
    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Reads and checks the configuration parameters from the given file.
    /// \param config_file path of the file to read.
    /// \return the options, or a description of the problem.
    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Checks a set of options for consistency.
    /// \param opts options to check.
    /// \return std::nullopt if the options are consistent, or a description
    ///         of the problem.
    auto check_options(const options& opts) -> std::optional<std::string>;
}

#endif // ERC_LEDGER_SRC_TOKEN_CONFIG_H_
