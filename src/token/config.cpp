// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace erc::config {
    namespace {
        auto read_address(const parser& cfg,
                          const std::string& key,
                          std::optional<evmc::address>& out)
            -> std::optional<std::string> {
            const auto text = cfg.get_text(key);
            if(!text.has_value()) {
                return std::nullopt;
            }
            auto addr = from_hex<evmc::address>(text.value());
            if(!addr.has_value()) {
                return "Invalid address for " + key + " (" + text.value()
                     + ")";
            }
            out = addr;
            return std::nullopt;
        }

        auto read_amount(const parser& cfg,
                         const std::string& key,
                         evmc::uint256be& out) -> std::optional<std::string> {
            const auto text = cfg.get_text(key);
            if(!text.has_value()) {
                return std::nullopt;
            }
            auto val = parse_uint256(text.value());
            if(!val.has_value()) {
                return "Invalid 256-bit value for " + key + " ("
                     + text.value() + ")";
            }
            out = val.value();
            return std::nullopt;
        }

        auto read_token_options(options& opts, const parser& cfg)
            -> std::optional<std::string> {
            const auto standard_str
                = cfg.get_text(token_standard_key).value_or("erc721");
            const auto standard = parse_token_standard(standard_str);
            if(!standard.has_value()) {
                return "Unknown token standard (" + standard_str + ")";
            }
            opts.m_standard = standard.value();

            opts.m_name = cfg.get_text(name_key).value_or("");
            opts.m_symbol = cfg.get_text(symbol_key).value_or("");
            opts.m_base_uri = cfg.get_text(base_uri_key).value_or("");

            const auto decimals
                = cfg.get_ulong(decimals_key).value_or(defaults::decimals);
            if(decimals > std::numeric_limits<uint8_t>::max()) {
                return "Decimals must fit in 8 bits ("
                     + std::to_string(decimals) + ")";
            }
            opts.m_decimals = static_cast<uint8_t>(decimals);

            if(auto err = read_amount(cfg, max_supply_key, opts.m_max_supply)) {
                return err;
            }
            return read_amount(cfg, initial_supply_key, opts.m_initial_supply);
        }

        auto read_address_options(options& opts, const parser& cfg)
            -> std::optional<std::string> {
            auto addr = std::optional<evmc::address>();
            if(auto err = read_address(cfg, contract_address_key, addr)) {
                return err;
            }
            opts.m_contract_address = addr.value_or(evmc::address{});

            addr.reset();
            if(auto err = read_address(cfg, contract_owner_key, addr)) {
                return err;
            }
            opts.m_contract_owner = addr.value_or(evmc::address{});

            return read_address(cfg, initial_holder_key, opts.m_initial_holder);
        }
    }

    auto parse_token_standard(const std::string& name)
        -> std::optional<token_standard> {
        auto lower = name;
        std::transform(lower.begin(),
                       lower.end(),
                       lower.begin(),
                       [](unsigned char c) {
                           return std::tolower(c);
                       });
        if(lower == "erc721") {
            return token_standard::erc721;
        }
        if(lower == "erc20") {
            return token_standard::erc20;
        }
        return std::nullopt;
    }

    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto opts = options{};
        auto cfg = parser(config_file);
        if(!cfg.good()) {
            return "Unable to read configuration file " + config_file;
        }

        auto err = read_token_options(opts, cfg);
        if(err.has_value()) {
            return err.value();
        }

        err = read_address_options(opts, cfg);
        if(err.has_value()) {
            return err.value();
        }

        opts.m_db_dir = cfg.get_text(db_dir_key).value_or("");
        opts.m_loglevel
            = cfg.get_loglevel(loglevel_key).value_or(defaults::log_level);

        return opts;
    }

    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto opt = read_options(config_file);
        if(std::holds_alternative<options>(opt)) {
            auto res = check_options(std::get<options>(opt));
            if(res) {
                return *res;
            }
        }
        return opt;
    }

    auto check_options(const options& opts) -> std::optional<std::string> {
        if(opts.m_name.empty()) {
            return "No token name specified (" + std::string(name_key) + ")";
        }
        if(opts.m_symbol.empty()) {
            return "No token symbol specified (" + std::string(symbol_key)
                 + ")";
        }
        if(opts.m_standard == token_standard::erc721) {
            if(!evmc::is_zero(opts.m_initial_supply)) {
                return "An initial supply can only be minted for erc20 "
                       "tokens";
            }
        } else {
            if(!evmc::is_zero(opts.m_max_supply)) {
                return "A maximum supply can only be set for erc721 tokens";
            }
            if(!evmc::is_zero(opts.m_initial_supply)
               && !opts.m_initial_holder.has_value()) {
                return "An initial supply requires an initial holder ("
                     + std::string(initial_holder_key) + ")";
            }
        }
        return std::nullopt;
    }
}
