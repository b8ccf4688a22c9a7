// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_ABI_JSON_H_
#define ERC_LEDGER_SRC_ABI_JSON_H_

#include "messages.hpp"

#include <json/json.h>

namespace erc::abi {
    /// Converts a function description to its Solidity JSON ABI entry.
    auto function_to_json(const function_spec& fn) -> Json::Value;

    /// Converts an event description to its Solidity JSON ABI entry.
    auto event_to_json(const event_spec& ev) -> Json::Value;

    /// Converts a custom error description to its Solidity JSON ABI entry.
    auto error_to_json(const error_spec& err) -> Json::Value;

    /// Builds a Solidity JSON ABI array of functions, then events, then
    /// errors.
    auto abi_to_json(const std::vector<function_spec>& functions,
                     const std::vector<event_spec>& events,
                     const std::vector<error_spec>& errors) -> Json::Value;

    /// Renders a JSON value as indented text.
    auto json_to_string(const Json::Value& val) -> std::string;
}

#endif // ERC_LEDGER_SRC_ABI_JSON_H_
