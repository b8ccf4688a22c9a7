// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "error.hpp"

namespace erc {
    auto to_string(error_code err) -> std::string {
        switch(err) {
            case error_code::already_minted:
                return "already_minted";
            case error_code::not_owner:
                return "not_owner";
            case error_code::not_approved:
                return "not_approved";
            case error_code::insufficient_balance:
                return "insufficient_balance";
            case error_code::insufficient_allowance:
                return "insufficient_allowance";
            case error_code::arithmetic_overflow:
                return "arithmetic_overflow";
            case error_code::arithmetic_underflow:
                return "arithmetic_underflow";
            case error_code::nonexistent_token:
                return "nonexistent_token";
            case error_code::max_supply_reached:
                return "max_supply_reached";
            case error_code::storage_failure:
                return "storage_failure";
        }
        return "unknown_error";
    }
}
