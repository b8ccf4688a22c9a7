// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <cstdint>
#include <cstring>
#include <ethash/keccak.hpp>
#include <iomanip>
#include <sstream>

namespace erc {
    auto to_string(const hash_t& val) -> std::string {
        std::stringstream ret;
        ret << std::hex << std::setfill('0');

        for(const auto& byte : val) {
            ret << std::setw(2) << static_cast<int>(byte);
        }

        return ret.str();
    }

    auto keccak_data(const void* data, size_t len) -> hash_t {
        hash_t ret{};
        auto resp = ethash::keccak256(static_cast<const uint8_t*>(data), len);
        std::memcpy(ret.data(), resp.bytes, sizeof(resp.bytes));
        return ret;
    }
}
