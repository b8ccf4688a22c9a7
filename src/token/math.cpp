// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "math.hpp"

#include <algorithm>
#include <limits>

// Until std::span is available in C++20, we don't have a bounds-checked way
// to access the data behind evmc::uint256be.
// NOLINTBEGIN(cppcoreguidelines-pro-bounds-constant-array-index)
namespace erc {
    namespace {
        constexpr uint64_t byte_max = std::numeric_limits<uint8_t>::max();
        constexpr uint64_t decimal_base = 10;

        /// Divides v in place by a small divisor, returning the remainder.
        auto div_small(evmc::uint256be& v, uint64_t divisor) -> uint64_t {
            uint64_t rem{};
            constexpr auto bits_in_byte = 8;
            for(size_t i = 0; i < sizeof(v.bytes); i++) {
                const auto cur = (rem << bits_in_byte) | v.bytes[i];
                v.bytes[i] = static_cast<uint8_t>(cur / divisor);
                rem = cur % divisor;
            }
            return rem;
        }

        /// Computes v * mul + add in place. Returns false on overflow.
        auto mul_add_small(evmc::uint256be& v, uint64_t mul, uint64_t add)
            -> bool {
            auto carry = add;
            constexpr auto bits_in_byte = 8;
            for(int i = sizeof(v.bytes) - 1; i >= 0; i--) {
                const auto cur = v.bytes[i] * mul + carry;
                v.bytes[i] = static_cast<uint8_t>(cur & byte_max);
                carry = cur >> bits_in_byte;
            }
            return carry == 0;
        }
    }

    auto checked_add(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be> {
        auto ret = evmc::uint256be{};
        auto tmp = uint64_t{};
        auto carry = uint8_t{};
        for(int i = sizeof(lhs.bytes) - 1; i >= 0; i--) {
            tmp = static_cast<uint64_t>(lhs.bytes[i]) + rhs.bytes[i] + carry;
            carry = static_cast<uint8_t>(tmp > byte_max);
            ret.bytes[i] = static_cast<uint8_t>(tmp & byte_max);
        }
        if(carry != 0) {
            return std::nullopt;
        }
        return ret;
    }

    auto checked_sub(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be> {
        if(lhs < rhs) {
            return std::nullopt;
        }
        auto ret = evmc::uint256be{};
        auto tmp1 = uint64_t{};
        auto tmp2 = uint64_t{};
        auto res = uint64_t{};
        auto borrow = uint8_t{};
        for(int i = sizeof(lhs.bytes) - 1; i >= 0; i--) {
            tmp1 = lhs.bytes[i] + (byte_max + 1);
            tmp2 = rhs.bytes[i] + static_cast<uint64_t>(borrow);
            res = tmp1 - tmp2;
            ret.bytes[i] = static_cast<uint8_t>(res & byte_max);
            borrow = static_cast<uint8_t>(res <= byte_max);
        }
        return ret;
    }

    auto max_uint256() -> evmc::uint256be {
        auto ret = evmc::uint256be{};
        std::fill(std::begin(ret.bytes),
                  std::end(ret.bytes),
                  static_cast<uint8_t>(byte_max));
        return ret;
    }

    auto to_uint64(const evmc::uint256be& v) -> uint64_t {
        return evmc::load64be(&v.bytes[sizeof(v.bytes) - sizeof(uint64_t)]);
    }

    auto from_uint64(uint64_t v) -> evmc::uint256be {
        auto ret = evmc::uint256be{};
        constexpr auto bits_in_byte = 8;
        for(int i = sizeof(ret.bytes) - 1; i >= 0 && v != 0; i--) {
            ret.bytes[i] = static_cast<uint8_t>(v & byte_max);
            v >>= bits_in_byte;
        }
        return ret;
    }

    auto to_decimal(const evmc::uint256be& v) -> std::string {
        if(evmc::is_zero(v)) {
            return "0";
        }
        auto tmp = v;
        auto ret = std::string();
        while(!evmc::is_zero(tmp)) {
            const auto digit = div_small(tmp, decimal_base);
            ret.push_back(static_cast<char>('0' + digit));
        }
        std::reverse(ret.begin(), ret.end());
        return ret;
    }

    auto from_decimal(const std::string& dec)
        -> std::optional<evmc::uint256be> {
        if(dec.empty()) {
            return std::nullopt;
        }
        auto ret = evmc::uint256be{};
        for(const auto c : dec) {
            if(c < '0' || c > '9') {
                return std::nullopt;
            }
            if(!mul_add_small(ret,
                              decimal_base,
                              static_cast<uint64_t>(c - '0'))) {
                return std::nullopt;
            }
        }
        return ret;
    }
}
// NOLINTEND(cppcoreguidelines-pro-bounds-constant-array-index)
