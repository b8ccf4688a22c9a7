// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_TOKEN_MATH_H_
#define ERC_LEDGER_SRC_TOKEN_MATH_H_

#include <evmc/evmc.hpp>
#include <optional>
#include <string>

namespace erc {
    /// Adds two uint256be values.
    /// \param lhs first value.
    /// \param rhs second value.
    /// \return sum of both values, or std::nullopt if the sum does not fit in
    ///         256 bits.
    auto checked_add(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be>;

    /// Subtracts two uint256be values.
    /// \param lhs value to subtract from.
    /// \param rhs value to subtract.
    /// \return lhs - rhs, or std::nullopt if rhs is greater than lhs.
    auto checked_sub(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be>;

    /// Returns the largest representable uint256be value, 2^256 - 1.
    auto max_uint256() -> evmc::uint256be;

    /// Converts an uint256be to a uint64_t, ignoring higher order bits.
    /// \param v bignum to convert.
    /// \return converted bignum.
    auto to_uint64(const evmc::uint256be& v) -> uint64_t;

    /// Widens a uint64_t to a uint256be.
    auto from_uint64(uint64_t v) -> evmc::uint256be;

    /// Renders a uint256be as a base-10 string without leading zeros.
    /// \param v value to render.
    /// \return decimal representation of v.
    auto to_decimal(const evmc::uint256be& v) -> std::string;

    /// Parses a base-10 string into a uint256be.
    /// \param dec string of decimal digits.
    /// \return parsed value, or std::nullopt if the string is empty, contains
    ///         a non-digit, or the value does not fit in 256 bits.
    auto from_decimal(const std::string& dec)
        -> std::optional<evmc::uint256be>;
}

#endif // ERC_LEDGER_SRC_TOKEN_MATH_H_
