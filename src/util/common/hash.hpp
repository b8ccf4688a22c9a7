// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_UTIL_COMMON_HASH_H_
#define ERC_LEDGER_SRC_UTIL_COMMON_HASH_H_

#include <array>
#include <cstddef>
#include <string>

namespace erc {
    /// The size of the hashes used throughout the system, in bytes.
    static constexpr const int hash_size = 32;

    /// Keccak-256 hash container.
    using hash_t = std::array<unsigned char, erc::hash_size>;

    /// Converts a hash to a hexadecimal string.
    /// \param val hash to convert.
    /// \return hex representation of the hash.
    auto to_string(const hash_t& val) -> std::string;

    /// Calculates the Keccak256 hash of the specified data.
    /// \param data byte array containing data to hash.
    /// \param len the number of bytes of the data to hash.
    /// \return the hash of the data.
    auto keccak_data(const void* data, size_t len) -> hash_t;
}

#endif // ERC_LEDGER_SRC_UTIL_COMMON_HASH_H_
