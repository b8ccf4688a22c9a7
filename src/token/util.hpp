// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_TOKEN_UTIL_H_
#define ERC_LEDGER_SRC_TOKEN_UTIL_H_

#include "util/common/buffer.hpp"

#include <array>
#include <cstring>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <memory>
#include <optional>
#include <secp256k1.h>
#include <string>
#include <type_traits>

namespace erc {
    /// Private key type for deriving account addresses.
    using privkey_t = std::array<unsigned char, 32>;

    /// Converts a bytes-like object to a hex string.
    /// \tparam T type to convert from.
    /// \param v value to convert.
    /// \return hex string representation of v.
    template<typename T>
    auto to_hex(const T& v) -> std::string {
        return evmc::hex(evmc::bytes(v.bytes, sizeof(v.bytes)));
    }

    /// Parses hexadecimal representation in string format to T
    /// \tparam T type to convert from hex to.
    /// \param hex hex string to parse. May be prefixed with 0x
    /// \return object containing the parsed T or std::nullopt if
    /// parse failed
    template<typename T>
    auto from_hex(const std::string& hex) ->
        typename std::enable_if_t<std::is_same<T, evmc::bytes32>::value
                                      || std::is_same<T, evmc::address>::value,
                                  std::optional<T>> {
        auto maybe_bytes = erc::buffer::from_hex_prefixed(hex);
        if(!maybe_bytes.has_value()) {
            return std::nullopt;
        }
        if(maybe_bytes.value().size() != sizeof(T)) {
            return std::nullopt;
        }

        auto val = T();
        std::memcpy(val.bytes,
                    maybe_bytes.value().data(),
                    maybe_bytes.value().size());
        return val;
    }

    /// Generates a uint256be from a hex string. Shorter inputs are
    /// left-padded with zeros.
    /// \param hex string to parse.
    /// \return uint256be from string, or std::nullopt if input is not a valid
    ///         hex string.
    auto uint256be_from_hex(const std::string& hex)
        -> std::optional<evmc::uint256be>;

    /// Parses a 256-bit unsigned value written either in decimal or as a
    /// 0x-prefixed hex string.
    /// \param str value to parse.
    /// \return parsed value, or std::nullopt if the string is not a valid
    ///         256-bit number.
    auto parse_uint256(const std::string& str)
        -> std::optional<evmc::uint256be>;

    /// Calculates an eth address from a private key
    /// \param key key to calculate the address for
    /// \param ctx secp256k1 context to use
    /// \return the address corresponding to the passed private key, or
    ///         std::nullopt if the key is not a valid secp256k1 secret.
    auto eth_addr(const privkey_t& key,
                  const std::shared_ptr<secp256k1_context>& ctx)
        -> std::optional<evmc::address>;

    /// Calculates an eth address from a public key
    /// \param pk key to calculate the address for
    /// \param ctx secp256k1 context to use
    /// \return the address corresponding to the passed public key
    auto eth_addr(const secp256k1_pubkey& pk,
                  const std::shared_ptr<secp256k1_context>& ctx)
        -> evmc::address;

    /// Creates a secp256k1 context for key derivation.
    /// \return shared pointer owning the context.
    auto make_secp_context() -> std::shared_ptr<secp256k1_context>;
}

#endif // ERC_LEDGER_SRC_TOKEN_UTIL_H_
