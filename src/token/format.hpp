// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_TOKEN_FORMAT_H_
#define ERC_LEDGER_SRC_TOKEN_FORMAT_H_

#include "util/serialization/serializer.hpp"

#include <evmc/evmc.hpp>

namespace erc {
    /// Serializes the 20 address bytes.
    auto operator<<(serializer& ser, const evmc::address& addr)
        -> serializer&;
    /// Deserializes an address.
    auto operator>>(serializer& deser, evmc::address& addr) -> serializer&;

    /// Serializes the 32 bytes of a word, most significant first.
    auto operator<<(serializer& ser, const evmc::bytes32& b) -> serializer&;
    /// Deserializes a 32-byte word.
    auto operator>>(serializer& deser, evmc::bytes32& b) -> serializer&;
}

#endif // ERC_LEDGER_SRC_TOKEN_FORMAT_H_
