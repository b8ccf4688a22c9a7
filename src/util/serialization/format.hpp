// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_UTIL_SERIALIZATION_FORMAT_H_
#define ERC_LEDGER_SRC_UTIL_SERIALIZATION_FORMAT_H_

#include "serializer.hpp"
#include "util/common/buffer.hpp"

#include <cstdint>
#include <string>
#include <type_traits>

namespace erc {
    /// \brief Serializes a raw byte buffer.
    ///
    /// Writes the size of the buffer as a 64-bit uint, followed by the actual
    /// buffer data.
    ///
    /// \see \ref erc::operator>>(serializer&, buffer&)
    auto operator<<(serializer& ser, const buffer& b) -> serializer&;

    /// \brief Deserializes a raw byte buffer.
    auto operator>>(serializer& deser, buffer& b) -> serializer&;

    /// \brief Serializes a string.
    ///
    /// Writes the length of the string as a 64-bit uint, followed by the
    /// characters without a terminator.
    auto operator<<(serializer& ser, const std::string& s) -> serializer&;

    /// \brief Deserializes a string.
    /// \see \ref erc::operator<<(serializer&, const std::string&)
    auto operator>>(serializer& deser, std::string& s) -> serializer&;

    /// \brief Serializes the integral argument.
    ///
    /// Copies `sizeof(T)` bytes from `t` following machine endianness.
    ///
    /// \tparam T the integral type of the value to serialize
    /// \param t the value to serialize
    template<typename T>
    auto operator<<(serializer& s, T t) ->
        typename std::enable_if_t<std::is_integral_v<T> && !std::is_enum_v<T>,
                                  serializer&> {
        s.write(&t, sizeof(t));
        return s;
    }

    /// \brief Deserializes the integral argument.
    ///
    /// Writes `sizeof(T)` bytes into `t` following machine endianness.
    ///
    /// \see \ref erc::operator<<(serializer&, T)
    template<typename T>
    auto operator>>(serializer& s, T& t) ->
        typename std::enable_if_t<std::is_integral_v<T> && !std::is_enum_v<T>,
                                  serializer&> {
        s.read(&t, sizeof(t));
        return s;
    }

    // TODO: use std::is_scoped_enum_v and std::to_underlying once C++23 is
    // available.
    /// Serializes an enum via its underlying type.
    template<typename T>
    auto operator<<(serializer& ser, T e) ->
        typename std::enable_if_t<std::is_enum_v<T>, serializer&> {
        return ser << static_cast<std::underlying_type_t<T>>(e);
    }

    /// Deserializes an enum.
    template<typename T>
    auto operator>>(serializer& deser, T& e) ->
        typename std::enable_if_t<std::is_enum_v<T>, serializer&> {
        std::underlying_type_t<T> val{};
        if(deser >> val) {
            e = static_cast<T>(val);
        }
        return deser;
    }
}

#endif // ERC_LEDGER_SRC_UTIL_SERIALIZATION_FORMAT_H_
