// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_UTIL_SERIALIZATION_UTIL_H_
#define ERC_LEDGER_SRC_UTIL_SERIALIZATION_UTIL_H_

#include "buffer_serializer.hpp"

#include <optional>

namespace erc {
    /// Serialize object into erc::buffer using a erc::buffer_serializer.
    /// \tparam T type of object to serialize.
    /// \tparam B type of buffer to return, must be erc::buffer for this
    ///         template to be enabled.
    /// \return a serialized buffer of the object.
    template<typename T, typename B = buffer>
    auto make_buffer(const T& obj)
        -> std::enable_if_t<std::is_same_v<B, buffer>, erc::buffer> {
        auto pkt = erc::buffer();
        auto ser = erc::buffer_serializer(pkt);
        ser << obj;
        return pkt;
    }

    /// Deserialize object of given type from a erc::buffer. Fails if the
    /// buffer is too short or has trailing bytes after the object.
    /// \tparam T type of object to deserialize from the buffer.
    /// \param buf buffer from which to deserialize the object.
    /// \return deserialized object, or std::nullopt if the deserialization
    ///         failed.
    template<typename T>
    auto from_buffer(const erc::buffer& buf) -> std::optional<T> {
        auto cpy = buf;
        auto deser = erc::buffer_serializer(cpy);
        T ret{};
        if(!(deser >> ret) || !deser.end_of_buffer()) {
            return std::nullopt;
        }
        return ret;
    }
}

#endif // ERC_LEDGER_SRC_UTIL_SERIALIZATION_UTIL_H_
