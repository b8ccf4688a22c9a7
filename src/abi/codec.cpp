// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec.hpp"

#include "token/math.hpp"
#include "util/common/hash.hpp"

#include <cstring>
#include <utility>

namespace erc::abi {
    namespace {
        constexpr auto address_offset = word_size - sizeof(evmc::address);
        constexpr auto bits_in_byte = 8;

        auto padded_size(size_t len) -> size_t {
            return ((len + word_size - 1) / word_size) * word_size;
        }

        void append_word(buffer& buf, const evmc::bytes32& word) {
            buf.append(word.bytes, sizeof(word.bytes));
        }

        /// Converts a word holding an offset or length to size_t.
        auto word_to_size(const evmc::bytes32& word) -> std::optional<size_t> {
            for(size_t i = 0; i < word_size - sizeof(uint32_t); i++) {
                if(word.bytes[i] != 0) {
                    return std::nullopt;
                }
            }
            return static_cast<size_t>(to_uint64(word));
        }

        void append_selector(buffer& buf, selector_type sel) {
            for(int i = selector_size - 1; i >= 0; i--) {
                const auto b = static_cast<uint8_t>(
                    sel >> (static_cast<unsigned>(i) * bits_in_byte));
                buf.append(&b, 1);
            }
        }
    }

    auto selector(const std::string& signature) -> selector_type {
        auto h = keccak_data(signature.data(), signature.size());
        selector_type ret{};
        for(size_t i = 0; i < selector_size; i++) {
            ret = (ret << bits_in_byte) | h[i];
        }
        return ret;
    }

    auto topic(const std::string& signature) -> evmc::bytes32 {
        auto h = keccak_data(signature.data(), signature.size());
        auto ret = evmc::bytes32();
        std::memcpy(ret.bytes, h.data(), sizeof(ret.bytes));
        return ret;
    }

    auto address_word(const evmc::address& addr) -> evmc::bytes32 {
        auto ret = evmc::bytes32();
        std::memcpy(&ret.bytes[address_offset], addr.bytes, sizeof(addr.bytes));
        return ret;
    }

    auto bool_word(bool val) -> evmc::bytes32 {
        return from_uint64(val ? 1 : 0);
    }

    auto encoder::add_word(const evmc::bytes32& word) -> encoder& {
        m_args.emplace_back(word);
        return *this;
    }

    auto encoder::add_address(const evmc::address& addr) -> encoder& {
        return add_word(address_word(addr));
    }

    auto encoder::add_uint(const evmc::uint256be& val) -> encoder& {
        return add_word(val);
    }

    auto encoder::add_bool(bool val) -> encoder& {
        return add_word(bool_word(val));
    }

    auto encoder::add_string(const std::string& str) -> encoder& {
        m_args.emplace_back(str);
        return *this;
    }

    auto encoder::data() const -> buffer {
        auto head = buffer();
        auto tail = buffer();
        const auto head_size = m_args.size() * word_size;
        for(const auto& arg : m_args) {
            if(std::holds_alternative<evmc::bytes32>(arg)) {
                append_word(head, std::get<evmc::bytes32>(arg));
                continue;
            }
            const auto& str = std::get<std::string>(arg);
            append_word(head, from_uint64(head_size + tail.size()));
            append_word(tail, from_uint64(str.size()));
            const auto start = tail.size();
            tail.extend(padded_size(str.size()));
            if(!str.empty()) {
                std::memcpy(tail.data_at(start), str.data(), str.size());
            }
        }
        head.append(tail);
        return head;
    }

    auto encoder::data(selector_type sel) const -> buffer {
        auto ret = buffer();
        append_selector(ret, sel);
        ret.append(data());
        return ret;
    }

    decoder::decoder(buffer data, size_t offset)
        : m_data(std::move(data)),
          m_offset(offset) {}

    auto decoder::get_selector() const -> std::optional<selector_type> {
        if(m_data.size() < selector_size) {
            return std::nullopt;
        }
        selector_type ret{};
        for(size_t i = 0; i < selector_size; i++) {
            ret = (ret << bits_in_byte) | m_data.c_ptr()[i];
        }
        return ret;
    }

    auto decoder::word_at(size_t offset) const
        -> std::optional<evmc::bytes32> {
        auto maybe_word = m_data.slice(m_offset + offset, word_size);
        if(!maybe_word.has_value()) {
            return std::nullopt;
        }
        auto ret = evmc::bytes32();
        std::memcpy(ret.bytes, maybe_word->data(), word_size);
        return ret;
    }

    auto decoder::get_word(size_t index) const
        -> std::optional<evmc::bytes32> {
        return word_at(index * word_size);
    }

    auto decoder::get_address(size_t index) const
        -> std::optional<evmc::address> {
        auto word = get_word(index);
        if(!word.has_value()) {
            return std::nullopt;
        }
        for(size_t i = 0; i < address_offset; i++) {
            if(word->bytes[i] != 0) {
                return std::nullopt;
            }
        }
        auto ret = evmc::address();
        std::memcpy(ret.bytes, &word->bytes[address_offset], sizeof(ret.bytes));
        return ret;
    }

    auto decoder::get_uint(size_t index) const
        -> std::optional<evmc::uint256be> {
        return get_word(index);
    }

    auto decoder::get_bool(size_t index) const -> std::optional<bool> {
        auto word = get_word(index);
        if(!word.has_value()) {
            return std::nullopt;
        }
        if(*word == from_uint64(0)) {
            return false;
        }
        if(*word == from_uint64(1)) {
            return true;
        }
        return std::nullopt;
    }

    auto decoder::get_bytes4(size_t index) const -> std::optional<uint32_t> {
        auto word = get_word(index);
        if(!word.has_value()) {
            return std::nullopt;
        }
        for(size_t i = sizeof(uint32_t); i < word_size; i++) {
            if(word->bytes[i] != 0) {
                return std::nullopt;
            }
        }
        uint32_t ret{};
        for(size_t i = 0; i < sizeof(uint32_t); i++) {
            ret = (ret << bits_in_byte) | word->bytes[i];
        }
        return ret;
    }

    auto decoder::get_string(size_t index) const
        -> std::optional<std::string> {
        auto offset_word = get_word(index);
        if(!offset_word.has_value()) {
            return std::nullopt;
        }
        auto offset = word_to_size(offset_word.value());
        if(!offset.has_value()) {
            return std::nullopt;
        }
        auto len_word = word_at(offset.value());
        if(!len_word.has_value()) {
            return std::nullopt;
        }
        auto len = word_to_size(len_word.value());
        if(!len.has_value()) {
            return std::nullopt;
        }
        auto bytes = m_data.slice(m_offset + offset.value() + word_size,
                                  len.value());
        if(!bytes.has_value()) {
            return std::nullopt;
        }
        return std::string(bytes->c_str(), bytes->size());
    }
}
