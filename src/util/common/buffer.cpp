// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "buffer.hpp"

#include <array>
#include <cstdint>
#include <cstring>

namespace erc {
    namespace {
        constexpr auto hex_digits = std::array<char, 16>{'0',
                                                         '1',
                                                         '2',
                                                         '3',
                                                         '4',
                                                         '5',
                                                         '6',
                                                         '7',
                                                         '8',
                                                         '9',
                                                         'a',
                                                         'b',
                                                         'c',
                                                         'd',
                                                         'e',
                                                         'f'};

        auto hex_value(char c) -> std::optional<uint8_t> {
            if(c >= '0' && c <= '9') {
                return static_cast<uint8_t>(c - '0');
            }
            static constexpr uint8_t alpha_offset = 10;
            if(c >= 'a' && c <= 'f') {
                return static_cast<uint8_t>(c - 'a' + alpha_offset);
            }
            if(c >= 'A' && c <= 'F') {
                return static_cast<uint8_t>(c - 'A' + alpha_offset);
            }
            return std::nullopt;
        }
    }

    void buffer::clear() {
        m_data.clear();
    }

    void buffer::append(const void* data, size_t len) {
        if(len == 0) {
            return;
        }
        const auto orig_size = m_data.size();
        m_data.resize(orig_size + len);
        std::memcpy(&m_data[orig_size], data, len);
    }

    void buffer::append(const buffer& other) {
        m_data.insert(m_data.end(), other.m_data.begin(), other.m_data.end());
    }

    auto buffer::size() const -> size_t {
        return m_data.size();
    }

    auto buffer::empty() const -> bool {
        return m_data.empty();
    }

    auto buffer::data() -> void* {
        return m_data.data();
    }

    auto buffer::data() const -> const void* {
        return m_data.data();
    }

    auto buffer::data_at(size_t offset) -> void* {
        return &m_data[offset];
    }

    auto buffer::data_at(size_t offset) const -> const void* {
        return &m_data[offset];
    }

    auto buffer::operator==(const buffer& other) const -> bool {
        return m_data == other.m_data;
    }

    auto buffer::operator!=(const buffer& other) const -> bool {
        return m_data != other.m_data;
    }

    auto buffer::operator<(const buffer& other) const -> bool {
        return m_data < other.m_data;
    }

    void buffer::extend(size_t len) {
        m_data.resize(m_data.size() + len);
    }

    auto buffer::slice(size_t offset, size_t len) const
        -> std::optional<buffer> {
        if(offset > m_data.size() || len > m_data.size() - offset) {
            return std::nullopt;
        }
        auto ret = buffer();
        ret.m_data.assign(
            m_data.begin() + static_cast<std::ptrdiff_t>(offset),
            m_data.begin() + static_cast<std::ptrdiff_t>(offset + len));
        return ret;
    }

    auto buffer::c_ptr() const -> const unsigned char* {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const unsigned char*>(m_data.data());
    }

    auto buffer::c_str() const -> const char* {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const char*>(m_data.data());
    }

    auto buffer::to_hex() const -> std::string {
        auto ret = std::string();
        ret.reserve(m_data.size() * 2);
        static constexpr uint8_t nibble_mask = 0x0f;
        static constexpr auto nibble_bits = 4;
        for(const auto& byte : m_data) {
            const auto val = std::to_integer<uint8_t>(byte);
            ret.push_back(hex_digits.at(val >> nibble_bits));
            ret.push_back(hex_digits.at(val & nibble_mask));
        }
        return ret;
    }

    auto buffer::to_hex_prefixed(const std::string& prefix) const
        -> std::string {
        auto res = std::string();
        res.append(prefix);
        res.append(to_hex());
        return res;
    }

    auto buffer::from_hex(const std::string& hex) -> std::optional<buffer> {
        constexpr auto max_size = 102400;
        if(hex.empty() || ((hex.size() % 2) != 0) || (hex.size() > max_size)) {
            return std::nullopt;
        }

        auto ret = erc::buffer();
        ret.m_data.reserve(hex.size() / 2);

        static constexpr auto nibble_bits = 4;
        for(size_t i = 0; i < hex.size(); i += 2) {
            const auto hi = hex_value(hex[i]);
            const auto lo = hex_value(hex[i + 1]);
            if(!hi.has_value() || !lo.has_value()) {
                return std::nullopt;
            }
            ret.m_data.push_back(static_cast<std::byte>(
                static_cast<uint8_t>(hi.value() << nibble_bits) | lo.value()));
        }

        return ret;
    }

    auto buffer::from_hex_prefixed(const std::string& hex,
                                   const std::string& prefix)
        -> std::optional<buffer> {
        size_t offset = 0;
        if(hex.rfind(prefix, 0) == 0) {
            offset = prefix.size();
        }
        auto hex_str = hex.substr(offset);
        if(hex_str.empty() && offset != 0) {
            return buffer();
        }
        if(hex_str.size() % 2 != 0) {
            hex_str.insert(0, "0");
        }
        return from_hex(hex_str);
    }
}
