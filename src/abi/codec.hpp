// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file codec.hpp
 * Contract ABI word encoding and decoding.
 */

#ifndef ERC_LEDGER_SRC_ABI_CODEC_H_
#define ERC_LEDGER_SRC_ABI_CODEC_H_

#include "util/common/buffer.hpp"

#include <evmc/evmc.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace erc::abi {
    /// Size of an ABI word in bytes.
    static constexpr size_t word_size = 32;
    /// Size of a function or error selector in bytes.
    static constexpr size_t selector_size = 4;

    /// Four byte function selector, most significant byte first.
    using selector_type = uint32_t;

    /// Calculates the selector of a canonical signature, the first four
    /// bytes of its keccak-256 hash.
    /// \param signature canonical signature, e.g. "transfer(address,uint256)".
    /// \return selector.
    auto selector(const std::string& signature) -> selector_type;

    /// Calculates the keccak-256 hash of a canonical event signature.
    /// \param signature canonical signature.
    /// \return first log topic for the event.
    auto topic(const std::string& signature) -> evmc::bytes32;

    /// Left-pads an address to a word.
    auto address_word(const evmc::address& addr) -> evmc::bytes32;

    /// Encodes a boolean as a word.
    auto bool_word(bool val) -> evmc::bytes32;

    /// Builds ABI encoded data. Static values occupy one head word each and
    /// strings are appended to the tail with an offset in the head.
    class encoder {
      public:
        /// Appends a raw word.
        auto add_word(const evmc::bytes32& word) -> encoder&;
        /// Appends an address.
        auto add_address(const evmc::address& addr) -> encoder&;
        /// Appends a 256-bit unsigned integer.
        auto add_uint(const evmc::uint256be& val) -> encoder&;
        /// Appends a boolean.
        auto add_bool(bool val) -> encoder&;
        /// Appends a dynamic string.
        auto add_string(const std::string& str) -> encoder&;

        /// Returns the encoded arguments.
        /// \return head words followed by the tail.
        [[nodiscard]] auto data() const -> buffer;

        /// Returns the encoded arguments prefixed with a selector, as used
        /// for calldata and custom error reverts.
        /// \param sel selector to prefix.
        /// \return selector followed by data().
        [[nodiscard]] auto data(selector_type sel) const -> buffer;

      private:
        std::vector<std::variant<evmc::bytes32, std::string>> m_args;
    };

    /// Reads ABI encoded arguments following a selector. Argument indices
    /// count head words. Every accessor returns std::nullopt if the data is
    /// too short or the word is not a valid encoding of the type.
    class decoder {
      public:
        /// Constructor.
        /// \param data encoded arguments preceded by offset bytes.
        /// \param offset position of the first head word. Zero for return
        ///               data, selector_size for calldata and reverts.
        explicit decoder(buffer data, size_t offset = selector_size);

        /// Returns the selector, or std::nullopt if the calldata is shorter
        /// than a selector.
        [[nodiscard]] auto get_selector() const
            -> std::optional<selector_type>;

        [[nodiscard]] auto get_word(size_t index) const
            -> std::optional<evmc::bytes32>;
        /// Rejects words whose upper 12 bytes are not zero.
        [[nodiscard]] auto get_address(size_t index) const
            -> std::optional<evmc::address>;
        [[nodiscard]] auto get_uint(size_t index) const
            -> std::optional<evmc::uint256be>;
        /// Accepts only 0 and 1.
        [[nodiscard]] auto get_bool(size_t index) const -> std::optional<bool>;
        /// Reads a left-aligned bytes4 value. The low 28 bytes must be zero.
        [[nodiscard]] auto get_bytes4(size_t index) const
            -> std::optional<uint32_t>;
        /// Follows the head offset to a length-prefixed string.
        [[nodiscard]] auto get_string(size_t index) const
            -> std::optional<std::string>;

      private:
        buffer m_data;
        size_t m_offset;

        [[nodiscard]] auto word_at(size_t offset) const
            -> std::optional<evmc::bytes32>;
    };
}

#endif // ERC_LEDGER_SRC_ABI_CODEC_H_
