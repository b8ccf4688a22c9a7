// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/buffer.hpp"

#include <cstring>
#include <gtest/gtest.h>

TEST(BufferTest, to_from_hex) {
    std::string data = "hello";

    auto buf = erc::buffer();
    buf.append(data.data(), data.size());
    auto hex = buf.to_hex();
    ASSERT_EQ(hex, "68656c6c6f");

    auto from = erc::buffer::from_hex(hex);
    ASSERT_TRUE(from.has_value());
    ASSERT_EQ(from.value(), buf);
}

TEST(BufferTest, from_hex_invalid_char) {
    auto from = erc::buffer::from_hex("ZZ11ff");
    ASSERT_FALSE(from.has_value());
}

TEST(BufferTest, from_hex_invalid_len) {
    auto from = erc::buffer::from_hex("11ffa");
    ASSERT_FALSE(from.has_value());
}

TEST(BufferTest, from_hex_empty) {
    auto from = erc::buffer::from_hex("");
    ASSERT_FALSE(from.has_value());
}

TEST(BufferTest, from_hex_upper_case) {
    auto from = erc::buffer::from_hex("ABcd");
    ASSERT_TRUE(from.has_value());
    ASSERT_EQ(from->to_hex(), "abcd");
}

TEST(BufferTest, prefixed_round_trip) {
    auto from = erc::buffer::from_hex_prefixed("0xdeadbeef");
    ASSERT_TRUE(from.has_value());
    ASSERT_EQ(from->size(), 4UL);
    ASSERT_EQ(from->to_hex_prefixed(), "0xdeadbeef");
}

TEST(BufferTest, prefixed_odd_length_is_padded) {
    auto from = erc::buffer::from_hex_prefixed("0xabc");
    ASSERT_TRUE(from.has_value());
    ASSERT_EQ(from->to_hex(), "0abc");
}

TEST(BufferTest, prefix_alone_is_empty) {
    auto from = erc::buffer::from_hex_prefixed("0x");
    ASSERT_TRUE(from.has_value());
    ASSERT_TRUE(from->empty());
}

TEST(BufferTest, prefix_is_optional) {
    auto from = erc::buffer::from_hex_prefixed("0102");
    ASSERT_TRUE(from.has_value());
    ASSERT_EQ(from->size(), 2UL);
}

TEST(BufferTest, append_and_extend) {
    auto buf = erc::buffer();
    ASSERT_TRUE(buf.empty());

    const uint8_t first = 0x01;
    buf.append(&first, sizeof(first));
    auto other = erc::buffer::from_hex("0203").value();
    buf.append(other);
    buf.extend(2);

    ASSERT_EQ(buf.to_hex(), "0102030000");
    buf.clear();
    ASSERT_EQ(buf.size(), 0UL);
}

TEST(BufferTest, slice_bounds) {
    auto buf = erc::buffer::from_hex("00112233").value();

    auto mid = buf.slice(1, 2);
    ASSERT_TRUE(mid.has_value());
    ASSERT_EQ(mid->to_hex(), "1122");

    auto tail = buf.slice(4, 0);
    ASSERT_TRUE(tail.has_value());
    ASSERT_TRUE(tail->empty());

    ASSERT_FALSE(buf.slice(3, 2).has_value());
    ASSERT_FALSE(buf.slice(5, 0).has_value());
}

TEST(BufferTest, ordering) {
    auto a = erc::buffer::from_hex("0001").value();
    auto b = erc::buffer::from_hex("0100").value();
    auto c = erc::buffer::from_hex("000100").value();
    ASSERT_TRUE(a < b);
    ASSERT_TRUE(a < c);
    ASSERT_FALSE(b < a);
    ASSERT_NE(a, c);
}
