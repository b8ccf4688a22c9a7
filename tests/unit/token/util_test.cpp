// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/util.hpp"

#include <gtest/gtest.h>

class token_util_test : public ::testing::Test {
  protected:
    std::shared_ptr<secp256k1_context> m_secp{erc::make_secp_context()};
};

TEST_F(token_util_test, address_from_private_key) {
    auto key = erc::privkey_t();
    key[key.size() - 1] = 1;
    auto addr = erc::eth_addr(key, m_secp);
    ASSERT_TRUE(addr.has_value());
    ASSERT_EQ(erc::to_hex(addr.value()),
              "7e5f4552091a69125d5dfcb7b8c2659029395bdf");
}

TEST_F(token_util_test, invalid_private_key) {
    auto key = erc::privkey_t();
    ASSERT_FALSE(erc::eth_addr(key, m_secp).has_value());
}

TEST_F(token_util_test, address_from_hex) {
    auto addr = erc::from_hex<evmc::address>(
        "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
    ASSERT_TRUE(addr.has_value());
    ASSERT_EQ(addr->bytes[0], 0x7e);
    ASSERT_EQ(addr->bytes[19], 0xdf);

    auto unprefixed = erc::from_hex<evmc::address>(
        "7e5f4552091a69125d5dfcb7b8c2659029395bdf");
    ASSERT_EQ(unprefixed, addr);
}

TEST_F(token_util_test, address_from_hex_wrong_size) {
    ASSERT_FALSE(erc::from_hex<evmc::address>("0x0102").has_value());
    ASSERT_FALSE(erc::from_hex<evmc::address>(
                     "0x007e5f4552091a69125d5dfcb7b8c2659029395bdf")
                     .has_value());
    ASSERT_FALSE(erc::from_hex<evmc::address>("0xzz").has_value());
}

TEST_F(token_util_test, uint256_from_short_hex) {
    auto v = erc::uint256be_from_hex("0x0100");
    ASSERT_TRUE(v.has_value());
    ASSERT_EQ(v.value(), evmc::uint256be(256));
}

TEST_F(token_util_test, parse_uint256) {
    ASSERT_EQ(erc::parse_uint256("42"), evmc::uint256be(42));
    ASSERT_EQ(erc::parse_uint256("0x2a"), evmc::uint256be(42));
    ASSERT_FALSE(erc::parse_uint256("0x").has_value());
    ASSERT_FALSE(erc::parse_uint256("forty-two").has_value());
    ASSERT_FALSE(erc::parse_uint256("").has_value());
}
