// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/hash.hpp"

#include <gtest/gtest.h>
#include <string>

class hash_test : public ::testing::Test {};

TEST_F(hash_test, keccak_empty_input) {
    auto h = erc::keccak_data(nullptr, 0);
    ASSERT_EQ(
        erc::to_string(h),
        "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST_F(hash_test, keccak_function_signature) {
    const auto sig = std::string("transfer(address,uint256)");
    auto h = erc::keccak_data(sig.data(), sig.size());
    ASSERT_EQ(erc::to_string(h).substr(0, 8), "a9059cbb");
}

TEST_F(hash_test, to_string_is_lower_hex) {
    auto h = erc::hash_t();
    h[0] = 0xAB;
    h[31] = 0x01;
    auto str = erc::to_string(h);
    ASSERT_EQ(str.size(), 64UL);
    ASSERT_EQ(str.substr(0, 2), "ab");
    ASSERT_EQ(str.substr(62, 2), "01");
}
