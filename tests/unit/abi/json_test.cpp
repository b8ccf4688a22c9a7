// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "abi/json.hpp"

#include <gtest/gtest.h>

class json_test : public ::testing::Test {
  protected:
    erc::abi::function_spec m_transfer{
        "transfer",
        {{"to", "address"}, {"value", "uint256"}},
        {{"", "bool"}},
        erc::abi::mutability::nonpayable};
    erc::abi::event_spec m_event{"Transfer",
                                 {{"from", "address", true},
                                  {"to", "address", true},
                                  {"value", "uint256", false}}};
    erc::abi::error_spec m_error{"ERC20InsufficientBalance",
                                 {{"sender", "address"},
                                  {"balance", "uint256"},
                                  {"needed", "uint256"}}};
};

TEST_F(json_test, function_entry) {
    auto fn = erc::abi::function_to_json(m_transfer);
    ASSERT_EQ(fn["type"].asString(), "function");
    ASSERT_EQ(fn["name"].asString(), "transfer");
    ASSERT_EQ(fn["stateMutability"].asString(), "nonpayable");
    ASSERT_EQ(fn["inputs"].size(), 2U);
    ASSERT_EQ(fn["inputs"][1]["name"].asString(), "value");
    ASSERT_EQ(fn["inputs"][1]["type"].asString(), "uint256");
    ASSERT_EQ(fn["inputs"][1]["internalType"].asString(), "uint256");
    ASSERT_FALSE(fn["inputs"][1].isMember("indexed"));
    ASSERT_EQ(fn["outputs"].size(), 1U);
    ASSERT_EQ(fn["outputs"][0]["type"].asString(), "bool");
}

TEST_F(json_test, event_entry) {
    auto ev = erc::abi::event_to_json(m_event);
    ASSERT_EQ(ev["type"].asString(), "event");
    ASSERT_FALSE(ev["anonymous"].asBool());
    ASSERT_TRUE(ev["inputs"][0]["indexed"].asBool());
    ASSERT_FALSE(ev["inputs"][2]["indexed"].asBool());
}

TEST_F(json_test, error_entry) {
    auto err = erc::abi::error_to_json(m_error);
    ASSERT_EQ(err["type"].asString(), "error");
    ASSERT_EQ(err["inputs"].size(), 3U);
    ASSERT_FALSE(err.isMember("outputs"));
}

TEST_F(json_test, abi_ordering_and_output) {
    auto abi = erc::abi::abi_to_json({m_transfer}, {m_event}, {m_error});
    ASSERT_EQ(abi.size(), 3U);
    ASSERT_EQ(abi[0]["type"].asString(), "function");
    ASSERT_EQ(abi[1]["type"].asString(), "event");
    ASSERT_EQ(abi[2]["type"].asString(), "error");

    auto str = erc::abi::json_to_string(abi);
    ASSERT_EQ(str.front(), '[');
    ASSERT_NE(str.find("\"stateMutability\""), std::string::npos);
    ASSERT_NE(str.find("\n  {"), std::string::npos);
}

TEST_F(json_test, view_mutability) {
    m_transfer.m_mutability = erc::abi::mutability::view;
    auto fn = erc::abi::function_to_json(m_transfer);
    ASSERT_EQ(fn["stateMutability"].asString(), "view");
}
