// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "abi/nft_contract.hpp"
#include "cli/commands.hpp"
#include "token/util.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

class cli_test : public ::testing::Test {
  protected:
    void SetUp() override {
        auto meta = erc::nft::metadata{"Demo NFT",
                                       "DNFT",
                                       "",
                                       erc::test::uint256(0),
                                       m_deployer};
        m_engine = std::make_shared<erc::nft::engine>(meta, m_store, m_log);
        m_contract = std::make_shared<erc::abi::nft_contract>(m_contract_addr,
                                                              m_engine,
                                                              m_log);
    }

    auto minted() -> evmc::uint256be {
        return std::get<evmc::uint256be>(m_engine->total_minted());
    }

    std::shared_ptr<erc::ledger::memory_store> m_store{
        std::make_shared<erc::ledger::memory_store>()};
    std::shared_ptr<erc::logging::log> m_log{
        std::make_shared<erc::logging::log>(erc::logging::log_level::warn)};
    std::shared_ptr<erc::nft::engine> m_engine;
    std::shared_ptr<erc::abi::nft_contract> m_contract;

    evmc::address m_contract_addr{erc::test::address(0xc0)};
    evmc::address m_deployer{erc::test::address(0xd0)};
    evmc::address m_alice{erc::test::address(1)};
    std::string m_deployer_hex{"0x" + erc::to_hex(m_deployer)};
    std::string m_alice_hex{"0x" + erc::to_hex(m_alice)};
};

TEST_F(cli_test, mint_uses_token_id) {
    auto res = erc::cli::nft_command(*m_contract,
                                     "mint",
                                     {m_deployer_hex, m_alice_hex, "42"});
    ASSERT_TRUE(res.has_value());
    ASSERT_TRUE(res.value());

    auto owner = m_engine->owner_of(erc::test::uint256(42));
    ASSERT_EQ(std::get<evmc::address>(owner), m_alice);
}

TEST_F(cli_test, mint_rejects_non_numeric_id) {
    auto res = erc::cli::nft_command(*m_contract,
                                     "mint",
                                     {m_deployer_hex,
                                      m_alice_hex,
                                      "ipfs://demo/0.json"});
    ASSERT_TRUE(res.has_value());
    ASSERT_FALSE(res.value());
    ASSERT_TRUE(evmc::is_zero(minted()));
}

TEST_F(cli_test, mint_uri_keeps_numeric_uri) {
    auto res = erc::cli::nft_command(*m_contract,
                                     "mint-uri",
                                     {m_deployer_hex, m_alice_hex, "12345"});
    ASSERT_TRUE(res.has_value());
    ASSERT_TRUE(res.value());

    auto owner = m_engine->owner_of(erc::test::uint256(0));
    ASSERT_EQ(std::get<evmc::address>(owner), m_alice);
    auto uri = m_engine->token_uri(erc::test::uint256(0));
    ASSERT_EQ(std::get<std::string>(uri), "12345");

    auto missing = m_engine->owner_of(erc::test::uint256(12345));
    ASSERT_EQ(std::get<erc::error_code>(missing),
              erc::error_code::nonexistent_token);
}

TEST_F(cli_test, mint_uri_keeps_hex_uri) {
    auto res = erc::cli::nft_command(*m_contract,
                                     "mint-uri",
                                     {m_deployer_hex, m_alice_hex, "0x01"});
    ASSERT_TRUE(res.value());
    auto uri = m_engine->token_uri(erc::test::uint256(0));
    ASSERT_EQ(std::get<std::string>(uri), "0x01");
    ASSERT_EQ(minted(), erc::test::uint256(1));
}

TEST_F(cli_test, unknown_command) {
    auto res = erc::cli::nft_command(*m_contract, "burn", {});
    ASSERT_FALSE(res.has_value());
}
