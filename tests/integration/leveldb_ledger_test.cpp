// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "abi/fungible_contract.hpp"
#include "ledger/leveldb_store.hpp"
#include "token/fungible/engine.hpp"
#include "token/nft/engine.hpp"
#include "util.hpp"

#include <filesystem>
#include <gtest/gtest.h>

class leveldb_ledger_test : public ::testing::Test {
  protected:
    void SetUp() override {
        std::filesystem::remove_all(m_db_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(m_db_dir);
    }

    auto open_store() -> std::shared_ptr<erc::ledger::leveldb_store> {
        auto st = std::make_shared<erc::ledger::leveldb_store>();
        auto err = st->open(m_db_dir);
        EXPECT_FALSE(err.has_value());
        return st;
    }

    static constexpr auto m_db_dir = "leveldb_ledger_test_db";

    std::shared_ptr<erc::logging::log> m_logger{
        std::make_shared<erc::logging::log>(erc::logging::log_level::trace)};

    evmc::address m_alice{erc::test::address(1)};
    evmc::address m_bob{erc::test::address(2)};
    evmc::address m_carol{erc::test::address(3)};
};

TEST_F(leveldb_ledger_test, unopened_store_fails) {
    auto st = std::make_shared<erc::ledger::leveldb_store>();
    auto eng = erc::fungible::engine({"Demo Token", "DTK"}, st, m_logger);
    ASSERT_EQ(eng.mint(m_alice, m_alice, erc::test::uint256(1)),
              erc::error_code::storage_failure);
    ASSERT_EQ(std::get<erc::error_code>(eng.total_supply()),
              erc::error_code::storage_failure);
}

TEST_F(leveldb_ledger_test, fungible_state_survives_reopen) {
    {
        auto eng = erc::fungible::engine({"Demo Token", "DTK"},
                                         open_store(),
                                         m_logger);
        ASSERT_FALSE(
            eng.mint(m_alice, m_alice, erc::test::uint256(1000)).has_value());
        ASSERT_FALSE(
            eng.transfer(m_alice, m_bob, erc::test::uint256(250)).has_value());
        ASSERT_FALSE(
            eng.approve(m_bob, m_carol, erc::test::uint256(100)).has_value());
        ASSERT_FALSE(eng.transfer_from(m_carol,
                                       m_bob,
                                       m_carol,
                                       erc::test::uint256(60))
                         .has_value());
    }

    auto eng = erc::fungible::engine({"Demo Token", "DTK"},
                                     open_store(),
                                     m_logger);
    ASSERT_EQ(std::get<evmc::uint256be>(eng.balance_of(m_alice)),
              erc::test::uint256(750));
    ASSERT_EQ(std::get<evmc::uint256be>(eng.balance_of(m_bob)),
              erc::test::uint256(190));
    ASSERT_EQ(std::get<evmc::uint256be>(eng.balance_of(m_carol)),
              erc::test::uint256(60));
    ASSERT_EQ(std::get<evmc::uint256be>(eng.allowance(m_bob, m_carol)),
              erc::test::uint256(40));
    ASSERT_EQ(std::get<evmc::uint256be>(eng.total_supply()),
              erc::test::uint256(1000));
}

TEST_F(leveldb_ledger_test, nft_state_survives_reopen) {
    auto meta = erc::nft::metadata{"Demo NFT", "DNFT", "", {}, m_alice};
    {
        auto eng = erc::nft::engine(meta, open_store(), m_logger);
        auto id = eng.mint_next(m_alice, m_alice, "ipfs://zero");
        ASSERT_TRUE(std::holds_alternative<evmc::uint256be>(id));
        ASSERT_FALSE(
            eng.mint(m_alice, m_bob, erc::test::uint256(9)).has_value());
        ASSERT_FALSE(
            eng.approve(m_alice, m_carol, erc::test::uint256(0)).has_value());
        ASSERT_FALSE(eng.set_approval_for_all(m_bob, m_alice, true)
                         .has_value());
        ASSERT_FALSE(eng.transfer_from(m_alice,
                                       m_bob,
                                       m_carol,
                                       erc::test::uint256(9))
                         .has_value());
    }

    auto eng = erc::nft::engine(meta, open_store(), m_logger);
    ASSERT_EQ(std::get<evmc::address>(eng.owner_of(erc::test::uint256(0))),
              m_alice);
    ASSERT_EQ(std::get<evmc::address>(eng.owner_of(erc::test::uint256(9))),
              m_carol);
    ASSERT_EQ(
        std::get<evmc::address>(eng.get_approved(erc::test::uint256(0))),
        m_carol);
    ASSERT_TRUE(std::get<bool>(eng.is_approved_for_all(m_bob, m_alice)));
    ASSERT_EQ(
        std::get<std::string>(eng.token_uri(erc::test::uint256(0))),
        "ipfs://zero");
    ASSERT_EQ(std::get<evmc::uint256be>(eng.total_minted()),
              erc::test::uint256(2));

    // The auto-increment counter resumes where it left off.
    auto next = eng.mint_next(m_alice, m_alice, "ipfs://one");
    ASSERT_EQ(std::get<evmc::uint256be>(next), erc::test::uint256(1));
}

TEST_F(leveldb_ledger_test, rejected_call_leaves_no_rows) {
    {
        auto eng = std::make_shared<erc::fungible::engine>(
            erc::fungible::metadata{"Demo Token", "DTK"},
            open_store(),
            m_logger);
        auto contract = erc::abi::fungible_contract(erc::test::address(0xc0),
                                                    eng,
                                                    m_logger);
        auto res = contract.call(
            m_alice,
            erc::abi::encoder()
                .add_address(m_bob)
                .add_uint(erc::test::uint256(5))
                .data(erc::abi::selector("transfer(address,uint256)")));
        ASSERT_FALSE(res.m_success);
    }

    auto eng = erc::fungible::engine({"Demo Token", "DTK"},
                                     open_store(),
                                     m_logger);
    ASSERT_TRUE(evmc::is_zero(std::get<evmc::uint256be>(eng.total_supply())));
    ASSERT_TRUE(
        evmc::is_zero(std::get<evmc::uint256be>(eng.balance_of(m_bob))));
}
