// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "abi/logs.hpp"
#include "abi/nft_contract.hpp"
#include "util.hpp"

#include <algorithm>
#include <gtest/gtest.h>

class nft_contract_test : public ::testing::Test {
  protected:
    void SetUp() override {
        auto meta = erc::nft::metadata{"Demo NFT",
                                       "DNFT",
                                       "ipfs://demo/",
                                       erc::test::uint256(3),
                                       m_deployer};
        m_engine = std::make_shared<erc::nft::engine>(meta, m_store, m_log);
        m_contract = std::make_shared<erc::abi::nft_contract>(m_contract_addr,
                                                              m_engine,
                                                              m_log);
    }

    auto mint(const evmc::address& to, uint64_t id) -> erc::abi::call_result {
        return m_contract->call(
            m_deployer,
            erc::abi::encoder()
                .add_address(to)
                .add_uint(erc::test::uint256(id))
                .data(erc::abi::selector("mint(address,uint256)")));
    }

    auto owner_of(uint64_t id) -> erc::abi::call_result {
        return m_contract->call(
            m_alice,
            erc::abi::encoder()
                .add_uint(erc::test::uint256(id))
                .data(erc::abi::selector("ownerOf(uint256)")));
    }

    auto transfer_from(const evmc::address& caller,
                       const evmc::address& from,
                       const evmc::address& to,
                       uint64_t id) -> erc::abi::call_result {
        return m_contract->call(
            caller,
            erc::abi::encoder()
                .add_address(from)
                .add_address(to)
                .add_uint(erc::test::uint256(id))
                .data(erc::abi::selector(
                    "transferFrom(address,address,uint256)")));
    }

    static auto error_data(const std::string& sig,
                           const erc::abi::encoder& args) -> erc::buffer {
        return args.data(erc::abi::selector(sig));
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
    evmc::address m_bob{erc::test::address(2)};
};

TEST_F(nft_contract_test, metadata_views) {
    auto res = m_contract->call(
        m_alice,
        erc::abi::encoder().data(erc::abi::selector("name()")));
    ASSERT_TRUE(res.m_success);
    ASSERT_EQ(res.m_output, erc::abi::encoder().add_string("Demo NFT").data());

    res = m_contract->call(
        m_alice,
        erc::abi::encoder().data(erc::abi::selector("symbol()")));
    ASSERT_EQ(res.m_output, erc::abi::encoder().add_string("DNFT").data());

    res = m_contract->call(
        m_alice,
        erc::abi::encoder().data(erc::abi::selector("maxSupply()")));
    ASSERT_EQ(res.m_output,
              erc::abi::encoder().add_uint(erc::test::uint256(3)).data());

    res = m_contract->call(
        m_alice,
        erc::abi::encoder().data(erc::abi::selector("getOwner()")));
    ASSERT_EQ(res.m_output, erc::abi::encoder().add_address(m_deployer).data());
}

TEST_F(nft_contract_test, mint_emits_transfer_log) {
    auto res = mint(m_alice, 1);
    ASSERT_TRUE(res.m_success);
    ASSERT_TRUE(res.m_output.empty());
    ASSERT_EQ(res.m_logs.size(), 1UL);

    const auto& log = res.m_logs[0];
    ASSERT_EQ(log.m_addr, m_contract_addr);
    ASSERT_EQ(log.m_topics.size(), 4UL);
    ASSERT_EQ(log.m_topics[0], erc::abi::topic(erc::abi::transfer_signature));
    ASSERT_TRUE(evmc::is_zero(log.m_topics[1]));
    ASSERT_EQ(log.m_topics[2], erc::abi::address_word(m_alice));
    ASSERT_EQ(log.m_topics[3], erc::test::uint256(1));

    res = owner_of(1);
    ASSERT_TRUE(res.m_success);
    ASSERT_EQ(res.m_output, erc::abi::encoder().add_address(m_alice).data());
    ASSERT_TRUE(res.m_logs.empty());
}

TEST_F(nft_contract_test, double_mint_reverts_invalid_sender) {
    ASSERT_TRUE(mint(m_alice, 1).m_success);
    auto res = mint(m_bob, 1);
    ASSERT_FALSE(res.m_success);
    ASSERT_TRUE(res.m_logs.empty());
    ASSERT_EQ(res.m_output,
              error_data("ERC721InvalidSender(address)",
                         erc::abi::encoder().add_address(evmc::address{})));
}

TEST_F(nft_contract_test, owner_of_nonexistent) {
    auto res = owner_of(5);
    ASSERT_FALSE(res.m_success);
    ASSERT_EQ(res.m_output,
              error_data("ERC721NonexistentToken(uint256)",
                         erc::abi::encoder().add_uint(erc::test::uint256(5))));
}

TEST_F(nft_contract_test, transfer_from_errors) {
    ASSERT_TRUE(mint(m_alice, 1).m_success);

    auto res = transfer_from(m_bob, m_alice, m_bob, 1);
    ASSERT_FALSE(res.m_success);
    ASSERT_EQ(res.m_output,
              error_data("ERC721InsufficientApproval(address,uint256)",
                         erc::abi::encoder().add_address(m_bob).add_uint(
                             erc::test::uint256(1))));

    res = transfer_from(m_bob, m_bob, m_alice, 1);
    ASSERT_FALSE(res.m_success);
    ASSERT_EQ(res.m_output,
              error_data("ERC721IncorrectOwner(address,uint256,address)",
                         erc::abi::encoder()
                             .add_address(m_bob)
                             .add_uint(erc::test::uint256(1))
                             .add_address(m_alice)));

    res = transfer_from(m_alice, m_alice, m_bob, 2);
    ASSERT_FALSE(res.m_success);
    ASSERT_EQ(res.m_output,
              error_data("ERC721NonexistentToken(uint256)",
                         erc::abi::encoder().add_uint(erc::test::uint256(2))));
}

TEST_F(nft_contract_test, approve_and_transfer) {
    ASSERT_TRUE(mint(m_alice, 1).m_success);

    auto approve = erc::abi::encoder()
                       .add_address(m_bob)
                       .add_uint(erc::test::uint256(1))
                       .data(erc::abi::selector("approve(address,uint256)"));
    auto res = m_contract->call(m_bob, approve);
    ASSERT_FALSE(res.m_success);
    ASSERT_EQ(res.m_output,
              error_data("ERC721InvalidApprover(address)",
                         erc::abi::encoder().add_address(m_bob)));

    res = m_contract->call(m_alice, approve);
    ASSERT_TRUE(res.m_success);
    ASSERT_EQ(res.m_logs.size(), 1UL);
    ASSERT_EQ(res.m_logs[0].m_topics[0],
              erc::abi::topic(erc::abi::approval_signature));

    res = m_contract->call(
        m_alice,
        erc::abi::encoder()
            .add_uint(erc::test::uint256(1))
            .data(erc::abi::selector("getApproved(uint256)")));
    ASSERT_EQ(res.m_output, erc::abi::encoder().add_address(m_bob).data());

    res = transfer_from(m_bob, m_alice, m_bob, 1);
    ASSERT_TRUE(res.m_success);
    ASSERT_EQ(res.m_logs.size(), 1UL);
    ASSERT_EQ(owner_of(1).m_output,
              erc::abi::encoder().add_address(m_bob).data());
}

TEST_F(nft_contract_test, operator_approval) {
    auto res = m_contract->call(
        m_alice,
        erc::abi::encoder()
            .add_address(m_bob)
            .add_bool(true)
            .data(erc::abi::selector("setApprovalForAll(address,bool)")));
    ASSERT_TRUE(res.m_success);
    ASSERT_EQ(res.m_logs.size(), 1UL);
    ASSERT_EQ(res.m_logs[0].m_data, erc::abi::encoder().add_bool(true).data());

    res = m_contract->call(
        m_alice,
        erc::abi::encoder()
            .add_address(m_alice)
            .add_address(m_bob)
            .data(erc::abi::selector("isApprovedForAll(address,address)")));
    ASSERT_EQ(res.m_output, erc::abi::encoder().add_bool(true).data());

    // Flags other than 0 or 1 are malformed.
    res = m_contract->call(
        m_alice,
        erc::abi::encoder()
            .add_address(m_bob)
            .add_uint(erc::test::uint256(2))
            .data(erc::abi::selector("setApprovalForAll(address,bool)")));
    ASSERT_FALSE(res.m_success);
    ASSERT_TRUE(res.m_output.empty());
}

TEST_F(nft_contract_test, mint_with_uri) {
    auto mint_uri = [&](const std::string& uri) {
        return m_contract->call(
            m_deployer,
            erc::abi::encoder().add_address(m_alice).add_string(uri).data(
                erc::abi::selector("mint(address,string)")));
    };
    auto res = mint_uri("ipfs://zero");
    ASSERT_TRUE(res.m_success);
    ASSERT_EQ(res.m_output,
              erc::abi::encoder().add_uint(erc::test::uint256(0)).data());
    res = mint_uri("ipfs://one");
    ASSERT_EQ(res.m_output,
              erc::abi::encoder().add_uint(erc::test::uint256(1)).data());

    res = m_contract->call(
        m_alice,
        erc::abi::encoder()
            .add_uint(erc::test::uint256(1))
            .data(erc::abi::selector("tokenURI(uint256)")));
    ASSERT_EQ(res.m_output,
              erc::abi::encoder().add_string("ipfs://one").data());

    ASSERT_TRUE(mint(m_alice, 7).m_success);
    res = mint_uri("ipfs://two");
    ASSERT_FALSE(res.m_success);
    ASSERT_EQ(res.m_output,
              error_data("MaxSupplyReached(uint256)",
                         erc::abi::encoder().add_uint(erc::test::uint256(3))));

    res = m_contract->call(
        m_alice,
        erc::abi::encoder().data(erc::abi::selector("totalMinted()")));
    ASSERT_EQ(res.m_output,
              erc::abi::encoder().add_uint(erc::test::uint256(3)).data());
}

TEST_F(nft_contract_test, supports_interface) {
    auto query = [&](uint32_t id) {
        auto word = evmc::bytes32();
        word.bytes[0] = static_cast<uint8_t>(id >> 24U);
        word.bytes[1] = static_cast<uint8_t>(id >> 16U);
        word.bytes[2] = static_cast<uint8_t>(id >> 8U);
        word.bytes[3] = static_cast<uint8_t>(id);
        return m_contract->call(
            m_alice,
            erc::abi::encoder().add_word(word).data(
                erc::abi::selector("supportsInterface(bytes4)")));
    };
    ASSERT_EQ(query(0x80ac58cd).m_output,
              erc::abi::encoder().add_bool(true).data());
    ASSERT_EQ(query(0x5b5e139f).m_output,
              erc::abi::encoder().add_bool(true).data());
    ASSERT_EQ(query(0x01ffc9a7).m_output,
              erc::abi::encoder().add_bool(true).data());
    ASSERT_EQ(query(0xffffffff).m_output,
              erc::abi::encoder().add_bool(false).data());
}

TEST_F(nft_contract_test, unknown_and_short_calldata) {
    auto res = m_contract->call(m_alice, erc::buffer::from_hex("0102").value());
    ASSERT_FALSE(res.m_success);
    ASSERT_TRUE(res.m_output.empty());

    res = m_contract->call(
        m_alice,
        erc::abi::encoder().data(erc::abi::selector("totalSupply()")));
    ASSERT_FALSE(res.m_success);

    res = m_contract->call(
        m_alice,
        erc::abi::encoder().data(erc::abi::selector("ownerOf(uint256)")));
    ASSERT_FALSE(res.m_success);
    ASSERT_TRUE(res.m_output.empty());
}

TEST_F(nft_contract_test, abi_lists_interface) {
    auto abi = m_contract->abi();
    ASSERT_TRUE(abi.isArray());
    auto names = std::vector<std::string>();
    for(const auto& entry : abi) {
        names.push_back(entry["type"].asString() + ":"
                        + entry["name"].asString());
    }
    for(const auto* expected : {"function:transferFrom",
                                "function:setApprovalForAll",
                                "function:tokenURI",
                                "event:Transfer",
                                "event:ApprovalForAll",
                                "error:ERC721NonexistentToken",
                                "error:MaxSupplyReached"}) {
        ASSERT_NE(std::find(names.begin(), names.end(), expected),
                  names.end())
            << expected;
    }
    ASSERT_EQ(m_contract->get_address(), m_contract_addr);
}

TEST_F(nft_contract_test, engine_outlives_contract) {
    m_contract.reset();

    auto err = m_engine->mint(m_deployer, m_alice, erc::test::uint256(1));
    ASSERT_FALSE(err.has_value());
    auto res = m_engine->owner_of(erc::test::uint256(1));
    ASSERT_EQ(std::get<evmc::address>(res), m_alice);

    m_contract = std::make_shared<erc::abi::nft_contract>(m_contract_addr,
                                                          m_engine,
                                                          m_log);
    auto call_res = mint(m_bob, 2);
    ASSERT_TRUE(call_res.m_success);
    ASSERT_EQ(call_res.m_logs.size(), 1UL);
}
