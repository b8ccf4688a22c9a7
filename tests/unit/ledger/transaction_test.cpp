// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/transaction.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

class ledger_transaction_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_key = erc::buffer::from_hex("01aa").value();
        m_val = erc::buffer::from_hex("beef").value();
    }

    std::shared_ptr<erc::test::faulty_store> m_store{
        std::make_shared<erc::test::faulty_store>()};
    erc::buffer m_key;
    erc::buffer m_val;
};

TEST_F(ledger_transaction_test, read_your_writes) {
    auto txn = erc::ledger::transaction(m_store);
    ASSERT_FALSE(txn.get(m_key).has_value());

    txn.put(m_key, m_val);
    ASSERT_EQ(txn.get(m_key), m_val);
    ASSERT_EQ(m_store->size(), 0UL);
    ASSERT_FALSE(txn.failed());
}

TEST_F(ledger_transaction_test, commit_applies_batch) {
    auto txn = erc::ledger::transaction(m_store);
    txn.put(m_key, m_val);
    ASSERT_EQ(txn.pending().size(), 1UL);
    ASSERT_TRUE(txn.commit());
    ASSERT_TRUE(txn.pending().empty());
    ASSERT_EQ(m_store->size(), 1UL);

    auto res = m_store->get(m_key);
    ASSERT_TRUE(std::holds_alternative<erc::buffer>(res));
    ASSERT_EQ(std::get<erc::buffer>(res), m_val);
}

TEST_F(ledger_transaction_test, erase_hides_committed_row) {
    auto setup = erc::ledger::transaction(m_store);
    setup.put(m_key, m_val);
    ASSERT_TRUE(setup.commit());

    auto txn = erc::ledger::transaction(m_store);
    ASSERT_TRUE(txn.get(m_key).has_value());
    txn.erase(m_key);
    ASSERT_FALSE(txn.get(m_key).has_value());
    ASSERT_TRUE(txn.commit());
    ASSERT_EQ(m_store->size(), 0UL);
}

TEST_F(ledger_transaction_test, discarded_without_commit) {
    {
        auto txn = erc::ledger::transaction(m_store);
        txn.put(m_key, m_val);
    }
    ASSERT_EQ(m_store->size(), 0UL);
}

TEST_F(ledger_transaction_test, empty_commit) {
    auto txn = erc::ledger::transaction(m_store);
    m_store->fail_writes(true);
    ASSERT_TRUE(txn.commit());
}

TEST_F(ledger_transaction_test, read_failure_poisons) {
    m_store->fail_reads(true);
    auto txn = erc::ledger::transaction(m_store);
    ASSERT_FALSE(txn.get(m_key).has_value());
    ASSERT_TRUE(txn.failed());

    txn.put(m_key, m_val);
    m_store->fail_reads(false);
    ASSERT_FALSE(txn.commit());
    ASSERT_EQ(m_store->size(), 0UL);
}

TEST_F(ledger_transaction_test, explicit_poison) {
    auto txn = erc::ledger::transaction(m_store);
    txn.put(m_key, m_val);
    txn.poison();
    ASSERT_FALSE(txn.commit());
    ASSERT_EQ(m_store->size(), 0UL);
}

TEST_F(ledger_transaction_test, write_failure) {
    auto txn = erc::ledger::transaction(m_store);
    txn.put(m_key, m_val);
    m_store->fail_writes(true);
    ASSERT_FALSE(txn.commit());
    ASSERT_TRUE(txn.failed());
    ASSERT_EQ(m_store->size(), 0UL);
}
