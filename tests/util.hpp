// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_TESTS_UTIL_H_
#define ERC_LEDGER_TESTS_UTIL_H_

#include "ledger/memory_store.hpp"
#include "token/events.hpp"

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

namespace erc::test {
    /// Returns an address whose last byte is n and all other bytes are zero.
    auto address(uint8_t n) -> evmc::address;

    /// Widens a small integer to a 256-bit value.
    auto uint256(uint64_t n) -> evmc::uint256be;

    /// Store wrapper that can be switched to fail reads or writes.
    class faulty_store : public ledger::store {
      public:
        auto get(const ledger::key_type& key) -> get_return_type override;
        auto write(const batch_type& batch) -> bool override;

        /// Makes every subsequent read return a backend error.
        void fail_reads(bool fail);
        /// Makes every subsequent write fail.
        void fail_writes(bool fail);

        /// Returns the number of rows held by the wrapped store.
        [[nodiscard]] auto size() const -> size_t;

      private:
        ledger::memory_store m_store;
        bool m_fail_reads{false};
        bool m_fail_writes{false};
    };

    /// Collects events delivered to an engine listener.
    struct event_recorder {
        std::vector<event> m_events;

        /// Returns a listener appending to m_events.
        auto listener() -> event_listener;
    };
}

#endif // ERC_LEDGER_TESTS_UTIL_H_
