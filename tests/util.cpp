// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include "token/math.hpp"

namespace erc::test {
    auto address(uint8_t n) -> evmc::address {
        auto ret = evmc::address();
        ret.bytes[sizeof(ret.bytes) - 1] = n;
        return ret;
    }

    auto uint256(uint64_t n) -> evmc::uint256be {
        return from_uint64(n);
    }

    auto faulty_store::get(const ledger::key_type& key) -> get_return_type {
        if(m_fail_reads) {
            return error_code::backend;
        }
        return m_store.get(key);
    }

    auto faulty_store::write(const batch_type& batch) -> bool {
        if(m_fail_writes) {
            return false;
        }
        return m_store.write(batch);
    }

    void faulty_store::fail_reads(bool fail) {
        m_fail_reads = fail;
    }

    void faulty_store::fail_writes(bool fail) {
        m_fail_writes = fail;
    }

    auto faulty_store::size() const -> size_t {
        return m_store.size();
    }

    auto event_recorder::listener() -> event_listener {
        return [&](const event& ev) {
            m_events.push_back(ev);
        };
    }
}
