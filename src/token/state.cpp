// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state.hpp"

#include "format.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/util.hpp"

namespace erc::state {
    namespace {
        template<typename T>
        auto read_row(ledger::transaction& txn, const ledger::key_type& key)
            -> std::optional<T> {
            auto maybe_row = txn.get(key);
            if(!maybe_row.has_value()) {
                return std::nullopt;
            }
            auto val = from_buffer<T>(maybe_row.value());
            if(!val.has_value()) {
                txn.poison();
            }
            return val;
        }
    }

    auto make_key(row r) -> ledger::key_type {
        return make_buffer(r);
    }

    auto make_key(row r, const evmc::bytes32& id) -> ledger::key_type {
        auto key = make_buffer(r);
        key.append(id.bytes, sizeof(id.bytes));
        return key;
    }

    auto make_key(row r, const evmc::address& addr) -> ledger::key_type {
        auto key = make_buffer(r);
        key.append(addr.bytes, sizeof(addr.bytes));
        return key;
    }

    auto make_key(row r,
                  const evmc::address& first,
                  const evmc::address& second) -> ledger::key_type {
        auto key = make_key(r, first);
        key.append(second.bytes, sizeof(second.bytes));
        return key;
    }

    auto read_address(ledger::transaction& txn, const ledger::key_type& key)
        -> std::optional<evmc::address> {
        return read_row<evmc::address>(txn, key);
    }

    auto read_uint256(ledger::transaction& txn, const ledger::key_type& key)
        -> evmc::uint256be {
        return read_row<evmc::uint256be>(txn, key).value_or(evmc::uint256be{});
    }

    auto read_string(ledger::transaction& txn, const ledger::key_type& key)
        -> std::optional<std::string> {
        return read_row<std::string>(txn, key);
    }

    auto read_flag(ledger::transaction& txn, const ledger::key_type& key)
        -> bool {
        return read_row<bool>(txn, key).value_or(false);
    }

    void write_address(ledger::transaction& txn,
                       const ledger::key_type& key,
                       const evmc::address& addr) {
        txn.put(key, make_buffer(addr));
    }

    void write_uint256(ledger::transaction& txn,
                       const ledger::key_type& key,
                       const evmc::uint256be& val) {
        txn.put(key, make_buffer(val));
    }

    void write_string(ledger::transaction& txn,
                      const ledger::key_type& key,
                      const std::string& str) {
        txn.put(key, make_buffer(str));
    }

    void write_flag(ledger::transaction& txn,
                    const ledger::key_type& key,
                    bool flag) {
        txn.put(key, make_buffer(flag));
    }
}
