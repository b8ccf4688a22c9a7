// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "transaction.hpp"

#include <utility>

namespace erc::ledger {
    transaction::transaction(std::shared_ptr<store> st)
        : m_store(std::move(st)) {}

    auto transaction::get(const key_type& key) -> std::optional<value_type> {
        auto it = m_pending.find(key);
        if(it != m_pending.end()) {
            return it->second;
        }

        auto res = m_store->get(key);
        if(std::holds_alternative<value_type>(res)) {
            return std::get<value_type>(std::move(res));
        }
        if(std::get<store::error_code>(res) != store::error_code::not_found) {
            m_failed = true;
        }
        return std::nullopt;
    }

    void transaction::put(const key_type& key, value_type val) {
        m_pending[key] = std::move(val);
    }

    void transaction::erase(const key_type& key) {
        m_pending[key] = std::nullopt;
    }

    void transaction::poison() {
        m_failed = true;
    }

    auto transaction::failed() const -> bool {
        return m_failed;
    }

    auto transaction::commit() -> bool {
        if(m_failed) {
            return false;
        }
        if(m_pending.empty()) {
            return true;
        }
        if(!m_store->write(m_pending)) {
            m_failed = true;
            return false;
        }
        m_pending.clear();
        return true;
    }

    auto transaction::pending() const -> const store::batch_type& {
        return m_pending;
    }
}
