// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "memory_store.hpp"

namespace erc::ledger {
    auto memory_store::get(const key_type& key) -> get_return_type {
        std::unique_lock l(m_mut);
        auto it = m_rows.find(key);
        if(it == m_rows.end()) {
            return error_code::not_found;
        }
        return it->second;
    }

    auto memory_store::write(const batch_type& batch) -> bool {
        std::unique_lock l(m_mut);
        for(const auto& [key, val] : batch) {
            if(val.has_value()) {
                m_rows[key] = val.value();
            } else {
                m_rows.erase(key);
            }
        }
        return true;
    }

    auto memory_store::size() const -> size_t {
        std::unique_lock l(m_mut);
        return m_rows.size();
    }
}
