// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "engine.hpp"

#include <utility>

namespace erc {
    engine::engine(std::shared_ptr<ledger::store> st,
                   std::shared_ptr<logging::log> logger)
        : m_log(std::move(logger)),
          m_store(std::move(st)) {}

    auto engine::add_listener(event_listener listener) -> listener_id {
        std::unique_lock l(m_mut);
        const auto id = m_next_listener++;
        m_listeners.emplace(id, std::move(listener));
        return id;
    }

    void engine::remove_listener(listener_id id) {
        std::unique_lock l(m_mut);
        m_listeners.erase(id);
    }

    auto engine::execute(const std::string& name, const operation_type& op)
        -> std::optional<error_code> {
        std::unique_lock l(m_mut);
        auto txn = ledger::transaction(m_store);
        auto events = std::vector<event>();

        auto err = op(txn, events);
        if(txn.failed()) {
            m_log->error(name, "failed to read ledger rows");
            return error_code::storage_failure;
        }
        if(err.has_value()) {
            m_log->debug(name, "rejected:", to_string(err.value()));
            return err;
        }
        const auto rows = txn.pending().size();
        if(!txn.commit()) {
            m_log->error(name, "failed to commit ledger rows");
            return error_code::storage_failure;
        }

        m_log->trace(name,
                     "committed",
                     rows,
                     "rows with",
                     events.size(),
                     "events");
        for(const auto& ev : events) {
            for(const auto& [id, listener] : m_listeners) {
                listener(ev);
            }
        }

        return std::nullopt;
    }
}
