// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_TOKEN_ENGINE_H_
#define ERC_LEDGER_SRC_TOKEN_ENGINE_H_

#include "error.hpp"
#include "events.hpp"
#include "ledger/interface.hpp"
#include "ledger/transaction.hpp"
#include "util/common/logging.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace erc {
    /// Common execution model of the token engines. Every operation runs
    /// under the engine mutex inside one ledger transaction, and commits only
    /// if it succeeded. Listeners receive the operation's events after the
    /// commit, in the order they were produced.
    class engine {
      public:
        /// Identifies a registered listener.
        using listener_id = uint64_t;

        /// Constructor.
        /// \param st ledger store owned by this engine.
        /// \param logger log instance.
        engine(std::shared_ptr<ledger::store> st,
               std::shared_ptr<logging::log> logger);

        virtual ~engine() = default;

        engine(const engine&) = delete;
        auto operator=(const engine&) -> engine& = delete;
        engine(engine&&) = delete;
        auto operator=(engine&&) -> engine& = delete;

        /// Registers a function to be called with every event emitted by a
        /// committed operation. Listeners run while the engine is locked and
        /// must not call back into the engine.
        /// \param listener function to register.
        /// \return identifier to pass to remove_listener.
        auto add_listener(event_listener listener) -> listener_id;

        /// Unregisters a listener. Once this returns the listener will not
        /// be called again. Unknown identifiers are ignored.
        /// \param id identifier returned by add_listener.
        void remove_listener(listener_id id);

      protected:
        /// Body of a mutating operation. Stages writes in the transaction and
        /// appends events to the vector.
        using operation_type = std::function<std::optional<error_code>(
            ledger::transaction&,
            std::vector<event>&)>;

        /// Runs a mutating operation and commits its writes.
        /// \param name operation name for logging.
        /// \param op operation body.
        /// \return std::nullopt on success, or the error that prevented the
        ///         commit.
        auto execute(const std::string& name, const operation_type& op)
            -> std::optional<error_code>;

        /// Runs a read-only query against a fresh transaction which is
        /// discarded afterwards.
        /// \tparam T query result type.
        /// \param fn query body.
        /// \return the query result, or error_code::storage_failure if a row
        ///         could not be read.
        template<typename T>
        auto query(
            const std::function<std::variant<T, error_code>(
                ledger::transaction&)>& fn) -> std::variant<T, error_code> {
            std::unique_lock l(m_mut);
            auto txn = ledger::transaction(m_store);
            auto res = fn(txn);
            if(txn.failed()) {
                m_log->error("Failed to read ledger rows");
                return error_code::storage_failure;
            }
            return res;
        }

        std::shared_ptr<logging::log> m_log;

      private:
        std::mutex m_mut;
        std::shared_ptr<ledger::store> m_store;
        listener_id m_next_listener{0};
        std::map<listener_id, event_listener> m_listeners;
    };
}

#endif // ERC_LEDGER_SRC_TOKEN_ENGINE_H_
