// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file contract.hpp
 * Selector based calldata dispatch shared by the token contracts.
 */

#ifndef ERC_LEDGER_SRC_ABI_CONTRACT_H_
#define ERC_LEDGER_SRC_ABI_CONTRACT_H_

#include "codec.hpp"
#include "messages.hpp"
#include "token/error.hpp"
#include "token/events.hpp"
#include "util/common/logging.hpp"

#include <functional>
#include <json/json.h>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace erc::abi {
    /// Panic code raised by checked arithmetic.
    static constexpr uint64_t panic_arithmetic = 0x11;

    /// Calldata entry point for a token engine. Each registered function is
    /// reachable through the selector of its canonical signature. Calls are
    /// serialized, and logs produced by the engine during a call are
    /// returned with its result.
    class contract {
      public:
        /// Constructor.
        /// \param addr address of the contract, used as the log address.
        /// \param logger log instance.
        contract(const evmc::address& addr,
                 std::shared_ptr<logging::log> logger);

        virtual ~contract() = default;

        contract(const contract&) = delete;
        auto operator=(const contract&) -> contract& = delete;
        contract(contract&&) = delete;
        auto operator=(contract&&) -> contract& = delete;

        /// Dispatches calldata to the function matching its selector.
        /// \param caller address invoking the contract.
        /// \param calldata selector followed by ABI encoded arguments.
        /// \return return data and logs, or a revert. Calldata that is too
        ///         short, malformed, or names an unknown selector reverts
        ///         with empty data.
        auto call(const evmc::address& caller, const buffer& calldata)
            -> call_result;

        /// Returns the Solidity JSON ABI of the contract.
        [[nodiscard]] auto abi() const -> Json::Value;

        /// Returns the registered functions in registration order.
        [[nodiscard]] auto functions() const
            -> const std::vector<function_spec>&;

        /// Returns the contract address.
        [[nodiscard]] auto get_address() const -> const evmc::address&;

      protected:
        /// Function implementation. Returns std::nullopt if the arguments
        /// could not be decoded.
        using handler_type
            = std::function<std::optional<call_result>(const evmc::address&,
                                                       const decoder&)>;

        /// Registers a function and makes it callable.
        void add_function(function_spec spec, handler_type handler);
        /// Registers an event for ABI export.
        void add_event(event_spec spec);
        /// Registers a custom error for ABI export.
        void add_error(error_spec spec);

        /// Converts an engine event to a log and attaches it to the call in
        /// progress.
        void record_log(evm_log log);

        /// Successful result with the given return data.
        static auto success(buffer output = buffer()) -> call_result;
        /// Reverted result with the given revert data.
        static auto revert(buffer data = buffer()) -> call_result;
        /// Revert carrying Panic(uint256) with the given code.
        static auto panic(uint64_t code) -> call_result;
        /// Revert carrying a custom error with the given arguments.
        static auto revert_error(const error_spec& spec, const encoder& args)
            -> call_result;

        std::shared_ptr<logging::log> m_log;

      private:
        evmc::address m_addr;

        std::mutex m_call_mut;
        std::unordered_map<selector_type, handler_type> m_handlers;
        std::vector<function_spec> m_functions;
        std::vector<event_spec> m_events;
        std::vector<error_spec> m_errors;

        std::mutex m_logs_mut;
        std::vector<evm_log> m_logs;
    };
}

#endif // ERC_LEDGER_SRC_ABI_CONTRACT_H_
