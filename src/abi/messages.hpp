// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_ABI_MESSAGES_H_
#define ERC_LEDGER_SRC_ABI_MESSAGES_H_

#include "util/common/buffer.hpp"

#include <evmc/evmc.hpp>
#include <string>
#include <vector>

namespace erc::abi {
    /// EVM log output type.
    struct evm_log {
        /// Address of the contract emitting the log.
        evmc::address m_addr{};
        /// Log data.
        buffer m_data{};
        /// List of log topics.
        std::vector<evmc::bytes32> m_topics{};

        auto operator==(const evm_log& rhs) const -> bool;
    };

    /// Result of dispatching calldata to a contract.
    struct call_result {
        /// False if the call reverted.
        bool m_success{false};
        /// ABI encoded return values, or revert data.
        buffer m_output{};
        /// Logs emitted by the call. Always empty for reverted calls.
        std::vector<evm_log> m_logs{};
    };

    /// Function or event parameter description.
    struct param {
        /// Parameter name.
        std::string m_name;
        /// Canonical ABI type name.
        std::string m_type;
        /// True for event parameters stored as topics.
        bool m_indexed{false};
    };

    /// State mutability of a contract function.
    enum class mutability : uint8_t {
        pure,
        view,
        nonpayable
    };

    /// Description of a contract function.
    struct function_spec {
        std::string m_name;
        std::vector<param> m_inputs;
        std::vector<param> m_outputs;
        mutability m_mutability{mutability::nonpayable};
    };

    /// Description of an event or custom error. Both are identified by the
    /// hash of their canonical signature.
    struct event_spec {
        std::string m_name;
        std::vector<param> m_inputs;
    };

    /// Description of a custom error.
    using error_spec = event_spec;

    /// Builds the canonical signature "name(type1,type2,...)".
    /// \param name function, event or error name.
    /// \param inputs parameter list.
    /// \return canonical signature.
    auto signature(const std::string& name, const std::vector<param>& inputs)
        -> std::string;
}

#endif // ERC_LEDGER_SRC_ABI_MESSAGES_H_
