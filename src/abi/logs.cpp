// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logs.hpp"

#include "codec.hpp"
#include "util/common/variant_overloaded.hpp"

namespace erc::abi {
    namespace {
        auto party_word(const std::optional<evmc::address>& addr)
            -> evmc::bytes32 {
            return address_word(addr.value_or(evmc::address{}));
        }

        auto approval_for_all_log(const approval_for_all_event& e)
            -> evm_log {
            auto log = evm_log();
            log.m_topics = {topic(approval_for_all_signature),
                            address_word(e.m_owner),
                            address_word(e.m_operator)};
            log.m_data = encoder().add_bool(e.m_approved).data();
            return log;
        }
    }

    auto erc721_log(const event& ev) -> evm_log {
        return std::visit(
            overloaded{[&](const transfer_event& e) {
                           auto log = evm_log();
                           log.m_topics = {topic(transfer_signature),
                                           party_word(e.m_from),
                                           party_word(e.m_to),
                                           e.m_value};
                           return log;
                       },
                       [&](const approval_event& e) {
                           auto log = evm_log();
                           log.m_topics = {topic(approval_signature),
                                           address_word(e.m_owner),
                                           address_word(e.m_spender),
                                           e.m_value};
                           return log;
                       },
                       [&](const approval_for_all_event& e) {
                           return approval_for_all_log(e);
                       }},
            ev);
    }

    auto erc20_log(const event& ev) -> evm_log {
        return std::visit(
            overloaded{[&](const transfer_event& e) {
                           auto log = evm_log();
                           log.m_topics = {topic(transfer_signature),
                                           party_word(e.m_from),
                                           party_word(e.m_to)};
                           log.m_data = encoder().add_uint(e.m_value).data();
                           return log;
                       },
                       [&](const approval_event& e) {
                           auto log = evm_log();
                           log.m_topics = {topic(approval_signature),
                                           address_word(e.m_owner),
                                           address_word(e.m_spender)};
                           log.m_data = encoder().add_uint(e.m_value).data();
                           return log;
                       },
                       [&](const approval_for_all_event& e) {
                           return approval_for_all_log(e);
                       }},
            ev);
    }
}
