// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "contract.hpp"

#include "json.hpp"
#include "token/math.hpp"

namespace erc::abi {
    contract::contract(const evmc::address& addr,
                       std::shared_ptr<logging::log> logger)
        : m_log(std::move(logger)),
          m_addr(addr) {}

    auto contract::call(const evmc::address& caller, const buffer& calldata)
        -> call_result {
        std::unique_lock l(m_call_mut);
        auto dec = decoder(calldata);
        auto sel = dec.get_selector();
        if(!sel.has_value()) {
            m_log->debug("Calldata shorter than a selector");
            return revert();
        }

        auto it = m_handlers.find(sel.value());
        if(it == m_handlers.end()) {
            m_log->debug("Unknown selector", sel.value());
            return revert();
        }

        {
            std::unique_lock ll(m_logs_mut);
            m_logs.clear();
        }

        auto res = it->second(caller, dec);
        if(!res.has_value()) {
            m_log->debug("Malformed calldata for selector", sel.value());
            return revert();
        }

        std::unique_lock ll(m_logs_mut);
        if(res->m_success) {
            res->m_logs = std::move(m_logs);
        }
        m_logs.clear();
        return std::move(res.value());
    }

    auto contract::abi() const -> Json::Value {
        return abi_to_json(m_functions, m_events, m_errors);
    }

    auto contract::functions() const -> const std::vector<function_spec>& {
        return m_functions;
    }

    auto contract::get_address() const -> const evmc::address& {
        return m_addr;
    }

    void contract::add_function(function_spec spec, handler_type handler) {
        m_handlers[selector(signature(spec.m_name, spec.m_inputs))]
            = std::move(handler);
        m_functions.emplace_back(std::move(spec));
    }

    void contract::add_event(event_spec spec) {
        m_events.emplace_back(std::move(spec));
    }

    void contract::add_error(error_spec spec) {
        m_errors.emplace_back(std::move(spec));
    }

    void contract::record_log(evm_log log) {
        log.m_addr = m_addr;
        std::unique_lock l(m_logs_mut);
        m_logs.emplace_back(std::move(log));
    }

    auto contract::success(buffer output) -> call_result {
        auto ret = call_result();
        ret.m_success = true;
        ret.m_output = std::move(output);
        return ret;
    }

    auto contract::revert(buffer data) -> call_result {
        auto ret = call_result();
        ret.m_success = false;
        ret.m_output = std::move(data);
        return ret;
    }

    auto contract::panic(uint64_t code) -> call_result {
        return revert(
            encoder().add_uint(from_uint64(code)).data(
                selector("Panic(uint256)")));
    }

    auto contract::revert_error(const error_spec& spec, const encoder& args)
        -> call_result {
        return revert(
            args.data(selector(signature(spec.m_name, spec.m_inputs))));
    }
}
