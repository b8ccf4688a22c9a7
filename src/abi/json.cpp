// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "json.hpp"

namespace erc::abi {
    namespace {
        auto to_string(mutability m) -> std::string {
            switch(m) {
                case mutability::pure:
                    return "pure";
                case mutability::view:
                    return "view";
                case mutability::nonpayable:
                    return "nonpayable";
            }
            return "nonpayable";
        }

        auto params_to_json(const std::vector<param>& params, bool is_event)
            -> Json::Value {
            auto ret = Json::Value(Json::arrayValue);
            for(const auto& p : params) {
                auto entry = Json::Value();
                entry["name"] = p.m_name;
                entry["type"] = p.m_type;
                entry["internalType"] = p.m_type;
                if(is_event) {
                    entry["indexed"] = p.m_indexed;
                }
                ret.append(entry);
            }
            return ret;
        }
    }

    auto function_to_json(const function_spec& fn) -> Json::Value {
        auto ret = Json::Value();
        ret["type"] = "function";
        ret["name"] = fn.m_name;
        ret["inputs"] = params_to_json(fn.m_inputs, false);
        ret["outputs"] = params_to_json(fn.m_outputs, false);
        ret["stateMutability"] = to_string(fn.m_mutability);
        return ret;
    }

    auto event_to_json(const event_spec& ev) -> Json::Value {
        auto ret = Json::Value();
        ret["type"] = "event";
        ret["name"] = ev.m_name;
        ret["inputs"] = params_to_json(ev.m_inputs, true);
        ret["anonymous"] = false;
        return ret;
    }

    auto error_to_json(const error_spec& err) -> Json::Value {
        auto ret = Json::Value();
        ret["type"] = "error";
        ret["name"] = err.m_name;
        ret["inputs"] = params_to_json(err.m_inputs, false);
        return ret;
    }

    auto abi_to_json(const std::vector<function_spec>& functions,
                     const std::vector<event_spec>& events,
                     const std::vector<error_spec>& errors) -> Json::Value {
        auto ret = Json::Value(Json::arrayValue);
        for(const auto& fn : functions) {
            ret.append(function_to_json(fn));
        }
        for(const auto& ev : events) {
            ret.append(event_to_json(ev));
        }
        for(const auto& err : errors) {
            ret.append(error_to_json(err));
        }
        return ret;
    }

    auto json_to_string(const Json::Value& val) -> std::string {
        auto builder = Json::StreamWriterBuilder();
        builder["indentation"] = "  ";
        return Json::writeString(builder, val);
    }
}
