// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "messages.hpp"

namespace erc::abi {
    auto evm_log::operator==(const evm_log& rhs) const -> bool {
        return m_addr == rhs.m_addr && m_data == rhs.m_data
            && m_topics == rhs.m_topics;
    }

    auto signature(const std::string& name, const std::vector<param>& inputs)
        -> std::string {
        auto ret = name + "(";
        for(size_t i = 0; i < inputs.size(); i++) {
            if(i != 0) {
                ret += ",";
            }
            ret += inputs[i].m_type;
        }
        ret += ")";
        return ret;
    }
}
