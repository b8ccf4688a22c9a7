// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "events.hpp"

namespace erc {
    auto transfer_event::operator==(const transfer_event& rhs) const -> bool {
        return m_from == rhs.m_from && m_to == rhs.m_to
            && m_value == rhs.m_value;
    }

    auto approval_event::operator==(const approval_event& rhs) const -> bool {
        return m_owner == rhs.m_owner && m_spender == rhs.m_spender
            && m_value == rhs.m_value;
    }

    auto approval_for_all_event::operator==(
        const approval_for_all_event& rhs) const -> bool {
        return m_owner == rhs.m_owner && m_operator == rhs.m_operator
            && m_approved == rhs.m_approved;
    }
}
