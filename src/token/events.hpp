// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_TOKEN_EVENTS_H_
#define ERC_LEDGER_SRC_TOKEN_EVENTS_H_

#include <evmc/evmc.hpp>
#include <functional>
#include <optional>
#include <variant>

namespace erc {
    /// Ownership or balance moved between accounts. For non-fungible tokens
    /// the value is the token identifier, otherwise the amount moved.
    struct transfer_event {
        /// Previous holder, std::nullopt for a mint.
        std::optional<evmc::address> m_from;
        /// New holder, std::nullopt for a burn.
        std::optional<evmc::address> m_to;
        /// Token identifier or amount.
        evmc::uint256be m_value{};

        auto operator==(const transfer_event& rhs) const -> bool;
    };

    /// An owner granted a spender rights over a token or an allowance.
    struct approval_event {
        /// Account granting the approval.
        evmc::address m_owner{};
        /// Account receiving the approval.
        evmc::address m_spender{};
        /// Token identifier or allowance amount.
        evmc::uint256be m_value{};

        auto operator==(const approval_event& rhs) const -> bool;
    };

    /// An owner enabled or disabled an operator for all of its tokens.
    struct approval_for_all_event {
        /// Token owner.
        evmc::address m_owner{};
        /// Operator whose status changed.
        evmc::address m_operator{};
        /// New operator status.
        bool m_approved{};

        auto operator==(const approval_for_all_event& rhs) const -> bool;
    };

    /// Notification emitted by a committed engine operation.
    using event = std::variant<transfer_event,
                               approval_event,
                               approval_for_all_event>;

    /// Callback invoked with each event after the operation that produced
    /// it committed.
    using event_listener = std::function<void(const event&)>;
}

#endif // ERC_LEDGER_SRC_TOKEN_EVENTS_H_
