// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_ABI_LOGS_H_
#define ERC_LEDGER_SRC_ABI_LOGS_H_

#include "messages.hpp"
#include "token/events.hpp"

namespace erc::abi {
    /// Canonical signature of the Transfer event.
    static constexpr auto transfer_signature
        = "Transfer(address,address,uint256)";
    /// Canonical signature of the Approval event.
    static constexpr auto approval_signature
        = "Approval(address,address,uint256)";
    /// Canonical signature of the ApprovalForAll event.
    static constexpr auto approval_for_all_signature
        = "ApprovalForAll(address,address,bool)";

    /// Encodes an event with the ERC-721 layout. Transfer and Approval carry
    /// all three parameters as topics and no data. ApprovalForAll carries
    /// the owner and operator as topics and the flag as data.
    /// \param ev event to encode.
    /// \return log without an address.
    auto erc721_log(const event& ev) -> evm_log;

    /// Encodes an event with the ERC-20 layout. Addresses are topics and the
    /// value is the data.
    /// \param ev event to encode.
    /// \return log without an address.
    auto erc20_log(const event& ev) -> evm_log;
}

#endif // ERC_LEDGER_SRC_ABI_LOGS_H_
