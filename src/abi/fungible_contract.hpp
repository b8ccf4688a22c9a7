// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_ABI_FUNGIBLE_CONTRACT_H_
#define ERC_LEDGER_SRC_ABI_FUNGIBLE_CONTRACT_H_

#include "contract.hpp"
#include "token/fungible/engine.hpp"

namespace erc::abi {
    /// ERC-20 call surface over a fungible token engine, with mint and burn
    /// entry points and OpenZeppelin 5 custom error reverts.
    class fungible_contract : public contract {
      public:
        /// Constructor. Registers a listener with the engine.
        /// \param addr contract address.
        /// \param eng engine to dispatch to.
        /// \param logger log instance.
        fungible_contract(const evmc::address& addr,
                          std::shared_ptr<fungible::engine> eng,
                          std::shared_ptr<logging::log> logger);

        /// Destructor. Unregisters the listener from the engine.
        ~fungible_contract() override;

        fungible_contract(const fungible_contract&) = delete;
        auto operator=(const fungible_contract&) -> fungible_contract& = delete;
        fungible_contract(fungible_contract&&) = delete;
        auto operator=(fungible_contract&&) -> fungible_contract& = delete;

      private:
        std::shared_ptr<fungible::engine> m_engine;
        engine::listener_id m_listener;

        auto handle_name(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_symbol(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_decimals(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_total_supply(const evmc::address& caller,
                                 const decoder& dec)
            -> std::optional<call_result>;
        auto handle_balance_of(const evmc::address& caller,
                               const decoder& dec)
            -> std::optional<call_result>;
        auto handle_allowance(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_transfer(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_transfer_from(const evmc::address& caller,
                                  const decoder& dec)
            -> std::optional<call_result>;
        auto handle_approve(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_mint(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_burn(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;

        /// Builds the revert for a failed engine operation.
        /// \param err engine error.
        /// \param sender account whose balance was debited.
        /// \param spender account whose allowance was spent.
        /// \param needed requested amount.
        auto revert_for(error_code err,
                        const evmc::address& sender,
                        const evmc::address& spender,
                        const evmc::uint256be& needed) -> call_result;

        /// Encodes a view result holding a single uint256.
        auto uint_result(const std::variant<evmc::uint256be, error_code>& res)
            -> call_result;

        void register_functions();
        void register_events_and_errors();
    };
}

#endif // ERC_LEDGER_SRC_ABI_FUNGIBLE_CONTRACT_H_
