// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_ABI_NFT_CONTRACT_H_
#define ERC_LEDGER_SRC_ABI_NFT_CONTRACT_H_

#include "contract.hpp"
#include "token/nft/engine.hpp"

namespace erc::abi {
    /// ERC-721 call surface over a non-fungible token engine, including the
    /// metadata extension, ERC-165 detection, auto-increment minting and
    /// OpenZeppelin 5 custom error reverts.
    class nft_contract : public contract {
      public:
        /// Constructor. Registers a listener with the engine.
        /// \param addr contract address.
        /// \param eng engine to dispatch to.
        /// \param logger log instance.
        nft_contract(const evmc::address& addr,
                     std::shared_ptr<nft::engine> eng,
                     std::shared_ptr<logging::log> logger);

        /// Destructor. Unregisters the listener from the engine.
        ~nft_contract() override;

        nft_contract(const nft_contract&) = delete;
        auto operator=(const nft_contract&) -> nft_contract& = delete;
        nft_contract(nft_contract&&) = delete;
        auto operator=(nft_contract&&) -> nft_contract& = delete;

      private:
        std::shared_ptr<nft::engine> m_engine;
        engine::listener_id m_listener;

        auto handle_name(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_symbol(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_token_uri(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_balance_of(const evmc::address& caller,
                               const decoder& dec)
            -> std::optional<call_result>;
        auto handle_owner_of(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_get_approved(const evmc::address& caller,
                                 const decoder& dec)
            -> std::optional<call_result>;
        auto handle_is_approved_for_all(const evmc::address& caller,
                                        const decoder& dec)
            -> std::optional<call_result>;
        auto handle_total_minted(const evmc::address& caller,
                                 const decoder& dec)
            -> std::optional<call_result>;
        auto handle_max_supply(const evmc::address& caller,
                               const decoder& dec)
            -> std::optional<call_result>;
        auto handle_get_owner(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_supports_interface(const evmc::address& caller,
                                       const decoder& dec)
            -> std::optional<call_result>;
        auto handle_mint(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_mint_uri(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_transfer_from(const evmc::address& caller,
                                  const decoder& dec)
            -> std::optional<call_result>;
        auto handle_approve(const evmc::address& caller, const decoder& dec)
            -> std::optional<call_result>;
        auto handle_set_approval_for_all(const evmc::address& caller,
                                         const decoder& dec)
            -> std::optional<call_result>;

        /// Builds the revert for a failed engine operation, querying the
        /// current ledger state for the error arguments.
        /// \param err engine error.
        /// \param caller address that invoked the operation.
        /// \param token_id token the operation referred to.
        /// \param from stated owner for transfers, std::nullopt otherwise.
        auto revert_for(error_code err,
                        const evmc::address& caller,
                        const evmc::uint256be& token_id,
                        const std::optional<evmc::address>& from)
            -> call_result;

        void register_functions();
        void register_events_and_errors();
    };
}

#endif // ERC_LEDGER_SRC_ABI_NFT_CONTRACT_H_
