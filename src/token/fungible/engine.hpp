// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file engine.hpp
 * Fungible token ledger with ERC-20 balance and allowance semantics.
 */

#ifndef ERC_LEDGER_SRC_TOKEN_FUNGIBLE_ENGINE_H_
#define ERC_LEDGER_SRC_TOKEN_FUNGIBLE_ENGINE_H_

#include "token/engine.hpp"

#include <evmc/evmc.hpp>

namespace erc::fungible {
    /// Default number of display decimals.
    static constexpr uint8_t default_decimals = 18;

    /// Token properties fixed at construction.
    struct metadata {
        /// Token name.
        std::string m_name;
        /// Token symbol.
        std::string m_symbol;
        /// Number of decimals used for display.
        uint8_t m_decimals{default_decimals};
    };

    /// Fungible token engine. Maintains balances, allowances and the total
    /// supply, which always equals the sum of all balances.
    class engine : public erc::engine {
      public:
        /// Constructor.
        /// \param meta token properties.
        /// \param st ledger store holding the token state.
        /// \param logger log instance.
        engine(metadata meta,
               std::shared_ptr<ledger::store> st,
               std::shared_ptr<logging::log> logger);

        /// Creates new tokens. Any caller may mint.
        /// \param caller address invoking the operation.
        /// \param to recipient of the new tokens.
        /// \param value amount to create.
        /// \return arithmetic_overflow if the total supply or the recipient
        ///         balance would exceed 2^256 - 1, or std::nullopt on success.
        auto mint(const evmc::address& caller,
                  const evmc::address& to,
                  const evmc::uint256be& value) -> std::optional<error_code>;

        /// Destroys tokens held by an account.
        /// \param caller address invoking the operation.
        /// \param from account to debit.
        /// \param value amount to destroy.
        /// \return insufficient_balance if the account holds less than value,
        ///         or std::nullopt on success.
        auto burn(const evmc::address& caller,
                  const evmc::address& from,
                  const evmc::uint256be& value) -> std::optional<error_code>;

        /// Moves tokens from the caller to another account.
        /// \param caller sender.
        /// \param to recipient.
        /// \param value amount to move.
        /// \return insufficient_balance if the caller holds less than value,
        ///         or std::nullopt on success.
        auto transfer(const evmc::address& caller,
                      const evmc::address& to,
                      const evmc::uint256be& value)
            -> std::optional<error_code>;

        /// Moves tokens on behalf of their owner, spending the caller's
        /// allowance.
        /// \param caller spender.
        /// \param from owner of the tokens.
        /// \param to recipient.
        /// \param value amount to move.
        /// \return insufficient_allowance, insufficient_balance, or
        ///         std::nullopt on success.
        auto transfer_from(const evmc::address& caller,
                           const evmc::address& from,
                           const evmc::address& to,
                           const evmc::uint256be& value)
            -> std::optional<error_code>;

        /// Sets the amount a spender may move on the caller's behalf,
        /// replacing any previous allowance.
        /// \param caller owner granting the allowance.
        /// \param spender account receiving the allowance.
        /// \param value new allowance.
        /// \return std::nullopt on success.
        auto approve(const evmc::address& caller,
                     const evmc::address& spender,
                     const evmc::uint256be& value)
            -> std::optional<error_code>;

        /// Returns the remaining allowance of a spender.
        auto allowance(const evmc::address& owner,
                       const evmc::address& spender)
            -> std::variant<evmc::uint256be, error_code>;

        /// Returns the balance of an account.
        auto balance_of(const evmc::address& owner)
            -> std::variant<evmc::uint256be, error_code>;

        /// Returns the sum of all balances.
        auto total_supply() -> std::variant<evmc::uint256be, error_code>;

        [[nodiscard]] auto name() const -> const std::string&;
        [[nodiscard]] auto symbol() const -> const std::string&;
        [[nodiscard]] auto decimals() const -> uint8_t;

      private:
        metadata m_meta;

        /// Debits one account and credits another within a transaction.
        static auto move_balance(ledger::transaction& txn,
                                 std::vector<event>& events,
                                 const evmc::address& from,
                                 const evmc::address& to,
                                 const evmc::uint256be& value)
            -> std::optional<error_code>;
    };
}

#endif // ERC_LEDGER_SRC_TOKEN_FUNGIBLE_ENGINE_H_
