// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file engine.hpp
 * Non-fungible token ledger with ERC-721 ownership and approval semantics.
 */

#ifndef ERC_LEDGER_SRC_TOKEN_NFT_ENGINE_H_
#define ERC_LEDGER_SRC_TOKEN_NFT_ENGINE_H_

#include "token/engine.hpp"

#include <evmc/evmc.hpp>

namespace erc::nft {
    /// ERC-165 interface identifier of ERC-165 itself.
    static constexpr uint32_t erc165_interface_id = 0x01ffc9a7;
    /// ERC-165 interface identifier of ERC-721.
    static constexpr uint32_t erc721_interface_id = 0x80ac58cd;
    /// ERC-165 interface identifier of the ERC-721 metadata extension.
    static constexpr uint32_t erc721_metadata_interface_id = 0x5b5e139f;

    /// Collection properties fixed at construction.
    struct metadata {
        /// Collection name.
        std::string m_name;
        /// Collection symbol.
        std::string m_symbol;
        /// Prefix for token URIs of tokens minted without their own URI.
        /// Empty to disable.
        std::string m_base_uri;
        /// Maximum number of tokens that may ever be minted. Zero for no
        /// limit.
        evmc::uint256be m_max_supply{};
        /// Address that deployed the collection.
        evmc::address m_owner{};
    };

    /// Non-fungible token engine. Tracks the owner of every token, per-owner
    /// token counts, single-token approvals and operator approvals.
    class engine : public erc::engine {
      public:
        /// Constructor.
        /// \param meta collection properties.
        /// \param st ledger store holding the collection state.
        /// \param logger log instance.
        engine(metadata meta,
               std::shared_ptr<ledger::store> st,
               std::shared_ptr<logging::log> logger);

        /// Creates a token owned by the given address. Any caller may mint.
        /// \param caller address invoking the operation.
        /// \param to owner of the new token.
        /// \param token_id identifier of the new token.
        /// \return already_minted if the token exists, max_supply_reached if
        ///         the collection is full, or std::nullopt on success.
        auto mint(const evmc::address& caller,
                  const evmc::address& to,
                  const evmc::uint256be& token_id)
            -> std::optional<error_code>;

        /// Creates the token with the next sequential identifier and records
        /// its metadata URI.
        /// \param caller address invoking the operation.
        /// \param to owner of the new token.
        /// \param uri metadata URI of the new token.
        /// \return identifier of the new token, or the error code.
        auto mint_next(const evmc::address& caller,
                       const evmc::address& to,
                       const std::string& uri)
            -> std::variant<evmc::uint256be, error_code>;

        /// Moves a token between accounts and clears its approval. The caller
        /// must be the owner, the approved address, or an approved operator.
        /// \param caller address invoking the operation.
        /// \param from current owner of the token.
        /// \param to new owner of the token.
        /// \param token_id token to move.
        /// \return not_owner if from does not own the token, not_approved if
        ///         the caller may not move it, or std::nullopt on success.
        auto transfer_from(const evmc::address& caller,
                           const evmc::address& from,
                           const evmc::address& to,
                           const evmc::uint256be& token_id)
            -> std::optional<error_code>;

        /// Sets the approved address of a token. Only the owner may approve.
        /// \param caller address invoking the operation.
        /// \param spender address to approve.
        /// \param token_id token to approve.
        /// \return not_owner if the caller does not own the token, or
        ///         std::nullopt on success.
        auto approve(const evmc::address& caller,
                     const evmc::address& spender,
                     const evmc::uint256be& token_id)
            -> std::optional<error_code>;

        /// Enables or disables an operator for all of the caller's tokens.
        /// \param caller token owner.
        /// \param op operator address.
        /// \param approved new operator status.
        /// \return std::nullopt on success.
        auto set_approval_for_all(const evmc::address& caller,
                                  const evmc::address& op,
                                  bool approved) -> std::optional<error_code>;

        [[nodiscard]] auto name() const -> const std::string&;
        [[nodiscard]] auto symbol() const -> const std::string&;

        /// Returns the owner of a token.
        /// \return owner address, or nonexistent_token.
        auto owner_of(const evmc::uint256be& token_id)
            -> std::variant<evmc::address, error_code>;

        /// Returns the number of tokens owned by an address.
        auto balance_of(const evmc::address& owner)
            -> std::variant<evmc::uint256be, error_code>;

        /// Returns the approved address of a token, the zero address if none
        /// is set.
        /// \return approved address, or nonexistent_token.
        auto get_approved(const evmc::uint256be& token_id)
            -> std::variant<evmc::address, error_code>;

        /// Returns whether an operator is approved for all of an owner's
        /// tokens.
        auto is_approved_for_all(const evmc::address& owner,
                                 const evmc::address& op)
            -> std::variant<bool, error_code>;

        /// Returns the metadata URI of a token. Tokens minted with a URI
        /// return it. Otherwise the base URI followed by the decimal token
        /// identifier is returned, or an empty string without a base URI.
        /// \return the URI, or nonexistent_token.
        auto token_uri(const evmc::uint256be& token_id)
            -> std::variant<std::string, error_code>;

        /// Returns the number of tokens minted so far.
        auto total_minted() -> std::variant<evmc::uint256be, error_code>;

        /// Returns the configured supply cap, zero when unlimited.
        [[nodiscard]] auto max_supply() const -> evmc::uint256be;

        /// Returns the address that deployed the collection.
        [[nodiscard]] auto contract_owner() const -> evmc::address;

        /// Checks for ERC-165 interface support.
        /// \param interface_id four byte interface identifier.
        /// \return true for ERC-165, ERC-721 and ERC-721 metadata.
        static auto supports_interface(uint32_t interface_id) -> bool;

      private:
        metadata m_meta;

        auto mint_token(ledger::transaction& txn,
                        std::vector<event>& events,
                        const evmc::address& to,
                        const evmc::uint256be& token_id)
            -> std::optional<error_code>;
    };
}

#endif // ERC_LEDGER_SRC_TOKEN_NFT_ENGINE_H_
