// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ERC_LEDGER_SRC_UTIL_COMMON_VARIANT_OVERLOADED_H_
#define ERC_LEDGER_SRC_UTIL_COMMON_VARIANT_OVERLOADED_H_

#include <variant>

namespace erc {
    /// \brief Variant handler template
    ///
    /// Provides template structure for defining handlers for std::variant
    /// types in an std::visit function.
    ///
    /// Example:
    /// \code{.cpp}
    ///      std::variant<A, B> somevar = ...;
    ///      std::visit(overloaded{
    ///                     [&](const A&) {...},
    ///                     [&](const B&) {...}
    ///                 },
    ///                 somevar);
    /// \endcode
    ///
    /// \tparam Ts lambda overloads
    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

#endif // ERC_LEDGER_SRC_UTIL_COMMON_VARIANT_OVERLOADED_H_
