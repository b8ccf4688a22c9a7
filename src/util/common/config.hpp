// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
//               2022 MITRE Corporation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file config.hpp
 * Tools for reading options from a configuration file.
 */

#ifndef ERC_LEDGER_SRC_UTIL_COMMON_CONFIG_H_
#define ERC_LEDGER_SRC_UTIL_COMMON_CONFIG_H_

#include "logging.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace erc::config {
    /// \brief Maximum bytes optimistically reserved at once during deserialization.
    /// When deserializing, we want to limit the amount of memory we reserve
    /// without the sender actually sending that amount of information. This
    /// constant is used when deserializing so that a sender must send at least
    /// X bytes of information for us to allocate X+1MiB of memory.
    static constexpr uint64_t maximum_reservation
        = static_cast<uint64_t>(1024 * 1024); // 1MiB

    /// Converts c-args from an executable's main function into a vector of
    /// strings.
    auto get_args(int argc, char** argv) -> std::vector<std::string>;

    /// Reads configuration parameters line-by-line from a file. Expects a file
    /// of line-separated parameters with each line in the form key=value,
    /// where the key is a lower-case string that may contain numbers and
    /// symbols. Acceptable value types:
    /// - Strings: quoted with double quotes. Ex: name="DemoNFT"
    /// - Integers: standalone numbers. Ex: decimals=18
    /// - Doubles: a number with a decimal point. Ex: some_double=12.4
    /// - Log levels: in the form of a string. Must be one of the log levels
    ///   enumerated in logging.hpp. Ex: loglevel="TRACE"
    ///
    /// Unquoted values that are not numbers are kept as strings, so hex
    /// addresses may be written without quotes. Blank lines and lines
    /// starting with '#' are ignored.
    ///
    /// The class will override file-enumerated config parameters with
    /// values from environment variables, where the environment variable key
    /// is the upper-case version of the config file string. For example, a
    /// decimals=18 line in the config file would be overridden by setting
    /// the environment variable DECIMALS=6.
    class parser {
      public:
        /// Constructor.
        /// \param filename path to the config file to read.
        explicit parser(const std::string& filename);

        /// Constructor.
        /// \param stream the generic stream used to add config values.
        explicit parser(std::istream& stream);

        /// Indicates whether the configuration source could be read.
        /// \return false if the file passed to the constructor could not be
        ///         opened.
        [[nodiscard]] auto good() const -> bool;

        /// Returns the given key if its value is a string.
        /// \param key key to retrieve.
        /// \return value associated with the key or std::nullopt if the value
        ///         was not a string or does not exist.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Return the value for the given key if its value is a long.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a long or doesn't exist.
        [[nodiscard]] auto get_ulong(const std::string& key) const
            -> std::optional<size_t>;

        /// Return the value for the given key if its value is a loglevel.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a loglevel or does not exist.
        [[nodiscard]] auto get_loglevel(const std::string& key) const
            -> std::optional<logging::log_level>;

        /// Return the value for the given key if its value is a double.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a double or does not exist.
        [[nodiscard]] auto get_decimal(const std::string& key) const
            -> std::optional<double>;

        /// Returns the value for the given key rendered as text, whatever
        /// type it was parsed as. Integers are printed in decimal.
        /// \param key key to retrieve.
        /// \return textual value, or std::nullopt if the key does not exist.
        [[nodiscard]] auto get_text(const std::string& key) const
            -> std::optional<std::string>;

      private:
        using value_t = std::variant<std::string, size_t, double>;

        [[nodiscard]] auto find_or_env(const std::string& key) const
            -> std::optional<value_t>;

        template<typename T>
        [[nodiscard]] auto get_val(const std::string& key) const
            -> std::optional<T> {
            const auto it = find_or_env(key);
            if(it) {
                const auto* val = std::get_if<T>(&it.value());
                if(val != nullptr) {
                    return *val;
                }
            }

            return std::nullopt;
        }

        void init(std::istream& stream);

        [[nodiscard]] static auto parse_value(const std::string& val)
            -> value_t;

        std::map<std::string, value_t> m_options;
        bool m_good{true};
    };
}

#endif // ERC_LEDGER_SRC_UTIL_COMMON_CONFIG_H_
