// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace erc::config {
    namespace {
        auto trim(const std::string& s) -> std::string {
            const auto* ws = " \t\r\n";
            const auto begin = s.find_first_not_of(ws);
            if(begin == std::string::npos) {
                return {};
            }
            const auto end = s.find_last_not_of(ws);
            return s.substr(begin, end - begin + 1);
        }

        auto is_digits(const std::string& s) -> bool {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
                return std::isdigit(static_cast<unsigned char>(c)) != 0;
            });
        }
    }

    auto get_args(int argc, char** argv) -> std::vector<std::string> {
        auto ret = std::vector<std::string>();
        ret.reserve(static_cast<size_t>(argc));
        for(int i = 0; i < argc; i++) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            ret.emplace_back(argv[i]);
        }
        return ret;
    }

    parser::parser(const std::string& filename) {
        std::ifstream file(filename);
        if(!file.good()) {
            m_good = false;
            return;
        }

        init(file);
    }

    parser::parser(std::istream& stream) {
        init(stream);
    }

    auto parser::good() const -> bool {
        return m_good;
    }

    void parser::init(std::istream& stream) {
        std::string line;
        while(std::getline(stream, line)) {
            line = trim(line);
            if(line.empty() || line[0] == '#') {
                continue;
            }
            std::istringstream line_stream(line);
            std::string key;
            if(std::getline(line_stream, key, '=')) {
                std::string value;
                if(std::getline(line_stream, value)) {
                    m_options.emplace(trim(key), parse_value(trim(value)));
                }
            }
        }
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        return get_val<std::string>(key);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<size_t> {
        return get_val<size_t>(key);
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        const auto val_str = get_string(key);
        if(!val_str.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(val_str.value());
    }

    auto parser::get_decimal(const std::string& key) const
        -> std::optional<double> {
        return get_val<double>(key);
    }

    auto parser::get_text(const std::string& key) const
        -> std::optional<std::string> {
        const auto val = find_or_env(key);
        if(!val.has_value()) {
            return std::nullopt;
        }
        if(const auto* str = std::get_if<std::string>(&val.value())) {
            return *str;
        }
        if(const auto* num = std::get_if<size_t>(&val.value())) {
            return std::to_string(*num);
        }
        auto ss = std::stringstream();
        ss << std::get<double>(val.value());
        return ss.str();
    }

    auto parser::find_or_env(const std::string& key) const
        -> std::optional<value_t> {
        auto upper_key = key;
        std::transform(upper_key.begin(),
                       upper_key.end(),
                       upper_key.begin(),
                       [](unsigned char c) {
                           return std::toupper(c);
                       });
        if(const auto* env_v = std::getenv(upper_key.c_str())) {
            auto value = std::string(env_v);
            return parse_value(trim(value));
        }

        auto it = m_options.find(key);
        if(it != m_options.end()) {
            return it->second;
        }

        return std::nullopt;
    }

    auto parser::parse_value(const std::string& value) -> value_t {
        if(value.size() >= 2 && value.front() == '\"'
           && value.back() == '\"') {
            return value.substr(1, value.size() - 2);
        }

        if(is_digits(value)) {
            size_t as_int{};
            const auto* last = value.data() + value.size();
            const auto res = std::from_chars(value.data(), last, as_int);
            if(res.ec == std::errc() && res.ptr == last) {
                return as_int;
            }
            // Too large for size_t, keep the digits as text.
            return value;
        }

        if(value.find('.') != std::string::npos) {
            char* end{};
            const auto as_dbl = std::strtod(value.c_str(), &end);
            if(end != nullptr && *end == '\0') {
                return as_dbl;
            }
        }

        return value;
    }
}
