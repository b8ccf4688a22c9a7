// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/config.hpp"
#include "token/math.hpp"
#include "util/common/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

class config_validation_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_nft_opts.m_standard = erc::config::token_standard::erc721;
        m_nft_opts.m_name = "Demo NFT";
        m_nft_opts.m_symbol = "DNFT";
        m_nft_opts.m_max_supply = evmc::uint256be(100);

        m_token_opts.m_standard = erc::config::token_standard::erc20;
        m_token_opts.m_name = "Demo Token";
        m_token_opts.m_symbol = "DTK";
        m_token_opts.m_initial_supply = evmc::uint256be(1000);
        m_token_opts.m_initial_holder = evmc::address();

        m_example_config = "# token ledger\n"
                           "token_standard=\"erc20\"\n"
                           "name=\"Demo Token\"\n"
                           "symbol=\"DTK\"\n"
                           "decimals=6\n"
                           "window_size=40000\n"
                           "initial_supply=1000000000000000000000000\n"
                           "initial_holder="
                           "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf\n"
                           "db_dir=\"token_db\"\n"
                           "loglevel=\"DEBUG\"\n"
                           "fee_rate=13.00\n";
    }

    void TearDown() override {
        std::filesystem::remove_all(m_config_file);
    }

    void write_config(const std::string& contents) {
        std::ofstream out(m_config_file);
        out << contents;
    }

    erc::config::options m_nft_opts;
    erc::config::options m_token_opts;
    std::string m_example_config;
    const std::string m_config_file{"config_test.cfg"};
};

TEST_F(config_validation_test, valid_nft_options) {
    auto err = erc::config::check_options(m_nft_opts);
    ASSERT_FALSE(err.has_value());
}

TEST_F(config_validation_test, valid_token_options) {
    auto err = erc::config::check_options(m_token_opts);
    ASSERT_FALSE(err.has_value());
}

TEST_F(config_validation_test, name_required) {
    m_nft_opts.m_name.clear();
    auto err = erc::config::check_options(m_nft_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, symbol_required) {
    m_token_opts.m_symbol.clear();
    auto err = erc::config::check_options(m_token_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, nft_initial_supply_invariant) {
    m_nft_opts.m_initial_supply = evmc::uint256be(1);
    auto err = erc::config::check_options(m_nft_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, token_max_supply_invariant) {
    m_token_opts.m_max_supply = evmc::uint256be(1);
    auto err = erc::config::check_options(m_token_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, token_initial_holder_invariant) {
    m_token_opts.m_initial_holder.reset();
    auto err = erc::config::check_options(m_token_opts);
    ASSERT_TRUE(err.has_value());

    m_token_opts.m_initial_supply = evmc::uint256be();
    err = erc::config::check_options(m_token_opts);
    ASSERT_FALSE(err.has_value());
}

TEST_F(config_validation_test, parsing_validation) {
    std::istringstream cfg(m_example_config);
    erc::config::parser ex(cfg);

    auto window_size = ex.get_ulong("window_size");
    EXPECT_TRUE(window_size.has_value());
    EXPECT_EQ(window_size.value(), 40000UL);

    auto db = ex.get_string("db_dir");
    EXPECT_TRUE(db.has_value());
    EXPECT_EQ(db.value(), "token_db");

    auto loglevel = ex.get_loglevel("loglevel");
    EXPECT_TRUE(loglevel.has_value());
    EXPECT_EQ(loglevel.value(), erc::logging::log_level::debug);

    auto decimal = ex.get_decimal("fee_rate");
    EXPECT_TRUE(decimal.has_value());
    EXPECT_EQ(decimal.value(), 13.0);

    auto supply = ex.get_text("initial_supply");
    EXPECT_TRUE(supply.has_value());
    EXPECT_EQ(supply.value(), "1000000000000000000000000");

    auto decimals = ex.get_text("decimals");
    EXPECT_TRUE(decimals.has_value());
    EXPECT_EQ(decimals.value(), "6");

    auto nonexistent = ex.get_string("lorem ipsum");
    EXPECT_FALSE(nonexistent.has_value());
}

TEST_F(config_validation_test, environment_override) {
    std::istringstream cfg("erc_ledger_override_key=\"file\"\n");
    erc::config::parser ex(cfg);
    ASSERT_EQ(ex.get_string("erc_ledger_override_key"), "file");

    ::setenv("ERC_LEDGER_OVERRIDE_KEY", "\"env\"", 1);
    auto val = ex.get_string("erc_ledger_override_key");
    ::unsetenv("ERC_LEDGER_OVERRIDE_KEY");
    ASSERT_EQ(val, "env");
}

TEST_F(config_validation_test, load_token_options) {
    write_config(m_example_config);
    auto res = erc::config::load_options(m_config_file);
    ASSERT_TRUE(std::holds_alternative<erc::config::options>(res));
    const auto& opts = std::get<erc::config::options>(res);

    ASSERT_EQ(opts.m_standard, erc::config::token_standard::erc20);
    ASSERT_EQ(opts.m_name, "Demo Token");
    ASSERT_EQ(opts.m_symbol, "DTK");
    ASSERT_EQ(opts.m_decimals, 6);
    ASSERT_EQ(erc::to_decimal(opts.m_initial_supply),
              "1000000000000000000000000");
    ASSERT_TRUE(opts.m_initial_holder.has_value());
    ASSERT_EQ(opts.m_initial_holder->bytes[0], 0x7e);
    ASSERT_EQ(opts.m_db_dir, "token_db");
    ASSERT_EQ(opts.m_loglevel, erc::logging::log_level::debug);
}

TEST_F(config_validation_test, load_nft_defaults) {
    write_config("name=\"Demo NFT\"\n"
                 "symbol=\"DNFT\"\n"
                 "base_uri=\"ipfs://demo/\"\n"
                 "max_supply=0x64\n");
    auto res = erc::config::load_options(m_config_file);
    ASSERT_TRUE(std::holds_alternative<erc::config::options>(res));
    const auto& opts = std::get<erc::config::options>(res);

    ASSERT_EQ(opts.m_standard, erc::config::token_standard::erc721);
    ASSERT_EQ(opts.m_base_uri, "ipfs://demo/");
    ASSERT_EQ(opts.m_max_supply, evmc::uint256be(100));
    ASSERT_EQ(opts.m_decimals, erc::config::defaults::decimals);
    ASSERT_EQ(opts.m_loglevel, erc::config::defaults::log_level);
    ASSERT_TRUE(evmc::is_zero(opts.m_contract_owner));
}

TEST_F(config_validation_test, load_invalid_values) {
    write_config("name=\"A\"\nsymbol=\"B\"\ntoken_standard=\"erc1155\"\n");
    auto res = erc::config::load_options(m_config_file);
    ASSERT_TRUE(std::holds_alternative<std::string>(res));

    write_config("name=\"A\"\nsymbol=\"B\"\ncontract_owner=0x1234\n");
    res = erc::config::load_options(m_config_file);
    ASSERT_TRUE(std::holds_alternative<std::string>(res));

    write_config("name=\"A\"\nsymbol=\"B\"\ndecimals=256\n");
    res = erc::config::load_options(m_config_file);
    ASSERT_TRUE(std::holds_alternative<std::string>(res));

    write_config("name=\"A\"\nsymbol=\"B\"\nmax_supply=lots\n");
    res = erc::config::load_options(m_config_file);
    ASSERT_TRUE(std::holds_alternative<std::string>(res));
}

TEST_F(config_validation_test, missing_file) {
    auto res = erc::config::load_options("does_not_exist.cfg");
    ASSERT_TRUE(std::holds_alternative<std::string>(res));
    ASSERT_EQ(std::get<std::string>(res),
              "Unable to read configuration file does_not_exist.cfg");
}

TEST_F(config_validation_test, token_standard_names) {
    ASSERT_EQ(erc::config::parse_token_standard("ERC20"),
              erc::config::token_standard::erc20);
    ASSERT_EQ(erc::config::parse_token_standard("erc721"),
              erc::config::token_standard::erc721);
    ASSERT_FALSE(erc::config::parse_token_standard("erc1155").has_value());
}
