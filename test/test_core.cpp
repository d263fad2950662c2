// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the core module.

#include "test_framework.h"

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "core/types.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_set>

// ============================================================================
// Types
// ============================================================================

TEST_CASE(Types, uint256_default_is_zero) {
    core::uint256 z;
    CHECK(z.is_zero());
    CHECK_EQ(z.to_hex(),
             "0000000000000000000000000000000000000000000000000000000000000000");
}

TEST_CASE(Types, uint256_from_hex_with_prefix) {
    auto val = core::uint256::from_hex(
        "0x00000000000000000007a4e02e4a058662db0e67e8d2074b592603ed0db7ae53");
    CHECK(!val.is_zero());
    CHECK_EQ(val.to_hex(),
             "00000000000000000007a4e02e4a058662db0e67e8d2074b592603ed0db7ae53");
}

TEST_CASE(Types, short_hex_is_left_padded) {
    auto val = core::uint160::from_hex("0xabc");
    CHECK_EQ(val.to_hex(), "0000000000000000000000000000000000000abc");
}

TEST_CASE(Types, from_hex_rejects_garbage) {
    bool threw = false;
    try {
        (void)core::uint256::from_hex("0xzz");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    CHECK(threw);
}

TEST_CASE(Types, from_bytes_is_big_endian) {
    std::array<uint8_t, 32> bytes{};
    bytes[0] = 0x01;
    auto v = core::uint256::from_bytes_be(bytes);
    CHECK_EQ(v.to_hex().substr(0, 4), "0100");
    CHECK(v > core::uint256::from_hex("0xff"));
}

TEST_CASE(Types, write_be_matches_hex) {
    auto addr = core::uint160::from_hex(
        "0x1f9840a85d5af5bf1d1762f925bdaddc4201f984");
    std::array<uint8_t, 20> out{};
    addr.write_be(std::span<uint8_t, 20>(out));
    CHECK_EQ(out[0], 0x1f);
    CHECK_EQ(out[19], 0x84);
    CHECK(core::uint160::from_bytes_be(std::span<const uint8_t, 20>(out)) ==
          addr);
}

TEST_CASE(Types, numeric_comparison) {
    auto a = core::uint256::from_hex("0x01");
    auto b = core::uint256::from_hex("0x0100");
    CHECK(a < b);
    CHECK(b > a);
    CHECK(a != b);
    CHECK(a == core::uint256::from_hex("1"));
}

TEST_CASE(Types, hash_distinguishes_values) {
    std::unordered_set<core::uint256> ids;
    ids.insert(core::uint256::from_hex("0x01"));
    ids.insert(core::uint256::from_hex("0x02"));
    ids.insert(core::uint256::from_hex("0x01"));
    CHECK_EQ(ids.size(), static_cast<size_t>(2));
}

// ============================================================================
// Error / Result
// ============================================================================

namespace {

core::Result<uint32_t> half(uint32_t v) {
    if (v % 2 != 0) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT, "odd");
    }
    return v / 2;
}

core::Result<uint32_t> quarter(uint32_t v) {
    SANDGUARD_TRY_ASSIGN(h, half(v));
    return half(h);
}

core::Result<void> require_even(uint32_t v) {
    SANDGUARD_TRY_VOID(half(v));
    return core::make_ok();
}

} // namespace

TEST_CASE(Error, default_is_ok) {
    core::Error e;
    CHECK(e.is_ok());
    CHECK(!e);
    CHECK_EQ(e.format(), "no error");
}

TEST_CASE(Error, format_includes_code_and_message) {
    auto e = core::make_error(core::ErrorCode::CONFIG_FEE_OUT_OF_BOUNDS,
                              "fee_low=0");
    std::string text = e.format();
    CHECK(text.find("CONFIG_FEE_OUT_OF_BOUNDS(203)") != std::string::npos);
    CHECK(text.find("fee_low=0") != std::string::npos);
    CHECK(text.find("test_core.cpp") != std::string::npos);
}

TEST_CASE(Error, code_names) {
    CHECK_EQ(core::error_code_name(core::ErrorCode::PARSE_OVERFLOW),
             "PARSE_OVERFLOW");
    CHECK_EQ(core::error_code_name(core::ErrorCode::CONFIG_INVALID_FEE_RANGE),
             "CONFIG_INVALID_FEE_RANGE");
    CHECK_EQ(core::error_code_name(
                 core::ErrorCode::CONFIG_INVALID_THRESHOLD_ORDER),
             "CONFIG_INVALID_THRESHOLD_ORDER");
}

TEST_CASE(Error, result_value_and_error) {
    auto ok = half(8);
    CHECK_OK(ok);
    CHECK_EQ(ok.value(), 4u);

    auto bad = half(7);
    CHECK_ERR_CODE(bad, core::ErrorCode::PARSE_BAD_FORMAT);
    CHECK_EQ(bad.value_or(99), 99u);

    bool threw = false;
    try {
        (void)bad.value();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);
}

TEST_CASE(Error, try_macros_propagate) {
    CHECK_EQ(quarter(8).value(), 2u);
    CHECK_ERR(quarter(6));
    CHECK_OK(require_even(4));
    CHECK_ERR_CODE(require_even(3), core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(Error, and_then_chains) {
    auto r = half(16).and_then(half).and_then(half);
    CHECK_EQ(r.value(), 2u);
    CHECK_ERR(half(12).and_then(half).and_then(half));
}

// ============================================================================
// Config
// ============================================================================

namespace {

std::filesystem::path write_temp_config(const std::string& name,
                                        const std::string& body) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream ofs(path, std::ios::trunc);
    ofs << body;
    return path;
}

} // namespace

TEST_CASE(Config, parse_args_forms) {
    const char* argv[] = {"sandguard", "-model=quadratic", "--maxfee=80",
                          "--printtoconsole", "positional"};
    core::Config conf;
    conf.parse_args(5, const_cast<char**>(argv));

    CHECK_EQ(conf.get_or("model", ""), "quadratic");
    CHECK_EQ(conf.get_or("maxfee", ""), "80");
    CHECK(conf.get_bool("printtoconsole"));
    CHECK(!conf.has("positional"));
    CHECK(!conf.has("sandguard"));
}

TEST_CASE(Config, parse_file_and_priority) {
    auto path = write_temp_config(
        "sandguard_test_config.conf",
        "# pool defaults\n"
        "\n"
        "  model = discrete  \n"
        "feelow=7\n"
        "printtoconsole=off\n");

    core::Config conf;
    const char* argv[] = {"sandguard", "-feelow=9"};
    conf.parse_args(2, const_cast<char**>(argv));
    CHECK_OK(conf.parse_file(path));

    CHECK_EQ(conf.get_or("model", ""), "discrete");
    CHECK_EQ(conf.get_or("feelow", ""), "9");    // command line wins
    CHECK(!conf.get_bool("printtoconsole", true));

    std::filesystem::remove(path);
}

TEST_CASE(Config, parse_file_missing) {
    core::Config conf;
    CHECK_ERR_CODE(conf.parse_file("/nonexistent/sandguard.conf"),
                   core::ErrorCode::IO_ERROR);
}

TEST_CASE(Config, parse_file_empty_key) {
    auto path = write_temp_config("sandguard_test_badkey.conf", "=5\n");
    core::Config conf;
    CHECK_ERR_CODE(conf.parse_file(path), core::ErrorCode::PARSE_BAD_FORMAT);
    std::filesystem::remove(path);
}

TEST_CASE(Config, set_get_defaults) {
    core::Config conf;
    CHECK(!conf.get("k1").has_value());
    CHECK_EQ(conf.get_or("k1", "0.5"), "0.5");
    conf.set("k1", "0.7");
    CHECK_EQ(conf.get("k1").value(), "0.7");
    conf.set("k1", "0.9");
    CHECK_EQ(conf.get("k1").value(), "0.9");
    CHECK(conf.get_bool("missing", true));
    conf.set("flag", "garbage");
    CHECK(!conf.get_bool("flag", false));
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE(Logging, parse_level) {
    using core::LogLevel;
    CHECK(core::parse_log_level("debug", LogLevel::INFO) == LogLevel::DEBUG);
    CHECK(core::parse_log_level("WARN", LogLevel::INFO) == LogLevel::WARN);
    CHECK(core::parse_log_level("error", LogLevel::INFO) == LogLevel::ERR);
    CHECK(core::parse_log_level("loud", LogLevel::INFO) == LogLevel::INFO);
}

TEST_CASE(Logging, parse_categories) {
    using core::LogCategory;
    CHECK(core::parse_log_categories("engine, config") ==
          (LogCategory::ENGINE | LogCategory::CONFIG));
    CHECK(core::parse_log_categories("all") == LogCategory::ALL);
    CHECK(core::parse_log_categories("none") == LogCategory::NONE);
    CHECK(core::parse_log_categories("bogus,metrics") == LogCategory::METRICS);
}

TEST_CASE(Logging, will_log_respects_level_and_categories) {
    auto& logger = core::Logger::instance();
    const auto saved_level = logger.level();
    const auto saved_cats  = logger.enabled_categories();

    logger.set_print_to_console(true);
    logger.set_level(core::LogLevel::DEBUG);
    logger.set_categories(core::LogCategory::STRATEGY);
    CHECK(logger.will_log(core::LogLevel::DEBUG, core::LogCategory::STRATEGY));
    CHECK(!logger.will_log(core::LogLevel::TRACE, core::LogCategory::STRATEGY));
    CHECK(!logger.will_log(core::LogLevel::DEBUG, core::LogCategory::STORE));

    logger.set_level(saved_level);
    logger.set_categories(saved_cats);
}
