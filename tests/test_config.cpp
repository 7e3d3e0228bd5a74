/**
 * @file test_config.cpp
 * @brief Tests for TOML configuration loading.
 */

#include <catch2/catch_test_macros.hpp>
#include <app/config.hpp>

#include <filesystem>
#include <fstream>

using namespace env;
using xfer::net::http::coding;
using xfer::net::http::coding_mask;
using xfer::net::http::contains;

TEST_CASE("Defaults without an [inspect] section", "[config]") {
    const auto cfg = Config::load_string("");
    REQUIRE(cfg.inspect().order == ReportOrder::header);
    REQUIRE_FALSE(cfg.inspect().supported.has_value());
    REQUIRE_FALSE(cfg.inspect().verbose);
    REQUIRE(cfg.path().empty());
}

TEST_CASE("Full [inspect] section", "[config]") {
    const auto cfg = Config::load_string(R"(
[inspect]
order = "decode"
supported = ["chunked", "GZIP", "x-compress"]
verbose = true
)");

    REQUIRE(cfg.inspect().order == ReportOrder::decode);
    REQUIRE(cfg.inspect().verbose);
    REQUIRE(cfg.inspect().supported.has_value());

    const auto mask = *cfg.inspect().supported;
    REQUIRE(contains(mask, coding::chunked));
    REQUIRE(contains(mask, coding::gzip));
    REQUIRE(contains(mask, coding::compress));
    REQUIRE_FALSE(contains(mask, coding::deflate));
}

TEST_CASE("Empty supported list rejects every coding", "[config]") {
    const auto cfg = Config::load_string("[inspect]\nsupported = []\n");
    REQUIRE(cfg.inspect().supported == coding_mask::none);
}

TEST_CASE("Invalid configuration throws ConfigError", "[config][error]") {
    SECTION("unknown order") {
        REQUIRE_THROWS_AS(Config::load_string("[inspect]\norder = \"reverse\"\n"), ConfigError);
    }

    SECTION("order of the wrong type") {
        REQUIRE_THROWS_AS(Config::load_string("[inspect]\norder = 3\n"), ConfigError);
    }

    SECTION("unknown coding name") {
        REQUIRE_THROWS_AS(Config::load_string("[inspect]\nsupported = [\"br\"]\n"), ConfigError);
    }

    SECTION("supported is not an array") {
        REQUIRE_THROWS_AS(Config::load_string("[inspect]\nsupported = \"gzip\"\n"), ConfigError);
    }

    SECTION("non-string entry") {
        REQUIRE_THROWS_AS(Config::load_string("[inspect]\nsupported = [1]\n"), ConfigError);
    }

    SECTION("verbose is not a bool") {
        REQUIRE_THROWS_AS(Config::load_string("[inspect]\nverbose = \"yes\"\n"), ConfigError);
    }

    SECTION("inspect is not a table") {
        REQUIRE_THROWS_AS(Config::load_string("inspect = 1\n"), ConfigError);
    }

    SECTION("TOML syntax error") {
        REQUIRE_THROWS_AS(Config::load_string("[inspect\n"), ConfigError);
    }

    SECTION("empty path") {
        REQUIRE_THROWS_AS(Config::load_file({}), ConfigError);
    }
}

TEST_CASE("Loading from a file", "[config][file]") {
    const auto dir = std::filesystem::temp_directory_path() / "xfer_config_test";
    std::filesystem::create_directories(dir);
    const auto path = dir / "xfer.toml";
    {
        std::ofstream ofs(path, std::ios::trunc);
        ofs << "[inspect]\nsupported = [\"chunked\"]\n";
    }

    const auto cfg = Config::load_file(path);
    REQUIRE(cfg.path().is_absolute());
    REQUIRE(cfg.inspect().supported == coding_mask::chunked);

    std::filesystem::remove(path);
    REQUIRE_THROWS_AS(Config::load_file(path), ConfigError);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Report order parsing", "[config]") {
    REQUIRE(parse_report_order("header") == ReportOrder::header);
    REQUIRE(parse_report_order("decode") == ReportOrder::decode);
    REQUIRE_THROWS_AS(parse_report_order("Header"), ConfigError);
}
