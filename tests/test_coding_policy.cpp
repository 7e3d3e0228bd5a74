/**
 * @file test_coding_policy.cpp
 * @brief Tests for the supported-coding and framing helpers.
 */

#include <catch2/catch_test_macros.hpp>
#include <xfer/net/http/coding_policy.hpp>

#include <string_view>
#include <system_error>

using namespace xfer::net::http;

TEST_CASE("Coding mask arithmetic", "[policy]") {
    constexpr auto mask = coding_mask::chunked | coding_mask::gzip;

    STATIC_REQUIRE(contains(mask, coding::chunked));
    STATIC_REQUIRE(contains(mask, coding::gzip));
    STATIC_REQUIRE_FALSE(contains(mask, coding::deflate));
    STATIC_REQUIRE_FALSE(contains(mask, coding::other));
    STATIC_REQUIRE_FALSE(any(coding_mask::none));
    STATIC_REQUIRE(mask_of(coding::compress) == coding_mask::compress);
    STATIC_REQUIRE(mask_of(coding::other) == coding_mask::none);

    auto m = coding_mask::none;
    m |= coding_mask::deflate;
    REQUIRE(contains(m, coding::deflate));
}

TEST_CASE("First unsupported token", "[policy]") {
    constexpr auto supported = coding_mask::chunked | coding_mask::gzip;

    SECTION("all supported") {
        REQUIRE_FALSE(first_unsupported("gzip, chunked", supported).has_value());
        REQUIRE_FALSE(first_unsupported("", supported).has_value());
    }

    SECTION("extension is unsupported") {
        const auto bad = first_unsupported("gzip, custom-enc, chunked", supported);
        REQUIRE(bad.has_value());
        REQUIRE(bad->name == "custom-enc");
    }

    SECTION("registered but not in the mask") {
        const auto bad = first_unsupported("Deflate, chunked", supported);
        REQUIRE(bad.has_value());
        REQUIRE(bad->kind == coding::deflate);
        REQUIRE(bad->name == "Deflate");
    }

    SECTION("empty mask rejects everything") {
        REQUIRE(first_unsupported("chunked", coding_mask::none).has_value());
    }
}

TEST_CASE("Supported check reports through error_code", "[policy][error]") {
    std::error_code ec = xfer::net::errc::malformed_header;

    REQUIRE(check_supported("gzip , chunked", coding_mask::gzip | coding_mask::chunked, ec));
    REQUIRE_FALSE(ec);

    REQUIRE_FALSE(check_supported("br, chunked", coding_mask::chunked, ec));
    REQUIRE(ec == xfer::net::errc::unsupported_transfer_coding);
    REQUIRE(ec.category().name() == std::string_view{ "xfer.net" });
    REQUIRE(ec.message() == "unsupported transfer-coding");
}

TEST_CASE("Final coding and chunked framing", "[policy]") {
    SECTION("chunked last") {
        REQUIRE(is_chunked("gzip, chunked"));
        REQUIRE(is_chunked("CHUNKED"));
        REQUIRE(is_chunked("gzip, chunked, "));
    }

    SECTION("chunked not last") {
        REQUIRE_FALSE(is_chunked("chunked, gzip"));
        REQUIRE(final_coding("chunked, gzip")->kind == coding::gzip);
    }

    SECTION("no tokens") {
        REQUIRE_FALSE(is_chunked(""));
        REQUIRE_FALSE(final_coding(" , ").has_value());
    }

    SECTION("extension last") {
        const auto last = final_coding("chunked, foo");
        REQUIRE(last.has_value());
        REQUIRE(last->is_other());
        REQUIRE(last->name == "foo");
    }
}
