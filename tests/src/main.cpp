#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "helpers/utilities.hpp"

TEST_CASE("BIN is pulled out of free-form text", "[bingen::util]")
{
    REQUIRE(util::extract_bin("123") == "123");
    REQUIRE(util::extract_bin("  4111  ") == "4111");
    REQUIRE(util::extract_bin("BIN: 1234") == "1234");
    REQUIRE(util::extract_bin("bin 411111") == "411111");
    REQUIRE(util::extract_bin("Bin:340000") == "340000");
    REQUIRE(util::extract_bin("please use 5100 for me") == "5100");
}

TEST_CASE("BIN extraction takes at most six digits", "[bingen::util]")
{
    REQUIRE(util::extract_bin("12345") == "12345");
    REQUIRE(util::extract_bin("1234567") == "123456");
    REQUIRE(util::extract_bin("12 345") == "345");
}

TEST_CASE("BIN extraction finds nothing without three digits in a row", "[bingen::util]")
{
    REQUIRE(util::extract_bin("").empty());
    REQUIRE(util::extract_bin("hello").empty());
    REQUIRE(util::extract_bin("BIN: 12").empty());
    REQUIRE(util::extract_bin("1 2 3").empty());
}

TEST_CASE("Quantity parsing", "[bingen::util]")
{
    using util::QuantityStatus;

    auto result = util::parse_quantity("10", 1000);
    REQUIRE(result.status == QuantityStatus::Ok);
    REQUIRE(result.value == 10);

    result = util::parse_quantity("  +1000\n", 1000);
    REQUIRE(result.status == QuantityStatus::Ok);
    REQUIRE(result.value == 1000);

    REQUIRE(util::parse_quantity("1001", 1000).status == QuantityStatus::OverLimit);
    REQUIRE(util::parse_quantity("99999999999999999999999", 1000).status == QuantityStatus::OverLimit);

    result = util::parse_quantity(" +0012 ", 10);
    REQUIRE(result.status == QuantityStatus::OverLimit);
    REQUIRE(result.value == 12);
    REQUIRE(util::parse_quantity("0", 1000).status == QuantityStatus::NotPositive);
    REQUIRE(util::parse_quantity("-5", 1000).status == QuantityStatus::NotPositive);
    REQUIRE(util::parse_quantity("-0", 1000).status == QuantityStatus::NotPositive);
    REQUIRE(util::parse_quantity("ten", 1000).status == QuantityStatus::Invalid);
    REQUIRE(util::parse_quantity("1.5", 1000).status == QuantityStatus::Invalid);
    REQUIRE(util::parse_quantity("", 1000).status == QuantityStatus::Invalid);
    REQUIRE(util::parse_quantity("-", 1000).status == QuantityStatus::Invalid);
}

TEST_CASE("Parse requires the whole string", "[bingen::util]")
{
    REQUIRE(util::parse<uint32_t>("42").ec == std::errc{});
    REQUIRE(util::parse<uint32_t>("42").value == 42);
    REQUIRE(util::parse<uint32_t>("42x").ec == std::errc::invalid_argument);
    REQUIRE(util::parse<bool>("on").value);
    REQUIRE(util::parse<bool>("maybe").ec == std::errc::invalid_argument);
}

TEST_CASE("Records are formatted pipe delimited", "[bingen::util]")
{
    cardgen::CardRecord record{"4111111111111111", "04", "2027", "123"};
    REQUIRE(util::format_record(record) == "4111111111111111|04|2027|123");
}

TEST_CASE("Trim strips surrounding whitespace only", "[bingen::util]")
{
    REQUIRE(util::trim("  a b \t\r\n") == "a b");
    REQUIRE(util::trim("   ").empty());
    REQUIRE(util::trim("x") == "x");
}
