#include <catch2/catch.hpp>

#include "luhn.hpp"
#include "synthesis.hpp"
#include "scripted_source.hpp"

#include <stdexcept>

TEST_CASE("Luhn accepts well known test numbers", "[cardgen::luhn]")
{
    REQUIRE(cardgen::luhn::is_valid("4111111111111111"));
    REQUIRE(cardgen::luhn::is_valid("5555555555554444"));
    REQUIRE(cardgen::luhn::is_valid("378282246310005"));
    REQUIRE(cardgen::luhn::is_valid("79927398713"));
    REQUIRE(cardgen::luhn::checksum("4111111111111111") == 0);
}

TEST_CASE("Luhn rejects single digit changes", "[cardgen::luhn]")
{
    REQUIRE_FALSE(cardgen::luhn::is_valid("4111111111111112"));
    REQUIRE_FALSE(cardgen::luhn::is_valid("5555555555554445"));
    REQUIRE_FALSE(cardgen::luhn::is_valid("378282246310006"));
    REQUIRE(cardgen::luhn::checksum("79927398710") == 7);
}

TEST_CASE("Luhn check digit completes the number", "[cardgen::luhn]")
{
    REQUIRE(cardgen::luhn::check_digit("411111111111111") == 1);
    REQUIRE(cardgen::luhn::check_digit("7992739871") == 3);
    REQUIRE(cardgen::luhn::check_digit("37828224631000") == 5);
    REQUIRE(cardgen::luhn::check_digit("") == 0);
}

TEST_CASE("Luhn refuses non-digit input", "[cardgen::luhn]")
{
    REQUIRE_THROWS_AS(cardgen::luhn::checksum("4111-1111"), std::invalid_argument);
    REQUIRE_THROWS_AS(cardgen::luhn::is_valid("41a1"), std::invalid_argument);
    REQUIRE_THROWS_AS(cardgen::luhn::check_digit("4 11"), std::invalid_argument);
}

TEST_CASE("Synthesis prefix follows the card length", "[cardgen::synthesis]")
{
    REQUIRE(cardgen::synthesis_prefix("300", 15) == "3000");
    REQUIRE(cardgen::synthesis_prefix("3456", 15) == "3456");
    REQUIRE(cardgen::synthesis_prefix("340000", 15) == "3400");

    REQUIRE(cardgen::synthesis_prefix("123", 16) == "123");
    REQUIRE(cardgen::synthesis_prefix("4111", 16) == "4111");
    REQUIRE(cardgen::synthesis_prefix("411111", 16) == "411111");
    REQUIRE(cardgen::synthesis_prefix("4111119", 16) == "411111");

    REQUIRE_THROWS_AS(cardgen::synthesis_prefix("4111", 14), std::invalid_argument);
    REQUIRE_THROWS_AS(cardgen::synthesis_prefix("4111", 19), std::invalid_argument);
}

TEST_CASE("Synthesized numbers are Luhn valid and keep their prefix", "[cardgen::synthesis]")
{
    cardgen::MersenneSource random{42};

    for (const char* bin : {"123", "4111", "411111", "300", "3782", "340000", "222100", "999999"})
    {
        for (std::size_t length : {std::size_t(15), std::size_t(16)})
        {
            auto prefix = cardgen::synthesis_prefix(bin, length);
            for (int i = 0; i < 50; ++i)
            {
                auto number = cardgen::synthesize_number(bin, length, random);
                REQUIRE(number.size() == length);
                REQUIRE(number.compare(0, prefix.size(), prefix) == 0);
                REQUIRE(cardgen::luhn::is_valid(number));
            }
        }
    }
}

TEST_CASE("Synthesis fills the gap with random digits", "[cardgen::synthesis]")
{
    ScriptedSource random{std::deque<int>{}, 1};
    REQUIRE(cardgen::synthesize_number("411111", 16, random) == "4111111111111111");
    REQUIRE(random.calls == 9);

    ScriptedSource amex{std::deque<int>{8, 2, 2, 4, 6, 3, 1, 0, 0, 0}};
    REQUIRE(cardgen::synthesize_number("3782", 15, amex) == "378282246310005");
}

TEST_CASE("Synthesis retries with fresh digits when verification fails", "[cardgen::synthesis]")
{
    CountingSource random{7};
    int verifications = 0;
    auto flaky = [&verifications](std::string_view number) {
        ++verifications;
        return verifications > 1 && cardgen::luhn::is_valid(number);
    };

    auto number = cardgen::synthesize_number("4111", 16, random, flaky);
    REQUIRE(verifications == 2);
    REQUIRE(random.calls == 2 * 11);
    REQUIRE(number.size() == 16);
    REQUIRE(cardgen::luhn::is_valid(number));
}

TEST_CASE("Synthesis gives up after a bounded number of attempts", "[cardgen::synthesis]")
{
    cardgen::MersenneSource random{7};
    int verifications = 0;
    auto never = [&verifications](std::string_view) {
        ++verifications;
        return false;
    };

    REQUIRE_THROWS_AS(cardgen::synthesize_number("4111", 16, random, never), cardgen::synthesis_error);
    REQUIRE(verifications == cardgen::MAX_SYNTHESIS_ATTEMPTS);
}

TEST_CASE("Synthesis rejects unsupported lengths", "[cardgen::synthesis]")
{
    cardgen::MersenneSource random{1};
    REQUIRE_THROWS_AS(cardgen::synthesize_number("4111", 13, random), std::invalid_argument);
}
