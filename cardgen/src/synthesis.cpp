#include "synthesis.hpp"

#include <spdlog/spdlog.h>

#include "luhn.hpp"

namespace
{
    void check_length(std::size_t length)
    {
        if (length != 15 && length != 16)
            throw std::invalid_argument("card length must be 15 or 16, got " + std::to_string(length));
    }
}

std::string cardgen::synthesis_prefix(std::string_view bin, std::size_t length)
{
    check_length(length);

    if (length == 15)
    {
        std::string prefix{bin.substr(0, 4)};
        if (prefix.size() < 4)
            prefix.append(4 - prefix.size(), '0');
        return prefix;
    }

    if (bin.size() >= 6)
        return std::string{bin.substr(0, 6)};
    if (bin.size() >= 4)
        return std::string{bin.substr(0, 4)};
    return std::string{bin};
}

std::string cardgen::synthesize_number(std::string_view bin, std::size_t length, RandomSource& random)
{
    return synthesize_number(bin, length, random, [](std::string_view number) {
        return luhn::is_valid(number);
    });
}

std::string cardgen::synthesize_number(std::string_view bin, std::size_t length, RandomSource& random,
                                       const NumberVerifier& verify)
{
    const auto prefix = synthesis_prefix(bin, length);
    const auto digits_before_check = length - 1;

    for (int attempt = 1; attempt <= MAX_SYNTHESIS_ATTEMPTS; ++attempt)
    {
        std::string number;
        number.reserve(length);

        if (prefix.size() < digits_before_check)
        {
            number = prefix;
            while (number.size() < digits_before_check)
                number.push_back(static_cast<char>('0' + random.number_in_range(0, 9)));
        }
        else
        {
            number = prefix.substr(0, digits_before_check);
        }

        number.push_back(static_cast<char>('0' + luhn::check_digit(number)));

        if (verify(number))
            return number;

        spdlog::warn("Synthesized number for BIN {} failed verification (attempt {}/{}), retrying",
                     bin, attempt, MAX_SYNTHESIS_ATTEMPTS);
    }

    spdlog::error("Giving up on BIN {} after {} synthesis attempts", bin, MAX_SYNTHESIS_ATTEMPTS);
    throw synthesis_error("could not synthesize a verifiable " + std::to_string(length)
                          + " digit number for BIN " + std::string(bin));
}
