#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "random_source.hpp"

namespace cardgen
{
    constexpr int MIN_MONTHS_AHEAD = 6;
    constexpr int MAX_MONTHS_AHEAD = 60;

    struct Expiry
    {
        std::string month;
        std::string year;
    };

    /**
     * Picks an expiry between MIN_MONTHS_AHEAD and MAX_MONTHS_AHEAD calendar
     * months after `now`, in local time.
     *
     * @return Zero padded two digit month and four digit year
     */
    Expiry generate_expiry(RandomSource& random, std::chrono::system_clock::time_point now);

    /**
     * Adds whole calendar months to a (year, month) pair, month being 1-12.
     */
    Expiry add_months(int year, int month, int months);

    /**
     * Picks a security code sized for the card number: 4 digits (1000-9999)
     * for a 15 digit number, 3 digits (100-999) for anything else.
     */
    std::string generate_cvv(std::string_view number, RandomSource& random);
}
