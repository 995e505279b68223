#pragma once

#include <string_view>

namespace cardgen::luhn
{
    /**
     * Computes the Luhn sum of a digit string, modulo 10.
     *
     * Positions count from the rightmost digit as 1. Digits at odd positions
     * are added as they are; digits at even positions are doubled, and 9 is
     * taken off whenever the doubled value is above 9.
     *
     * @param digits Decimal digits only
     * @return The sum modulo 10, 0 for a valid number
     * @throws std::invalid_argument If a character is not a decimal digit
     */
    int checksum(std::string_view digits);

    /**
     * @return true if the digits pass the Luhn check
     * @throws std::invalid_argument If a character is not a decimal digit
     */
    bool is_valid(std::string_view digits);

    /**
     * Finds the digit which, appended to the partial number, makes the whole
     * number pass the Luhn check. Exactly one of 0-9 does.
     *
     * @throws std::invalid_argument If a character is not a decimal digit
     */
    int check_digit(std::string_view partial);
}
