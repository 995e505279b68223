#include "luhn.hpp"

#include <stdexcept>
#include <string>

namespace cardgen::luhn
{
    int checksum(std::string_view digits)
    {
        int sum = 0;
        bool even_position = false;
        for (auto it = digits.rbegin(); it != digits.rend(); ++it)
        {
            if (*it < '0' || *it > '9')
                throw std::invalid_argument("non-digit character in card number: '" + std::string(1, *it) + "'");

            int value = *it - '0';
            if (even_position)
            {
                value *= 2;
                if (value > 9)
                    value -= 9;
            }
            sum += value;
            even_position = !even_position;
        }
        return sum % 10;
    }

    bool is_valid(std::string_view digits)
    {
        return checksum(digits) == 0;
    }

    int check_digit(std::string_view partial)
    {
        std::string candidate{partial};
        candidate.push_back('0');

        for (int digit = 0; digit <= 9; ++digit)
        {
            candidate.back() = static_cast<char>('0' + digit);
            if (checksum(candidate) == 0)
                return digit;
        }

        // The check digit shifts the sum through all ten residues, so one of them is always 0.
        throw std::logic_error("no Luhn check digit found for '" + std::string(partial) + "'");
    }
}
