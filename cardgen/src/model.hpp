#pragma once

#include <string>
#include <vector>

namespace cardgen
{
    /**
     * One synthesized card. Every field is a string of decimal digits:
     *   number        15 or 16 digits, Luhn-valid
     *   expiry_month  "01" - "12"
     *   expiry_year   four digits
     *   cvv           4 digits for a 15 digit number, 3 otherwise
     */
    struct CardRecord
    {
        std::string number;
        std::string expiry_month;
        std::string expiry_year;
        std::string cvv;
    };

    inline bool operator==(const CardRecord& lhs, const CardRecord& rhs)
    {
        return lhs.number == rhs.number
            && lhs.expiry_month == rhs.expiry_month
            && lhs.expiry_year == rhs.expiry_year
            && lhs.cvv == rhs.cvv;
    }

    inline bool operator!=(const CardRecord& lhs, const CardRecord& rhs) { return !(lhs == rhs); }

    // Records generated against one BIN, in generation order.
    using Batch = std::vector<CardRecord>;
}
