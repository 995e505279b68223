#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cardgen
{
    enum Scheme : uint8_t
    {
        Visa = 0,
        Mastercard = 1,
        Amex = 2,
        Unknown = 3
    };

    struct Classification
    {
        Scheme scheme;
        std::size_t length;
    };

    inline bool operator==(const Classification& lhs, const Classification& rhs)
    {
        return lhs.scheme == rhs.scheme && lhs.length == rhs.length;
    }

    /**
     * @return Total card number length for the scheme, 15 for Amex and 16 for everything else
     */
    constexpr std::size_t card_length(Scheme scheme) noexcept
    {
        return scheme == Amex ? 15 : 16;
    }

    /**
     * @return The lowercase tag of the scheme, "visa", "mastercard", "amex" or "unknown"
     */
    std::string_view scheme_name(Scheme scheme) noexcept;

    /**
     * Works out the card scheme, and with it the total number length, for a
     * validated BIN.
     *
     * BINs shorter than 6 digits are classified on their first digit alone.
     * 6 digit BINs go through the full rule list in order: visa prefix, amex
     * prefixes, mastercard 51-55 prefixes, then the 222100-272099 mastercard
     * range. The first matching rule wins and the order is part of the
     * contract. Anything that matches nothing is Unknown.
     *
     * @param bin A BIN that passed is_valid_bin
     * @return The scheme and its card length
     */
    Classification classify(std::string_view bin) noexcept;
}
