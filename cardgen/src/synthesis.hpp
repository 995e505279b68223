#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "random_source.hpp"

namespace cardgen
{
    constexpr int MAX_SYNTHESIS_ATTEMPTS = 8;

    /**
     * Thrown when a synthesized number keeps failing its final Luhn check.
     * It means the check digit search is broken, not that the input was bad,
     * so nothing should try to recover from it.
     */
    class synthesis_error : public std::logic_error
    {
    public:
        using std::logic_error::logic_error;
    };

    using NumberVerifier = std::function<bool(std::string_view)>;

    /**
     * The part of the BIN that is kept at the front of the card number.
     *
     * 15 digit numbers keep the first 4 BIN digits, right padded with '0' for
     * a 3 digit BIN. 16 digit numbers keep the first 6 digits if there are
     * that many, otherwise the first 4, otherwise the BIN as it is.
     *
     * @throws std::invalid_argument If length is neither 15 nor 16
     */
    std::string synthesis_prefix(std::string_view bin, std::size_t length);

    /**
     * Expands a BIN into a Luhn-valid card number of the given length.
     *
     * The prefix is filled with random digits up to length - 1 (or cut to
     * that if it is already longer), then the check digit is appended. The
     * result is verified once more; a candidate that fails is thrown away and
     * synthesis starts again with fresh random digits, at most
     * MAX_SYNTHESIS_ATTEMPTS times.
     *
     * @param bin A validated BIN
     * @param length 15 or 16
     * @param random Source for the filler digits
     * @throws std::invalid_argument If length is neither 15 nor 16
     * @throws synthesis_error If no attempt produces a number that verifies
     */
    std::string synthesize_number(std::string_view bin, std::size_t length, RandomSource& random);

    /**
     * Same as above, with the final consistency check supplied by the caller
     * instead of luhn::is_valid.
     */
    std::string synthesize_number(std::string_view bin, std::size_t length, RandomSource& random,
                                  const NumberVerifier& verify);
}
