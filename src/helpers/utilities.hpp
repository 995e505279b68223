#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include "model.hpp"

namespace util
{
    template<typename T>
    struct parse_result
    {
        std::errc ec{};
        T value{};
    };

    /**
     * Parses the whole string as a T. Trailing characters make the parse fail
     * with std::errc::invalid_argument.
     */
    template<typename T>
    auto parse(std::string_view str) -> parse_result<T>
    {
        static_assert(std::is_arithmetic_v<T>);
        parse_result<T> ret;
        if constexpr(std::is_same_v<bool, T>)
        {
            if (str == "true" || str == "on" || str == "1")
                ret.value = true;
            else if (str == "false" || str == "off" || str == "0")
                ret.value = false;
            else ret.ec = std::errc::invalid_argument;
        }
        else
        {
            auto [ptr, ec] { std::from_chars(str.data(), str.data() + str.size(), ret.value) };
            ret.ec = ec;
            if (ec == std::errc{} && ptr != str.data() + str.size())
                ret.ec = std::errc::invalid_argument;
        }
        return ret;
    }

    inline std::string to_lower(std::string str)
    {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
        return str;
    }

    std::string_view trim(std::string_view str);

    /**
     * Pulls a BIN candidate out of free-form text such as "4111", "BIN: 4111"
     * or "bin 411111". A leading "bin" (any case, optional colon) is dropped,
     * then the first run of 3 to 6 digits is taken.
     *
     * The result is only a candidate; it still has to pass cardgen::is_valid_bin.
     *
     * @return The digits found, or an empty string when there are none
     */
    std::string extract_bin(std::string_view text);

    enum class QuantityStatus
    {
        Ok,
        Invalid,
        NotPositive,
        OverLimit
    };

    /**
     * `value` is the accepted count for Ok, and the requested count for
     * OverLimit when it fits in 64 bits (0 otherwise).
     */
    struct quantity_result
    {
        QuantityStatus status;
        uint64_t value;
    };

    /**
     * Reads a requested card count, accepting surrounding whitespace and an
     * optional sign.
     *
     * @param text What the user typed
     * @param max The largest count allowed in one request
     */
    quantity_result parse_quantity(std::string_view text, uint32_t max);

    /**
     * @return The record as `number|MM|YYYY|cvv`, without a line break
     */
    std::string format_record(const cardgen::CardRecord& record);

    /**
     * @return `cards_<bin>_<quantity>_<YYYYmmdd_HHMMSS>.txt`, stamped in local time
     */
    std::string batch_filename(std::string_view bin, std::size_t quantity,
                               std::chrono::system_clock::time_point when);
}
