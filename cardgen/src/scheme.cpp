#include "scheme.hpp"

#include <array>
#include <charconv>

namespace
{
    using cardgen::Scheme;

    struct SchemeRule
    {
        enum Kind : uint8_t
        {
            Prefix,
            Range
        };

        Kind kind;
        std::string_view prefix;
        uint32_t low;
        uint32_t high;
        Scheme scheme;
    };

    constexpr SchemeRule prefix_rule(std::string_view prefix, Scheme scheme)
    {
        return SchemeRule{SchemeRule::Prefix, prefix, 0, 0, scheme};
    }

    constexpr SchemeRule range_rule(uint32_t low, uint32_t high, Scheme scheme)
    {
        return SchemeRule{SchemeRule::Range, {}, low, high, scheme};
    }

    // BINs with fewer than 6 digits only ever look at the first digit.
    constexpr std::array<SchemeRule, 2> SHORT_BIN_RULES {
            prefix_rule("4", cardgen::Visa),
            prefix_rule("3", cardgen::Amex)
    };

    constexpr std::array<SchemeRule, 9> FULL_BIN_RULES {
            prefix_rule("4", cardgen::Visa),
            prefix_rule("34", cardgen::Amex),
            prefix_rule("37", cardgen::Amex),
            prefix_rule("51", cardgen::Mastercard),
            prefix_rule("52", cardgen::Mastercard),
            prefix_rule("53", cardgen::Mastercard),
            prefix_rule("54", cardgen::Mastercard),
            prefix_rule("55", cardgen::Mastercard),
            range_rule(222100, 272099, cardgen::Mastercard)
    };

    bool matches(const SchemeRule& rule, std::string_view bin)
    {
        switch (rule.kind)
        {
        case SchemeRule::Prefix:
            return bin.substr(0, rule.prefix.size()) == rule.prefix;
        case SchemeRule::Range:
        {
            uint32_t value;
            auto [ptr, ec] = std::from_chars(bin.data(), bin.data() + bin.size(), value);
            if (ec != std::errc{} || ptr != bin.data() + bin.size())
                return false;
            return value >= rule.low && value <= rule.high;
        }
        }
        return false;
    }

    template<std::size_t N>
    Scheme first_match(const std::array<SchemeRule, N>& rules, std::string_view bin)
    {
        for (const auto& rule : rules)
        {
            if (matches(rule, bin))
                return rule.scheme;
        }
        return cardgen::Unknown;
    }
}

std::string_view cardgen::scheme_name(Scheme scheme) noexcept
{
    switch (scheme)
    {
    case Visa:
        return "visa";
    case Mastercard:
        return "mastercard";
    case Amex:
        return "amex";
    case Unknown:
        break;
    }
    return "unknown";
}

cardgen::Classification cardgen::classify(std::string_view bin) noexcept
{
    auto scheme = bin.size() < 6
            ? first_match(SHORT_BIN_RULES, bin.substr(0, 1))
            : first_match(FULL_BIN_RULES, bin);

    return { scheme, card_length(scheme) };
}
