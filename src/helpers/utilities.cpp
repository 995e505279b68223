#include "utilities.hpp"

#include <ctime>
#include <regex>

std::string_view util::trim(std::string_view str)
{
    constexpr std::string_view whitespace = " \t\r\n\f\v";

    auto start = str.find_first_not_of(whitespace);
    if (start == std::string_view::npos)
        return {};

    auto end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string util::extract_bin(std::string_view text)
{
    static const std::regex bin_label{R"(^bin:?\s*)", std::regex::icase};
    static const std::regex bin_digits{R"(\d{3,6})"};

    auto trimmed = trim(text);
    std::string stripped = std::regex_replace(std::string(trimmed), bin_label, "",
                                              std::regex_constants::format_first_only);

    std::smatch match;
    if (std::regex_search(stripped, match, bin_digits))
        return match.str(0);
    return {};
}

util::quantity_result util::parse_quantity(std::string_view text, uint32_t max)
{
    auto trimmed = trim(text);
    bool negative = false;
    if (!trimmed.empty() && (trimmed.front() == '+' || trimmed.front() == '-'))
    {
        negative = trimmed.front() == '-';
        trimmed.remove_prefix(1);
    }

    if (trimmed.empty() || !std::all_of(trimmed.begin(), trimmed.end(), [](char c) { return c >= '0' && c <= '9'; }))
        return { QuantityStatus::Invalid, 0 };

    auto parsed = parse<uint64_t>(trimmed);
    if (parsed.ec == std::errc::result_out_of_range)
        return { negative ? QuantityStatus::NotPositive : QuantityStatus::OverLimit, 0 };
    if (parsed.ec != std::errc{})
        return { QuantityStatus::Invalid, 0 };

    if (negative || parsed.value == 0)
        return { QuantityStatus::NotPositive, 0 };
    if (parsed.value > max)
        return { QuantityStatus::OverLimit, parsed.value };

    return { QuantityStatus::Ok, parsed.value };
}

std::string util::format_record(const cardgen::CardRecord& record)
{
    std::string line;
    line.reserve(record.number.size() + record.expiry_month.size() + record.expiry_year.size() + record.cvv.size() + 3);
    line.append(record.number).append(1, '|')
        .append(record.expiry_month).append(1, '|')
        .append(record.expiry_year).append(1, '|')
        .append(record.cvv);
    return line;
}

std::string util::batch_filename(std::string_view bin, std::size_t quantity,
                                 std::chrono::system_clock::time_point when)
{
    char buf[32];
    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&time, &local);
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &local);

    std::string name = "cards_";
    name.append(bin).append(1, '_').append(std::to_string(quantity)).append(1, '_').append(buf).append(".txt");
    return name;
}
