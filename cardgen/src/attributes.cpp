#include "attributes.hpp"

#include <ctime>

cardgen::Expiry cardgen::add_months(int year, int month, int months)
{
    int total = year * 12 + (month - 1) + months;
    int new_month = total % 12 + 1;

    Expiry result;
    if (new_month < 10)
        result.month += '0';
    result.month.append(std::to_string(new_month));
    result.year = std::to_string(total / 12);
    return result;
}

cardgen::Expiry cardgen::generate_expiry(RandomSource& random, std::chrono::system_clock::time_point now)
{
    auto months_ahead = random.number_in_range(MIN_MONTHS_AHEAD, MAX_MONTHS_AHEAD);

    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    return add_months(local.tm_year + 1900, local.tm_mon + 1, months_ahead);
}

std::string cardgen::generate_cvv(std::string_view number, RandomSource& random)
{
    if (number.size() == 15)
        return std::to_string(random.number_in_range(1000, 9999));
    return std::to_string(random.number_in_range(100, 999));
}
