#include "bin.hpp"

#include <algorithm>
#include <cctype>

bool cardgen::is_valid_bin(std::string_view text) noexcept
{
    if (text.size() != 3 && text.size() != 4 && text.size() != 6)
        return false;

    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}
