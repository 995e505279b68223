#pragma once

#include <string_view>

namespace cardgen
{
    /**
     * Checks whether the text can be used as a BIN: decimal digits only,
     * and exactly 3, 4 or 6 of them.
     *
     * Invalid input is an ordinary outcome, so this never throws.
     */
    bool is_valid_bin(std::string_view text) noexcept;
}
