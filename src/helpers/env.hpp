#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace env
{
    std::optional<std::string> get_string(const char* name);
    std::optional<bool> get_bool(const char* name);
    std::optional<int64_t> get_int(const char* name);

    std::string get_string(const char* name, std::string def);
    std::optional<std::string> get_string(const char* name, std::optional<std::string> def);
    bool get_bool(const char* name, bool def);
}
