#include "env.hpp"

#include <utility>
#include <cstdlib>

#include "utilities.hpp"

namespace env
{
    std::optional<std::string> get_string(const char* name)
    {
        if (const char* x = std::getenv(name))
        {
            std::string res = x;
            if (res.empty())
                return {};
            return res;
        }

        return {};
    }

    std::string get_string(const char* name, std::string def)
    {
        return get_string(name).value_or(std::move(def));
    }

    std::optional<std::string> get_string(const char* name, std::optional<std::string> def)
    {
        if (auto value = get_string(name))
            return value;
        return def;
    }

    std::optional<bool> get_bool(const char* name)
    {
        if (auto optstr = get_string(name))
        {
            auto str = util::to_lower(*optstr);
            if (auto parsed = util::parse<bool>(str); parsed.ec == std::errc{})
                return parsed.value;

            return str == "yes" || str == "y";
        }

        return {};
    }

    bool get_bool(const char* name, bool def)
    {
        return get_bool(name).value_or(def);
    }

    std::optional<int64_t> get_int(const char* name)
    {
        if (auto optstr = get_string(name))
        {
            auto parsed = util::parse<int64_t>(*optstr);
            if (parsed.ec == std::errc{})
                return parsed.value;
        }

        return {};
    }
}
