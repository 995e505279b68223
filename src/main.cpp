#include <cstdlib>
#include <exception>

#include <spdlog/spdlog.h>

#include "bingen.hpp"

int main(int argc, const char** argv)
{
    try
    {
        return bingen::run(argc, argv);
    }
    catch (const std::exception& e)
    {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }
}
