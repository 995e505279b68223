#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * A structure containing all of the configurable options of the generator.
 *
 * There are multiple ways to set these options, which are:
 *   A bingen.json file
 *   Environment variables
 *   Command line flags
 *
 * Note that command line arguments override environment variables
 * Environment variables override config files
 * and config files override the defaults.
 *
 * So defaults -> config files -> environment variables -> command line flags.
 */
struct GeneratorOptions
{
    uint32_t max_quantity = 1000;
    std::string output_dir = "temp";
    bool to_stdout = false;
    std::string log_level = "info";
    std::optional<std::string> log_file;

    // Only settable from the command line
    std::optional<std::string> bin_text;
    std::optional<std::string> quantity_text;
    std::optional<uint64_t> seed;
};

/**
 * Generates a GeneratorOptions structure with values from config files,
 * environment variables, and command line arguments, and sanity
 * checks the options to make sure they're valid.
 *
 * Anything on the command line that isn't an option is joined with spaces
 * and used as the BIN text, so `bingen BIN: 4111` works.
 *
 * @param argc Argument count passed in from `main`
 * @param argv Argument list passed in from `main`
 * @returns A populated and sanity checked GeneratorOptions struct
 * @throws std::invalid_argument Thrown whenever a sanity check fails
 */
GeneratorOptions parse_options(int argc, const char** argv);
