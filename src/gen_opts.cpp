#include "gen_opts.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <popl.hpp>
#include <spdlog/spdlog.h>

#include "helpers/env.hpp"

namespace fs = std::filesystem;

/**
 * Range checks a maximum card count coming from `source` (a file, variable or flag).
 *
 * @throws std::invalid_argument If the value is below 1 or doesn't fit in 32 bits
 */
uint32_t checked_max_quantity(int64_t value, const std::string& source)
{
    if (value < 1 || value > std::numeric_limits<uint32_t>::max())
        throw std::invalid_argument(source + ": the maximum number of cards per request must be between 1 and "
                                    + std::to_string(std::numeric_limits<uint32_t>::max()) + ", got "
                                    + std::to_string(value) + "!");
    return static_cast<uint32_t>(value);
}

/**
 * Given a json configuration file, it will populate the file backed fields
 * of a GeneratorOptions struct. The format of the JSON file is the following:
 * @code
 * {
 *      "max_quantity": int,
 *      "output_dir": string,
 *      "log_level": string,
 *      "log_file": string
 * }
 * @endcode
 * @param file Path to the json config file to process.
 * @param opts Options to start from; keys missing in the file keep these values
 * @return The populated GeneratorOptions struct
 */
GeneratorOptions parse_options_from_file(const fs::path& file, GeneratorOptions opts)
{
    std::ifstream i(file);
    if (!i)
        throw std::invalid_argument("unable to read config file '" + file.string() + "'");

    nlohmann::json j;
    try
    {
        i >> j;
    }
    catch (const nlohmann::json::exception& e)
    {
        throw std::invalid_argument("malformed config file '" + file.string() + "': " + e.what());
    }

    auto get_or_default = [&j](const char* name, auto default_val) -> decltype(default_val)
    {
        if (!j.contains(name) || j[name].is_null())
            return default_val;

        return j[name].get<decltype(default_val)>();
    };

    if (j.contains("max_quantity") && !j["max_quantity"].is_null())
    {
        if (!j["max_quantity"].is_number_integer())
            throw std::invalid_argument(file.string() + ": max_quantity must be an integer!");
        opts.max_quantity = checked_max_quantity(j["max_quantity"].get<int64_t>(), file.string());
    }
    opts.output_dir = get_or_default("output_dir", opts.output_dir);
    opts.log_level = get_or_default("log_level", opts.log_level);
    if (j.contains("log_file") && j["log_file"].is_string())
        opts.log_file = j["log_file"].get<std::string>();

    return opts;
}

GeneratorOptions parse_options(int argc, const char** argv)
{
    GeneratorOptions options;
    auto configFile = env::get_string("BINGEN_CONFIG_FILE", std::string{"bingen.json"});

    if (fs::exists(configFile))
        options = parse_options_from_file(configFile, options);

    if (auto max = env::get_int("BINGEN_MAX_QUANTITY"))
        options.max_quantity = checked_max_quantity(*max, "BINGEN_MAX_QUANTITY");
    options.output_dir = env::get_string("BINGEN_OUTPUT_DIR", options.output_dir);
    options.to_stdout = env::get_bool("BINGEN_STDOUT", options.to_stdout);
    options.log_level = env::get_string("BINGEN_LOG_LEVEL", options.log_level);
    options.log_file = env::get_string("BINGEN_LOG_FILE", options.log_file);

    popl::OptionParser op("OPTIONS");
    auto help_opt = op.add<popl::Switch>("h", "help", "show this message");
    auto conf_opt = op.add<popl::Value<std::string>>("i", "config", "config file to use");
    auto bin_opt = op.add<popl::Value<std::string>>("b", "bin", "BIN to generate from (3, 4 or 6 digits)");
    auto count_opt = op.add<popl::Value<std::string>>("n", "count", "number of cards to generate");
    auto max_opt = op.add<popl::Value<int64_t>>("m", "max", "maximum number of cards per request");
    auto out_opt = op.add<popl::Value<std::string>>("o", "output-dir", "directory the card file is written to");
    auto stdout_opt = op.add<popl::Switch>("s", "stdout", "write the cards to standard output instead of a file");
    auto seed_opt = op.add<popl::Value<uint64_t>>("S", "seed", "seed for the random generator");
    auto level_opt = op.add<popl::Value<std::string>>("l", "log-level", "trace, debug, info, warning, error, critical or off");
    auto log_opt = op.add<popl::Value<std::string>>("L", "log-file", "also log to this file, rotated daily");
    op.parse(argc, argv);

    if (help_opt->is_set())
    {
        std::cout << "usage:\n";
        std::cout << "\t" << argv[0] << " [OPTIONS] [BIN text]\n\n";
        std::cout << op << "\n";
        std::exit(EXIT_SUCCESS);
    }

    if (conf_opt->is_set())
    {
        if (!fs::exists(conf_opt->value()))
            throw std::invalid_argument("config file '" + conf_opt->value() + "' does not exist!");
        options = parse_options_from_file(conf_opt->value(), options);
    }

    if (bin_opt->is_set())
    {
        options.bin_text = bin_opt->value();
    }
    else if (!op.non_option_args().empty())
    {
        std::string text;
        for (const auto& arg : op.non_option_args())
        {
            if (!text.empty())
                text += ' ';
            text += arg;
        }
        options.bin_text = std::move(text);
    }

    if (count_opt->is_set())
        options.quantity_text = count_opt->value();
    if (max_opt->is_set())
        options.max_quantity = checked_max_quantity(max_opt->value(), "--max");
    if (out_opt->is_set())
        options.output_dir = out_opt->value();
    if (stdout_opt->is_set())
        options.to_stdout = true;
    if (seed_opt->is_set())
        options.seed = seed_opt->value();
    if (level_opt->is_set())
        options.log_level = level_opt->value();
    if (log_opt->is_set())
        options.log_file = log_opt->value();

    if (spdlog::level::from_str(options.log_level) == spdlog::level::off && options.log_level != "off")
        throw std::invalid_argument("unknown log level '" + options.log_level + "'!");

    return options;
}
