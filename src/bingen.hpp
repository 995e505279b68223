#pragma once

#include <iosfwd>

#include "gen_opts.hpp"

namespace bingen
{
    /**
     * Entry point of the program: reads the options, sets up logging and
     * runs one generation request against stdin/stdout.
     *
     * @return The process exit code
     */
    int run(int argc, const char** argv);

    /**
     * Runs one request: get a BIN, get a quantity, generate, deliver.
     *
     * Values missing from the options are asked for on `in`, with prompts and
     * user-facing messages written to `messages`. Cards go to `out` when
     * opts.to_stdout is set, otherwise into a file under opts.output_dir.
     *
     * @return 0 when cards were delivered, 1 when the request was rejected or cancelled
     */
    int serve(const GeneratorOptions& opts, std::istream& in, std::ostream& out, std::ostream& messages);
}
