#include "bingen.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "cardgen.hpp"
#include "card_file.hpp"
#include "helpers/utilities.hpp"

namespace
{
    void initialize_logging(const GeneratorOptions& opts)
    {
        // stdout may be carrying the cards, so everything logged goes to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        std::vector<spdlog::sink_ptr> sinks{console_sink};
        if (opts.log_file.has_value())
        {
            auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(*opts.log_file, 0, 0);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("bingen", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(opts.log_level));
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%D %r] [%^%n - %l%$] %v");
        spdlog::flush_on(spdlog::level::warn);
    }

    bool is_cancel(std::string_view text)
    {
        auto lowered = util::to_lower(std::string(util::trim(text)));
        return lowered == "cancel" || lowered == "/cancel";
    }

    /**
     * Asks for one line of input.
     *
     * @return The line, or nothing if the input ended or the user cancelled
     */
    std::optional<std::string> prompt(std::istream& in, std::ostream& messages, std::string_view question)
    {
        messages << question << "\n> " << std::flush;

        std::string line;
        if (!std::getline(in, line) || is_cancel(line))
            return {};
        return line;
    }

    // The requested count as a plain number, for counts too large to parse
    std::string_view requested_digits(std::string_view text)
    {
        auto digits = util::trim(text);
        if (!digits.empty() && digits.front() == '+')
            digits.remove_prefix(1);
        while (digits.size() > 1 && digits.front() == '0')
            digits.remove_prefix(1);
        return digits;
    }

    /**
     * Explains why a quantity was refused.
     *
     * @return true if the quantity was accepted
     */
    bool report_quantity(const util::quantity_result& result, std::string_view text, uint32_t max,
                         std::ostream& messages)
    {
        switch (result.status)
        {
        case util::QuantityStatus::Ok:
            return true;
        case util::QuantityStatus::Invalid:
            messages << "Invalid quantity. Please send a valid number.\nExamples: 1, 10, 100\n";
            break;
        case util::QuantityStatus::NotPositive:
            messages << "Quantity must be a positive number.\nPlease send a number greater than 0.\n";
            break;
        case util::QuantityStatus::OverLimit:
            messages << "Maximum " << max << " cards per request.\nYou requested ";
            if (result.value != 0)
                messages << result.value;
            else
                messages << requested_digits(text);
            messages << " cards.\nPlease try with a smaller number.\n";
            break;
        }
        return false;
    }
}

int bingen::serve(const GeneratorOptions& opts, std::istream& in, std::ostream& out, std::ostream& messages)
{
    std::string bin_text;
    if (opts.bin_text.has_value())
    {
        bin_text = *opts.bin_text;
    }
    else if (auto line = prompt(in, messages, "Send a BIN (3, 4 or 6 digits), e.g. 123, 1234, 123456 or BIN: 1234"))
    {
        bin_text = std::move(*line);
    }
    else
    {
        messages << "Operation cancelled.\n";
        return 1;
    }

    auto bin = util::extract_bin(bin_text);
    if (bin.empty())
    {
        messages << "Could not find a valid BIN in your message.\n"
                    "Please send a BIN with 3, 4, or 6 digits.\n"
                    "Examples: 123, 1234, 123456, or BIN: 1234\n";
        return 1;
    }
    if (!cardgen::is_valid_bin(bin))
    {
        messages << "Invalid BIN: " << bin << "\nBIN must be exactly 3, 4, or 6 digits.\n";
        return 1;
    }
    messages << "BIN received: " << bin << "\n";

    uint32_t quantity = 0;
    if (opts.quantity_text.has_value())
    {
        auto result = util::parse_quantity(*opts.quantity_text, opts.max_quantity);
        if (!report_quantity(result, *opts.quantity_text, opts.max_quantity, messages))
            return 1;
        quantity = static_cast<uint32_t>(result.value);
    }
    else
    {
        auto question = "How many cards do you want to generate? (1-" + std::to_string(opts.max_quantity) + ")";
        while (quantity == 0)
        {
            auto line = prompt(in, messages, question);
            if (!line)
            {
                messages << "Operation cancelled.\n";
                return 1;
            }

            auto result = util::parse_quantity(*line, opts.max_quantity);
            if (report_quantity(result, *line, opts.max_quantity, messages))
                quantity = static_cast<uint32_t>(result.value);
        }
    }

    auto random = opts.seed.has_value() ? cardgen::MersenneSource{*opts.seed} : cardgen::MersenneSource{};
    auto now = std::chrono::system_clock::now();

    spdlog::info("Generating {} card(s) with BIN {}", quantity, bin);
    auto batch = cardgen::generate_batch(bin, quantity, random, now);

    if (opts.to_stdout)
    {
        card_file::write_records(out, batch);
        out.flush();
    }
    else
    {
        auto path = card_file::write_batch_file(opts.output_dir, bin, batch, now);
        spdlog::info("Wrote {} card(s) to {}", batch.size(), path.string());
        messages << "Generated " << batch.size() << " cards with BIN " << bin << ": " << path.string() << "\n"
                 << "Format: cardnumber|MM|YYYY|CVV\n";
    }

    return 0;
}

int bingen::run(int argc, const char** argv)
{
    auto opts = parse_options(argc, argv);
    initialize_logging(opts);

    auto& messages = opts.to_stdout ? std::cerr : std::cout;
    return serve(opts, std::cin, std::cout, messages);
}
