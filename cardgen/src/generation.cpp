#include "generation.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "attributes.hpp"
#include "scheme.hpp"
#include "synthesis.hpp"

cardgen::CardRecord cardgen::generate_card(std::string_view bin, RandomSource& random,
                                           std::chrono::system_clock::time_point now)
{
    auto classification = classify(bin);
    auto number = synthesize_number(bin, classification.length, random);
    auto [month, year] = generate_expiry(random, now);
    auto cvv = generate_cvv(number, random);

    return {
        std::move(number),
        std::move(month),
        std::move(year),
        std::move(cvv)
    };
}

cardgen::Batch cardgen::generate_batch(std::string_view bin, std::size_t quantity, RandomSource& random,
                                       std::chrono::system_clock::time_point now)
{
    spdlog::debug("Generating {} {} card(s) for BIN {}", quantity, scheme_name(classify(bin).scheme), bin);

    Batch batch;
    batch.reserve(quantity);
    for (std::size_t i = 0; i < quantity; ++i)
        batch.emplace_back(generate_card(bin, random, now));

    spdlog::debug("Finished generating {} card(s) for BIN {}", batch.size(), bin);
    return batch;
}

cardgen::Batch cardgen::generate_batch(std::string_view bin, std::size_t quantity)
{
    MersenneSource random;
    return generate_batch(bin, quantity, random, std::chrono::system_clock::now());
}
