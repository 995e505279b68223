#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

#include "model.hpp"
#include "random_source.hpp"

namespace cardgen
{
    /**
     * Generates one card for the BIN: classify, synthesize the number, then
     * pick expiry and security code.
     *
     * @param bin A BIN that passed is_valid_bin
     */
    CardRecord generate_card(std::string_view bin, RandomSource& random, std::chrono::system_clock::time_point now);

    /**
     * Generates `quantity` independent cards for the same BIN, in order.
     *
     * Either the whole batch is returned or an exception propagates; a
     * partial batch is never handed back. The quantity is expected to be
     * bounded by the caller already.
     */
    Batch generate_batch(std::string_view bin, std::size_t quantity, RandomSource& random,
                         std::chrono::system_clock::time_point now);

    /**
     * Generates a batch with a freshly seeded MersenneSource and the current time.
     */
    Batch generate_batch(std::string_view bin, std::size_t quantity);
}
