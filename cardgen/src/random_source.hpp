#pragma once

#include <cstdint>
#include <random>

namespace cardgen
{
    /**
     * Source of uniformly distributed integers.
     *
     * Everything in the library that needs randomness takes one of these by
     * reference instead of reaching for a global generator, so a caller can
     * seed it, share it across a batch, or script it in tests.
     */
    class RandomSource
    {
    public:
        virtual ~RandomSource() = default;

        /**
         * @return A uniformly chosen integer in the inclusive range [min, max]
         */
        virtual int number_in_range(int min, int max) = 0;
    };

    /**
     * The default RandomSource, backed by std::mt19937_64.
     */
    class MersenneSource : public RandomSource
    {
        std::mt19937_64 m_gen;
    public:
        MersenneSource() : m_gen(std::random_device{}()) {}
        explicit MersenneSource(uint64_t seed) : m_gen(seed) {}

        int number_in_range(int min, int max) override
        {
            std::uniform_int_distribution<int> dist{min, max};
            return dist(m_gen);
        }
    };
}
