#pragma once

#include <catch2/catch.hpp>

#include <algorithm>
#include <deque>
#include <utility>

#include "random_source.hpp"

/**
 * Hands out a fixed sequence of values, then keeps returning `fallback`
 * (clamped into the requested range) once the script runs out.
 */
class ScriptedSource : public cardgen::RandomSource
{
    std::deque<int> m_values;
    int m_fallback;
public:
    int calls = 0;

    explicit ScriptedSource(std::deque<int> values, int fallback = 0)
        : m_values(std::move(values)), m_fallback(fallback) {}

    int number_in_range(int min, int max) override
    {
        ++calls;
        if (m_values.empty())
            return std::min(std::max(m_fallback, min), max);

        int value = m_values.front();
        m_values.pop_front();
        REQUIRE(value >= min);
        REQUIRE(value <= max);
        return value;
    }
};

/**
 * Wraps a seeded MersenneSource and counts how often it is asked.
 */
class CountingSource : public cardgen::RandomSource
{
    cardgen::MersenneSource m_inner;
public:
    int calls = 0;

    explicit CountingSource(uint64_t seed) : m_inner(seed) {}

    int number_in_range(int min, int max) override
    {
        ++calls;
        return m_inner.number_in_range(min, max);
    }
};
