/**
 * @file random_source.hpp
 * @brief Explicit random engine shared by all metaheuristics
 *
 * Engines never use ambient randomness: every stochastic operation takes a
 * RandomEngine& argument, so a fixed seed reproduces a run exactly and
 * independent runs can use independently seeded engines.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>

namespace natopt
{
    namespace optimizer
    {

        using RandomEngine = std::mt19937_64;

        /**
         * @brief Seed for one (engine, run) pair derived from a base seed
         *
         * Mixing through std::seed_seq keeps neighbouring runs decorrelated
         * even though their indices differ by one.
         */
        inline std::uint64_t derive_seed(std::uint64_t base_seed,
                                         std::uint64_t engine_index,
                                         std::uint64_t run_index)
        {
            std::seed_seq seq{
                static_cast<std::uint32_t>(base_seed & 0xffffffffu),
                static_cast<std::uint32_t>(base_seed >> 32),
                static_cast<std::uint32_t>(engine_index),
                static_cast<std::uint32_t>(run_index)};

            std::uint32_t words[2];
            seq.generate(words, words + 2);
            return (static_cast<std::uint64_t>(words[0]) << 32) | words[1];
        }

        /**
         * @brief Non-deterministic seed for unseeded sessions
         */
        inline std::uint64_t seed_from_device()
        {
            std::random_device rd;
            return (static_cast<std::uint64_t>(rd()) << 32) | rd();
        }

        /**
         * @brief Parse a base seed given as decimal text
         *
         * Only digits are accepted: a sign, blanks or trailing text throw
         * instead of wrapping or being ignored.
         *
         * @throws std::invalid_argument unless text is a non-empty run of digits
         * @throws std::out_of_range if the value does not fit in 64 bits
         */
        inline std::uint64_t parse_seed(const std::string &text)
        {
            const bool digits_only = !text.empty() &&
                                     std::all_of(text.begin(), text.end(), [](unsigned char c)
                                                 { return std::isdigit(c) != 0; });
            if (!digits_only)
            {
                throw std::invalid_argument("Seed must be a non-negative integer, got: '" + text + "'");
            }
            return std::stoull(text);
        }

    } // namespace optimizer
} // namespace natopt
