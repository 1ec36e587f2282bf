/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace pairing {

/**
 * @brief Seed for the pseudo-random source of a pairing engine.
 *
 * A seed is either a list of 32-bit entropy words (built from an integer, from a word sequence or from an existing
 * std::seed_seq) or empty, in which case fresh words are requested from the system entropy source every time an
 * engine is created from it.
 */
class Seed {
public:
    /**
     * @brief Seed drawn from system entropy.
     */
    Seed() = default;

    /**
     * @brief Seed from a single integer, split into its low and high 32-bit words.
     *
     * @param value Seed value. Using the same value ensures reproducibility.
     */
    Seed(std::uint64_t value);

    /**
     * @brief Seed from a sequence of 32-bit words.
     *
     * @param words Entropy words, passed to std::seed_seq unchanged.
     */
    explicit Seed(std::vector<std::uint32_t> words);

    /**
     * @brief Seed from an existing seed sequence, copying its entropy words.
     */
    explicit Seed(const std::seed_seq &sequence);

    /**
     * @brief Whether the seed defers to system entropy.
     */
    bool from_entropy() const noexcept { return !words_.has_value(); }

    /**
     * @brief Entropy words for this seed; fresh system entropy if the seed is empty.
     */
    std::vector<std::uint32_t> words() const;

    /**
     * @brief Create a freshly seeded Mersenne Twister engine.
     */
    std::mt19937_64 make_engine() const;

private:
    std::optional<std::vector<std::uint32_t>> words_;
};

}; /* namespace pairing */
