/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdint>
#include <iterator>
#include <random>
#include <utility>
#include <vector>

#include "spdlog/spdlog.h"

#include "antithetic/consts.hpp"
#include "antithetic/seed.hpp"

namespace pairing {

Seed::Seed(std::uint64_t value)
    : words_(std::vector<std::uint32_t>{static_cast<std::uint32_t>(value & 0xffffffffULL),
                                        static_cast<std::uint32_t>(value >> 32)}) {}

Seed::Seed(std::vector<std::uint32_t> words) : words_(std::move(words)) {}

Seed::Seed(const std::seed_seq &sequence) : words_(std::vector<std::uint32_t>()) {
    words_->reserve(sequence.size());
    sequence.param(std::back_inserter(*words_));
}

std::vector<std::uint32_t> Seed::words() const {
    if (words_) {
        return *words_;
    }

    std::random_device device;
    std::vector<std::uint32_t> entropy(consts::entropy_words);
    for (auto &word : entropy) {
        word = device();
    }
    spdlog::debug("Seeding from system entropy ({} words)", entropy.size());
    return entropy;
}

std::mt19937_64 Seed::make_engine() const {
    std::vector<std::uint32_t> entropy = words();
    std::seed_seq sequence(entropy.begin(), entropy.end());
    return std::mt19937_64(sequence);
}

}; /* namespace pairing */
