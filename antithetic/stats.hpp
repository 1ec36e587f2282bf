/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <span>

namespace stats {

/**
 * @brief Empirical (Pearson) correlation between two sequences of paired observations.
 *
 * @param x First sequence.
 * @param y Second sequence, same size as x.
 *
 * @return Correlation in [-1, 1].
 *
 * @throws std::invalid_argument if the sizes differ, fewer than two observations are given, or either sequence is
 * constant.
 */
double correlation(std::span<const double> x, std::span<const double> y);

/**
 * @brief Streaming mean and variance accumulator (Welford's algorithm).
 */
class RunningStats {
public:
    void add(double x) noexcept;

    std::size_t count() const noexcept { return n_; }

    double mean() const noexcept { return mean_; }

    /**
     * @brief Sample variance (divisor n - 1); NaN if fewer than two values were added.
     */
    double variance() const noexcept;

private:
    std::size_t n_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0; /* Sum of squared deviations from the running mean */
};

}; /* namespace stats */
