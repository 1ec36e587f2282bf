/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <span>
#include <stdexcept>

#include "spdlog/spdlog.h"

#include "antithetic/stats.hpp"

namespace stats {

double correlation(std::span<const double> x, std::span<const double> y) {
    if (x.size() != y.size()) {
        spdlog::error("Cannot correlate sequences of sizes {} and {}", x.size(), y.size());
        throw std::invalid_argument("Vectors must have the same size.");
    }
    if (x.size() < 2) {
        spdlog::error("Cannot correlate {} observations", x.size());
        throw std::invalid_argument("At least two observations are required.");
    }

    const double n = static_cast<double>(x.size());
    const double mx = std::accumulate(x.begin(), x.end(), 0.0) / n;
    const double my = std::accumulate(y.begin(), y.end(), 0.0) / n;

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    if (sxx == 0.0 || syy == 0.0) {
        spdlog::error("Cannot correlate a constant sequence");
        throw std::invalid_argument("Correlation is undefined for a constant sequence.");
    }

    return std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
}

void RunningStats::add(double x) noexcept {
    ++n_;
    const double delta = x - mean_;
    mean_ += delta / static_cast<double>(n_);
    m2_ += delta * (x - mean_);
}

double RunningStats::variance() const noexcept {
    if (n_ < 2) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return m2_ / static_cast<double>(n_ - 1);
}

}; /* namespace stats */
