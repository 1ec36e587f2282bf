/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cmath>
#include <numbers>

namespace consts {

/* Admissible correlation range, for both raw (normal-level) and public correlations. */
constexpr double corr_min = -1.0;
constexpr double corr_max = 1.0;

/* Normal CDF: Phi(x) = 0.5 * erfc(-x / sqrt(2)). */
constexpr double inv_sqrt_2 = 1.0 / std::numbers::sqrt2;

/* Uniform marginal moments: sd = (high - low) / sqrt(12), var = (high - low)^2 / 12. */
constexpr double inv_sqrt_12 = 0.28867513459481287;
constexpr double inv_12 = 1.0 / 12.0;

/* Largest double strictly below 1, upper bound for uniforms derived from the normal CDF. */
const double below_one = std::nextafter(1.0, 0.0);

/* Quadrature settings used for moments of inverse-CDF families. */
constexpr double moment_eps_abs = 1.0e-10;  /* Absolute error tolerance. */
constexpr double moment_eps_rel = 1.0e-10;  /* Relative error tolerance. */
constexpr int moment_max_intervals = 4000;  /* Maximum number of bisected subintervals. */

/* Words drawn from std::random_device when a seed is requested from system entropy. */
constexpr int entropy_words = 8;

}; /* namespace consts */
