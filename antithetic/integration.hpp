/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

namespace integration {

/**
 * @brief Compute the integral of a function over [a, b] using adaptive 15-point Gauss-Kronrod quadrature.
 *
 * The interval with the largest estimated error is bisected until the summed error estimate satisfies the requested
 * tolerances. The rule never evaluates the function at the interval endpoints, so integrands with integrable
 * singularities at a or b (such as quantile functions on (0, 1)) are supported.
 *
 * @param f             Function to integrate.
 * @param a             Lower limit of integration.
 * @param b             Upper limit of integration.
 * @param eps_abs       Absolute error tolerance.
 * @param eps_rel       Relative error tolerance.
 * @param max_intervals Maximum number of subintervals allowed.
 *
 * @return Approximated integral of the function over [a, b].
 *
 * @throws std::invalid_argument if b <= a or max_intervals < 1.
 * @throws std::runtime_error if the integrand is not finite or the tolerance is not met within max_intervals.
 */
double gauss_kronrod_15(
    const std::function<double(double)> &f, double a, double b, double eps_abs, double eps_rel, int max_intervals);

}; /* namespace integration */
