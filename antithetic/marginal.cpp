/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>

#include "antithetic/consts.hpp"
#include "antithetic/marginal.hpp"

namespace marginal {

double normal_cdf(double x) { return 0.5 * std::erfc(-x * consts::inv_sqrt_2); }

double affine(double x, double loc, double scale) { return scale * x + loc; }

double uniform_from_normal(double x) { return std::min(normal_cdf(x), consts::below_one); }

double uniform_quantile(double u, double low, double high) {
    double value = (high - low) * u + low;

    /* rounding may land exactly on high for u close to 1 */
    if (value >= high) {
        value = std::nextafter(high, low);
    }
    return value;
}

double exponential_quantile(double u, double loc, double scale) { return loc - scale * std::log1p(-u); }

}; /* namespace marginal */
