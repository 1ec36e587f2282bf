/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <stdexcept>
#include <tuple>
#include <vector>

#include "spdlog/spdlog.h"

#include "antithetic/integration.hpp"

namespace integration {

/* clang-format off */

/**
 * @brief Kronrod nodes of the 15-point rule on [0, 1], descending; the last node is the center.
 *
 * Odd indices are the nodes of the embedded 7-point Gauss rule.
 */
static constexpr double xgk[8] = {
  0.991455371120812639206854697526329,
  0.949107912342758524526189684047851,
  0.864864423359769072789712788640926,
  0.741531185599394439863864773280788,
  0.586087235467691130294144845693013,
  0.405845151377397166906606412076961,
  0.207784955007898467600689403773245,
  0.000000000000000000000000000000000
};

/**
 * @brief Kronrod weights for xgk.
 */
static constexpr double wgk[8] = {
  0.022935322010529224963732008058970,
  0.063092092629978553290700663189204,
  0.104790010322250183839876322541518,
  0.140653259715525918745189590510238,
  0.169004726639267902826583426598550,
  0.190350578064785409913256402421014,
  0.204432940075298892414161999234649,
  0.209482141084727828012999174891714
};

/**
 * @brief Gauss weights for the nodes xgk[1], xgk[3], xgk[5] and the center.
 */
static constexpr double wg[4] = {
  0.129484966168869693270611432679082,
  0.279705391489276667901467771423780,
  0.381830050505118944950369775488975,
  0.417959183673469387755102040816327
};

/* clang-format on */

namespace {

struct Segment {
    double a;
    double b;
    double result;
    double error;

    bool operator<(const Segment &other) const { return error < other.error; }
};

/**
 * @brief Apply the 15-point rule on [a, b].
 *
 * @return Tuple of (integral estimate, error estimate).
 */
std::tuple<double, double> qk15(const std::function<double(double)> &f, double a, double b) {
    constexpr double eps = std::numeric_limits<double>::epsilon();

    const double center = 0.5 * (a + b);
    const double half_length = 0.5 * (b - a);

    double f_lo[7];
    double f_hi[7];
    const double f_center = f(center);

    double result_kronrod = wgk[7] * f_center;
    double result_gauss = wg[3] * f_center;
    double resabs = wgk[7] * std::abs(f_center);

    for (int i = 0; i < 7; ++i) {
        const double absc = half_length * xgk[i];
        f_lo[i] = f(center - absc);
        f_hi[i] = f(center + absc);

        result_kronrod += wgk[i] * (f_lo[i] + f_hi[i]);
        resabs += wgk[i] * (std::abs(f_lo[i]) + std::abs(f_hi[i]));
        if (i % 2 == 1) {
            result_gauss += wg[i / 2] * (f_lo[i] + f_hi[i]);
        }
    }

    /* deviation from the mean value, used to scale the error estimate */
    const double mean = 0.5 * result_kronrod;
    double resasc = wgk[7] * std::abs(f_center - mean);
    for (int i = 0; i < 7; ++i) {
        resasc += wgk[i] * (std::abs(f_lo[i] - mean) + std::abs(f_hi[i] - mean));
    }

    result_kronrod *= half_length;
    resabs *= std::abs(half_length);
    resasc *= std::abs(half_length);

    double err = std::abs((result_kronrod - result_gauss * half_length));
    if (resasc != 0.0 && err != 0.0) {
        err = resasc * std::min(1.0, std::pow(200.0 * err / resasc, 1.5));
    }
    if (resabs > std::numeric_limits<double>::min() / (50.0 * eps)) {
        err = std::max(50.0 * eps * resabs, err);
    }

    return {result_kronrod, err};
}

} /* namespace */

double gauss_kronrod_15(
    const std::function<double(double)> &f, double a, double b, double eps_abs, double eps_rel, int max_intervals) {
    if (!(b > a)) {
        spdlog::error("Invalid integration interval [{}, {}]", a, b);
        throw std::invalid_argument("Upper limit must be greater than lower limit");
    }
    if (max_intervals < 1) {
        throw std::invalid_argument("max_intervals must be >= 1");
    }

    std::priority_queue<Segment, std::vector<Segment>> segments;

    auto [result, error] = qk15(f, a, b);
    segments.push({a, b, result, error});

    double total_result = result;
    double total_error = error;
    int intervals_used = 1;

    while (total_error > std::max(eps_abs, eps_rel * std::abs(total_result))) {
        if (!std::isfinite(total_result)) {
            spdlog::error("Integrand is not finite on [{}, {}]", a, b);
            throw std::runtime_error("Integrand is not finite.");
        }
        if (intervals_used >= max_intervals) {
            spdlog::error("Quadrature did not converge, error estimate {} after {} intervals", total_error,
                          intervals_used);
            throw std::runtime_error("Failed to converge within max_intervals.");
        }

        Segment worst = segments.top();
        segments.pop();

        const double mid = 0.5 * (worst.a + worst.b);
        auto [left_result, left_error] = qk15(f, worst.a, mid);
        auto [right_result, right_error] = qk15(f, mid, worst.b);

        total_result += left_result + right_result - worst.result;
        total_error += left_error + right_error - worst.error;

        segments.push({worst.a, mid, left_result, left_error});
        segments.push({mid, worst.b, right_result, right_error});
        ++intervals_used;
    }

    if (!std::isfinite(total_result)) {
        spdlog::error("Integrand is not finite on [{}, {}]", a, b);
        throw std::runtime_error("Integrand is not finite.");
    }

    return total_result;
}

}; /* namespace integration */
