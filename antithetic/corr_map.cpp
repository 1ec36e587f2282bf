/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>

#include "spdlog/spdlog.h"

#include "antithetic/consts.hpp"
#include "antithetic/corr_map.hpp"

namespace corr_map {

void validate(double correlation) {
    if (!(consts::corr_min <= correlation && correlation <= consts::corr_max)) {
        spdlog::error("Invalid correlation {}", correlation);
        throw std::invalid_argument("Invalid correlation: " + std::to_string(correlation));
    }
}

double normal_raw_from_public(double correlation) {
    validate(correlation);
    return correlation;
}

double normal_public_from_raw(double raw_correlation) { return raw_correlation; }

double uniform_raw_from_public(double correlation) {
    validate(correlation);

    /* 2 * sin(pi / 6) rounds to just below 1, clamp keeps the result admissible on any platform */
    double raw = 2.0 * std::sin(std::numbers::pi * correlation / 6.0);
    return std::clamp(raw, consts::corr_min, consts::corr_max);
}

double uniform_public_from_raw(double raw_correlation) {
    return 6.0 * std::asin(0.5 * raw_correlation) / std::numbers::pi;
}

}; /* namespace corr_map */
