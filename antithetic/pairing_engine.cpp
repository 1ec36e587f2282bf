/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <array>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

#include "spdlog/spdlog.h"

#include "antithetic/corr_map.hpp"
#include "antithetic/pairing_engine.hpp"
#include "antithetic/seed.hpp"

namespace pairing {

AssemblyMethod parse_assembly_method(std::string_view text) {
    if (text == "zip") {
        return AssemblyMethod::Zip;
    }
    if (text == "shuffle") {
        return AssemblyMethod::Shuffle;
    }
    if (text == "concatenate") {
        return AssemblyMethod::Concatenate;
    }
    spdlog::error("Unrecognized assembly method {}", text);
    throw std::invalid_argument("Unrecognized method: " + std::string(text));
}

std::string to_string(AssemblyMethod method) {
    switch (method) {
    case AssemblyMethod::Zip:
        return "zip";
    case AssemblyMethod::Shuffle:
        return "shuffle";
    case AssemblyMethod::Concatenate:
        return "concatenate";
    }
    throw std::invalid_argument("Unrecognized method: " + std::to_string(static_cast<int>(method)));
}

std::array<std::array<double, 2>, 2> bivariate_covariance_matrix(double rho, bool square_root) {
    corr_map::validate(rho);

    if (square_root) {
        return {{{1.0, 0.0}, {rho, std::sqrt(1.0 - rho * rho)}}};
    }
    return {{{1.0, rho}, {rho, 1.0}}};
}

PairingEngine::PairingEngine(double raw_correlation, const Seed &seed)
    : raw_correlation_(raw_correlation), engine_(seed.make_engine()), normal_(0.0, 1.0) {
    corr_map::validate(raw_correlation);
}

double PairingEngine::next_raw_normal() {
    /* use the second member of the previous pair if available */
    if (have_) {
        have_ = false;
        return hold_;
    }

    auto [x, z] = draw_pair();
    hold_ = z;
    have_ = true;
    return x;
}

void PairingEngine::set_seed(const Seed &seed) {
    spdlog::debug("Reseeding pairing engine{}", have_ ? ", discarding held value" : "");

    engine_ = seed.make_engine();
    /* std::normal_distribution may cache a value generated from the old engine */
    normal_ = std::normal_distribution<double>(0.0, 1.0);
    have_ = false;
}

void PairingEngine::set_raw_correlation(double rho) {
    corr_map::validate(rho);

    spdlog::debug("Raw correlation {} -> {}", raw_correlation_, rho);
    raw_correlation_ = rho;
    have_ = false;
}

std::array<double, 2> PairingEngine::mixing_weights() const noexcept {
    return {raw_correlation_, std::sqrt(1.0 - raw_correlation_ * raw_correlation_)};
}

std::array<std::array<double, 2>, 2> PairingEngine::raw_covariance_matrix() const {
    return bivariate_covariance_matrix(raw_correlation_);
}

std::array<double, 2> PairingEngine::draw_pair() {
    const double x = normal_(engine_);
    const double y = normal_(engine_);
    const auto [w_x, w_y] = mixing_weights();
    return {x, w_x * x + w_y * y};
}

}; /* namespace pairing */
