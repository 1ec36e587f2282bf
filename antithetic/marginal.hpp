/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * @brief Deterministic transforms from raw standard normal values to marginal distributions.
 */
namespace marginal {

/**
 * @brief Standard normal cumulative distribution function.
 */
double normal_cdf(double x);

/**
 * @brief Affine rescaling, scale * x + loc.
 */
double affine(double x, double loc, double scale);

/**
 * @brief Uniform value in [0, 1) obtained from a standard normal value through the normal CDF.
 *
 * The result is clamped below 1 so that downstream quantiles stay finite.
 */
double uniform_from_normal(double x);

/**
 * @brief Quantile of the uniform distribution on [low, high).
 *
 * @param u    Uniform value in [0, 1).
 * @param low  Lower bound.
 * @param high Upper bound.
 */
double uniform_quantile(double u, double low, double high);

/**
 * @brief Quantile of the shifted exponential distribution, loc - scale * ln(1 - u).
 *
 * @param u     Uniform value in [0, 1).
 * @param loc   Location (minimum value).
 * @param scale Scale (mean of loc-shifted variable), scale > 0.
 */
double exponential_quantile(double u, double loc, double scale);

}; /* namespace marginal */
