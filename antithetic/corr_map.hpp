/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * @brief Mapping between the correlation of a marginal distribution and the correlation of the underlying normals.
 *
 * References:
 *   Cario, M. C.; Nelson, B. L. Modeling and Generating Random Vectors with Arbitrary Marginal Distributions and
 *   Correlation Matrix (1997).
 */
namespace corr_map {

/**
 * @brief Check that a correlation lies in [-1, 1].
 *
 * @throws std::invalid_argument otherwise (NaN included).
 */
void validate(double correlation);

/**
 * @brief Raw correlation for a normal marginal (identity).
 */
double normal_raw_from_public(double correlation);

/**
 * @brief Public correlation of a normal marginal (identity).
 */
double normal_public_from_raw(double raw_correlation);

/**
 * @brief Correlation of normals which, transformed by the normal CDF, yields uniforms with the given correlation.
 *
 * raw = 2 * sin(pi * correlation / 6).
 *
 * @throws std::invalid_argument if correlation is outside [-1, 1].
 */
double uniform_raw_from_public(double correlation);

/**
 * @brief Correlation of uniforms obtained from normals with the given correlation.
 *
 * correlation = (6 / pi) * asin(raw / 2).
 */
double uniform_public_from_raw(double raw_correlation);

}; /* namespace corr_map */
