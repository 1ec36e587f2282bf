/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "antithetic/seed.hpp"

/**
 * @brief Generation of pair-correlated standard normal streams.
 */
namespace pairing {

/**
 * @brief Procedure for arranging the two paired subsequences of a batch.
 */
enum class AssemblyMethod {
    Zip,         /* Each value is adjacent to the other member of its pair. */
    Shuffle,     /* Randomly permuted. */
    Concatenate, /* All first members, then all second members. */
};

/**
 * @brief Parse an assembly method from its textual form ("zip", "shuffle", "concatenate").
 *
 * @throws std::invalid_argument if the text does not name a method.
 */
AssemblyMethod parse_assembly_method(std::string_view text);

/**
 * @brief Textual form of an assembly method.
 *
 * @throws std::invalid_argument if the value is not a known method.
 */
std::string to_string(AssemblyMethod method);

/**
 * @brief 2x2 covariance matrix of two unit-variance variables with correlation rho.
 *
 * @param rho         Correlation, -1 <= rho <= 1.
 * @param square_root If true, return the lower-triangular factor A with A * A^T equal to the covariance matrix.
 *
 * @throws std::invalid_argument if rho is outside [-1, 1].
 */
std::array<std::array<double, 2>, 2> bivariate_covariance_matrix(double rho, bool square_root = false);

/**
 * @brief Stateful source of standard normal values correlated in consecutive pairs.
 *
 * Values returned by calls 2k and 2k+1 have correlation raw_correlation(); values not forming such a pair are
 * independent. The second member of each pair is held until the next draw. Running
 *
 *     PairingEngine engine(rho, 1);
 *     for (int i = 0; i < 4; ++i) v[i] = engine.next_raw_normal();
 *
 * gives v a covariance matrix of
 *
 *     [[1.0 rho 0.0 0.0]
 *      [rho 1.0 0.0 0.0]
 *      [0.0 0.0 1.0 rho]
 *      [0.0 0.0 rho 1.0]].
 *
 * Not thread-safe; use one engine per thread.
 */
class PairingEngine {
public:
    /**
     * @brief Construct an engine.
     *
     * @param raw_correlation Correlation within pairs, -1 <= raw_correlation <= 1.
     * @param seed            Seed of the pseudo-random source; system entropy by default.
     *
     * @throws std::invalid_argument if raw_correlation is outside [-1, 1].
     */
    explicit PairingEngine(double raw_correlation, const Seed &seed = Seed());

    /**
     * @brief Deleted copy constructor (a copy would replay the same stream).
     */
    PairingEngine(const PairingEngine &) = delete;

    /**
     * @brief Deleted copy assignment operator.
     */
    PairingEngine &operator=(const PairingEngine &) = delete;

    PairingEngine(PairingEngine &&) = default;

    PairingEngine &operator=(PairingEngine &&) = default;

    /**
     * @brief Next value of the correlated standard normal stream.
     */
    double next_raw_normal();

    /**
     * @brief Generate n subsequent values as if calling next_raw_normal() n times.
     *
     * A held value, if any, becomes the first element. When an unpaired slot remains at the end, a fresh pair is
     * drawn, its first member ends the sequence and its second member is held for the next draw. Interior pairs are
     * arranged according to method; with AssemblyMethod::Shuffle and mix_singles == false the unpaired front and back
     * values stay in place while the interior is permuted.
     *
     * @param n           Number of values, n >= 1.
     * @param method      Arrangement of the paired values.
     * @param mix_singles Whether shuffling also moves the unpaired front/back values.
     *
     * @return Sequence of n correlated, marginally standard normal values.
     *
     * @throws std::invalid_argument if n <= 0 or method is not a known method.
     */
    std::vector<double> sequence_raw_normal(int n, AssemblyMethod method = AssemblyMethod::Zip,
                                            bool mix_singles = true);

    /**
     * @brief Replace the pseudo-random source and discard any held value.
     */
    void set_seed(const Seed &seed = Seed());

    /**
     * @brief Change the within-pair correlation and discard any held value.
     *
     * @throws std::invalid_argument if rho is outside [-1, 1]; the engine is left unchanged.
     */
    void set_raw_correlation(double rho);

    /**
     * @brief Discard the held value so the next draw starts a new pair.
     */
    void discard_buffered_value() noexcept { have_ = false; }

    double raw_correlation() const noexcept { return raw_correlation_; }

    bool has_buffered_value() const noexcept { return have_; }

    /**
     * @brief Weights (rho, sqrt(1 - rho^2)).
     *
     * If X, Y are independent standard normal, Z = rho * X + sqrt(1 - rho^2) * Y is standard normal with
     * Corr(X, Z) = rho.
     */
    std::array<double, 2> mixing_weights() const noexcept;

    std::array<std::array<double, 2>, 2> raw_covariance_matrix() const;

private:
    /**
     * @brief Draw a fresh pair (X, Z) from the pseudo-random source.
     */
    std::array<double, 2> draw_pair();

    double raw_correlation_;

    std::mt19937_64 engine_;

    std::normal_distribution<double> normal_;

    bool have_ = false; /* Whether hold_ contains a value not yet returned */
    double hold_ = 0.0; /* Second member of the last generated pair */
};

}; /* namespace pairing */
