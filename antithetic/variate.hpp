/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "antithetic/pairing_engine.hpp"
#include "antithetic/parameter_set.hpp"
#include "antithetic/seed.hpp"

/**
 * @brief Common or antithetic random variates with a chosen marginal distribution.
 */
namespace variate {

/**
 * @brief Level at which the correlation of an exponential generator is specified.
 */
enum class ExponentialCorrelation {
    Uniform,     /* Correlation of the underlying uniforms (supported). */
    Exponential, /* Correlation of the exponential values themselves (not supported). */
};

/**
 * @brief Normal marginal with mean loc and standard deviation scale.
 */
struct Normal {
    double loc = 0.0;
    double scale = 1.0;
};

/**
 * @brief Uniform marginal on [low, high). Bounds given in reverse order are swapped.
 */
struct Uniform {
    double low = 0.0;
    double high = 1.0;
};

/**
 * @brief Shifted exponential marginal, loc + Exp(1 / scale).
 *
 * A rate, if present, overrides the scale with 1 / rate.
 */
struct Exponential {
    double loc = 0.0;
    double scale = 1.0;
    std::optional<double> rate;
    ExponentialCorrelation correlation_target = ExponentialCorrelation::Uniform;
};

/**
 * @brief Quantile function of a user-defined family, evaluated at a uniform value in (0, 1).
 *
 * Receives every current parameter of the family and may ignore any of them.
 */
using Quantile = std::function<double(double u, const ParameterSet &parameters)>;

/**
 * @brief Arbitrary marginal defined by its quantile (inverse CDF) function.
 *
 * The correlation is specified at the level of the underlying uniforms.
 */
struct InverseCdf {
    std::string name = "InverseCdf";
    Quantile quantile;
    ParameterSet parameters;
};

using Family = std::variant<Normal, Uniform, Exponential, InverseCdf>;

/**
 * @brief Generator of pair-correlated variates with the marginal distribution of a family.
 *
 * Composes a pairing engine, which produces the correlated raw normal stream, with the marginal transform of the
 * family. Setters validate their argument, leave the generator unchanged on failure, and discard the value held by
 * the pairing engine on success.
 */
class Generator {
public:
    /**
     * @brief Construct a generator.
     *
     * @param correlation Correlation of paired values, expressed at the level of the family (see correlation()).
     * @param family      Marginal distribution and its parameters.
     * @param seed        Seed of the pseudo-random source; system entropy by default.
     *
     * @throws std::invalid_argument if the correlation is outside [-1, 1] or the parameters are invalid.
     */
    Generator(double correlation, Family family, const pairing::Seed &seed = pairing::Seed());

    /**
     * @brief Next correlated variate.
     */
    double next();

    /**
     * @brief Generate n subsequent variates, see pairing::PairingEngine::sequence_raw_normal.
     *
     * @throws std::invalid_argument if n <= 0 or method is not a known method.
     */
    std::vector<double> sequence(int n, pairing::AssemblyMethod method = pairing::AssemblyMethod::Zip,
                                 bool mix_singles = true);

    /**
     * @brief Replace the pseudo-random source and discard any held value.
     */
    void set_seed(const pairing::Seed &seed = pairing::Seed());

    double mean() const;

    double standard_deviation() const;

    double variance() const;

    /**
     * @brief Correlation of paired variates.
     *
     * Normal: the raw correlation. Uniform, Exponential and InverseCdf: the correlation of the underlying uniforms.
     */
    double correlation() const;

    double raw_correlation() const noexcept { return engine_.raw_correlation(); }

    /**
     * @brief Change the correlation of paired variates.
     *
     * @throws std::invalid_argument if the correlation is outside [-1, 1].
     */
    void set_correlation(double correlation);

    /**
     * @brief Set the location of a Normal or Exponential family.
     */
    void set_loc(double loc);

    /**
     * @brief Set the scale of a Normal or Exponential family, scale > 0.
     */
    void set_scale(double scale);

    /**
     * @brief Set the rate of an Exponential family, rate > 0. Equivalent to set_scale(1 / rate).
     */
    void set_rate(double rate);

    /**
     * @brief Set the lower bound of a Uniform family.
     */
    void set_low(double low);

    /**
     * @brief Set the upper bound of a Uniform family.
     */
    void set_high(double high);

    /**
     * @brief Set a parameter by name.
     *
     * For InverseCdf families, the parameter must already be defined. For the other families the name selects the
     * typed setter ("loc", "scale", "rate", "low", "high").
     *
     * @throws std::invalid_argument if the family has no parameter with this name, or the value is invalid.
     */
    void set_parameter(std::string_view name, double value);

    /**
     * @brief Current distributional parameters in declaration order.
     */
    ParameterSet parameters() const;

    std::string family_name() const;

    /**
     * @brief One line description, e.g. "Normal(correlation = -0.500000, loc = 0.000000, scale = 1.000000)".
     */
    std::string describe() const;

    const Family &family() const noexcept { return family_; }

    const pairing::PairingEngine &engine() const noexcept { return engine_; }

private:
    /**
     * @brief Replace the family parameters after validation and discard the held raw value.
     */
    void commit(Family family);

    /**
     * @brief Marginal transform of a raw normal value.
     */
    double transform(double raw) const;

    Family family_;

    pairing::PairingEngine engine_;
};

}; /* namespace variate */
