/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "antithetic/variate.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include "antithetic/pairing_engine.hpp"
#include "antithetic/parameter_set.hpp"
#include "antithetic/stats.hpp"

constexpr int n_pairs = 200000;

static std::pair<std::vector<double>, std::vector<double>> split_pairs(const std::vector<double> &values) {
    std::vector<double> first;
    std::vector<double> second;
    for (std::size_t i = 0; i + 1 < values.size(); i += 2) {
        first.push_back(values[i]);
        second.push_back(values[i + 1]);
    }
    return {first, second};
}

static variate::InverseCdf linear_family() {
    return variate::InverseCdf{
        .name = "Linear",
        .quantile = [](double u, const variate::ParameterSet &p) { return p.get("a") + (p.get("b") - p.get("a")) * u; },
        .parameters = {{"a", 2.0}, {"b", 5.0}},
    };
}

/**
 * Tests normal variates are an affine transform of the raw normal stream.
 */
TEST(Normal, AffineOfRawStream) {
    variate::Generator generator(-0.5, variate::Normal{.loc = 2.0, .scale = 3.0}, 7);
    pairing::PairingEngine engine(-0.5, 7);

    for (int i = 0; i < 10; ++i) {
        ASSERT_DOUBLE_EQ(3.0 * engine.next_raw_normal() + 2.0, generator.next());
    }
}

TEST(Normal, Moments) {
    variate::Generator generator(0.2, variate::Normal{.loc = -1.0, .scale = 2.0}, 1);

    ASSERT_DOUBLE_EQ(-1.0, generator.mean());
    ASSERT_DOUBLE_EQ(2.0, generator.standard_deviation());
    ASSERT_DOUBLE_EQ(4.0, generator.variance());
    ASSERT_DOUBLE_EQ(0.2, generator.correlation());
    ASSERT_DOUBLE_EQ(0.2, generator.raw_correlation());
}

TEST(Normal, InvalidScale) {
    EXPECT_THROW(({ variate::Generator g(0.0, variate::Normal{.scale = 0.0}, 1); }), std::invalid_argument);
    EXPECT_THROW(({ variate::Generator g(0.0, variate::Normal{.scale = -1.0}, 1); }), std::invalid_argument);
}

TEST(Normal, InvalidCorrelation) {
    EXPECT_THROW(({ variate::Generator g(1.2, variate::Normal{}, 1); }), std::invalid_argument);
}

/**
 * Tests the covariance matrix of four consecutive values over many seeds.
 */
TEST(Normal, FourValueCovariance) {
    constexpr int n_seeds = 20000;
    const double expected[4][4] = {
        {1.0, -0.5, 0.0, 0.0},
        {-0.5, 1.0, 0.0, 0.0},
        {0.0, 0.0, 1.0, -0.5},
        {0.0, 0.0, -0.5, 1.0},
    };

    double sum[4][4] = {};
    for (int seed = 1; seed <= n_seeds; ++seed) {
        variate::Generator generator(-0.5, variate::Normal{.loc = 0.0, .scale = 1.0}, seed);
        std::vector<double> v = generator.sequence(4);
        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                sum[i][j] += v[i] * v[j];
            }
        }
    }

    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
            ASSERT_NEAR(expected[i][j], sum[i][j] / n_seeds, 0.05) << "(" << i << ", " << j << ")";
        }
    }
}

/**
 * Tests the fixed seed scenario is reproducible and matches single draws.
 */
TEST(Normal, FixedSeedSequence) {
    variate::Generator a(-0.5, variate::Normal{.loc = 0.0, .scale = 1.0}, 1);
    variate::Generator b(-0.5, variate::Normal{.loc = 0.0, .scale = 1.0}, 1);

    std::vector<double> values = a.sequence(4);

    ASSERT_EQ(4u, values.size());
    for (double v : values) {
        ASSERT_EQ(v, b.next());
    }
}

TEST(Uniform, Range) {
    variate::Generator generator(-0.8, variate::Uniform{.low = -2.0, .high = 3.0}, 5);

    for (double v : generator.sequence(100001, pairing::AssemblyMethod::Shuffle)) {
        ASSERT_GE(v, -2.0);
        ASSERT_LT(v, 3.0);
    }
    for (int i = 0; i < 1000; ++i) {
        double v = generator.next();
        ASSERT_GE(v, -2.0);
        ASSERT_LT(v, 3.0);
    }
}

/**
 * Tests that paired uniforms have the requested correlation, not the raw one.
 */
TEST(Uniform, PairCorrelation) {
    for (double r : {-0.5, 0.7}) {
        variate::Generator generator(r, variate::Uniform{}, 21);
        auto [first, second] = split_pairs(generator.sequence(2 * n_pairs));

        ASSERT_NEAR(r, generator.correlation(), 1e-12);
        ASSERT_NE(r, generator.raw_correlation());
        ASSERT_NEAR(r, stats::correlation(first, second), 0.01) << "r = " << r;
    }
}

TEST(Uniform, Moments) {
    variate::Generator generator(0.0, variate::Uniform{.low = 1.0, .high = 4.0}, 5);

    ASSERT_DOUBLE_EQ(2.5, generator.mean());
    ASSERT_DOUBLE_EQ(0.75, generator.variance());
    ASSERT_NEAR(std::sqrt(0.75), generator.standard_deviation(), 1e-14);

    stats::RunningStats moments;
    for (double v : generator.sequence(2 * n_pairs)) {
        moments.add(v);
    }
    ASSERT_NEAR(2.5, moments.mean(), 0.01);
    ASSERT_NEAR(0.75, moments.variance(), 0.01);
}

TEST(Uniform, SwappedBounds) {
    variate::Generator generator(0.0, variate::Uniform{.low = 4.0, .high = 1.0}, 5);

    ASSERT_EQ((variate::ParameterSet{{"low", 1.0}, {"high", 4.0}}), generator.parameters());
}

TEST(Uniform, DegenerateBounds) {
    EXPECT_THROW(({ variate::Generator g(0.0, variate::Uniform{.low = 1.0, .high = 1.0}, 1); }),
                 std::invalid_argument);
}

TEST(Exponential, Range) {
    variate::Generator generator(-1.0, variate::Exponential{.loc = 1.5, .scale = 2.0}, 3);

    for (double v : generator.sequence(100001)) {
        ASSERT_GE(v, 1.5);
        ASSERT_TRUE(std::isfinite(v));
    }
}

/**
 * Tests that the correlation applies to the uniforms underlying the exponential values.
 */
TEST(Exponential, UniformLevelCorrelation) {
    variate::Generator generator(-0.6, variate::Exponential{.loc = 1.0, .scale = 0.5}, 8);

    std::vector<double> values = generator.sequence(2 * n_pairs);
    stats::RunningStats moments;
    for (double &v : values) {
        moments.add(v);
        v = 1.0 - std::exp(-(v - 1.0) / 0.5);
    }
    auto [first, second] = split_pairs(values);

    ASSERT_NEAR(-0.6, generator.correlation(), 1e-12);
    ASSERT_NEAR(-0.6, stats::correlation(first, second), 0.01);
    ASSERT_NEAR(1.5, moments.mean(), 0.01);
    ASSERT_NEAR(0.25, moments.variance(), 0.01);
}

TEST(Exponential, RateOverridesScale) {
    variate::Generator generator(0.0, variate::Exponential{.loc = 0.0, .scale = 7.0, .rate = 4.0}, 1);

    ASSERT_DOUBLE_EQ(0.25, generator.standard_deviation());
    ASSERT_DOUBLE_EQ(0.25, generator.mean());
    ASSERT_DOUBLE_EQ(0.0625, generator.variance());

    generator.set_rate(2.0);
    ASSERT_DOUBLE_EQ(0.5, generator.parameters().get("scale"));
}

TEST(Exponential, InvalidParameters) {
    EXPECT_THROW(({ variate::Generator g(0.0, variate::Exponential{.scale = 0.0}, 1); }), std::invalid_argument);
    EXPECT_THROW(({ variate::Generator g(0.0, variate::Exponential{.rate = -1.0}, 1); }), std::invalid_argument);
}

TEST(Exponential, DirectCorrelationUnsupported) {
    variate::Exponential family{.correlation_target = variate::ExponentialCorrelation::Exponential};

    EXPECT_THROW(({ variate::Generator g(0.5, family, 1); }), std::invalid_argument);
}

TEST(InverseCdf, Draws) {
    variate::Generator generator(0.3, linear_family(), 4);

    ASSERT_EQ("Linear", generator.family_name());
    for (int i = 0; i < 1000; ++i) {
        double v = generator.next();
        ASSERT_GE(v, 2.0);
        ASSERT_LT(v, 5.0);
    }
    ASSERT_NEAR(0.3, generator.correlation(), 1e-12);
}

/**
 * Tests quadrature-derived moments against closed forms.
 */
TEST(InverseCdf, Moments) {
    variate::Generator linear(0.0, linear_family(), 4);

    ASSERT_NEAR(3.5, linear.mean(), 1e-9);
    ASSERT_NEAR(0.75, linear.variance(), 1e-9);

    variate::Generator exponential(
        0.0,
        variate::InverseCdf{
            .name = "Rate",
            .quantile = [](double u, const variate::ParameterSet &p) { return -std::log1p(-u) / p.get("rate"); },
            .parameters = {{"rate", 2.0}},
        },
        4);

    ASSERT_NEAR(0.5, exponential.mean(), 1e-6);
    ASSERT_NEAR(0.25, exponential.variance(), 1e-6);
    ASSERT_NEAR(0.5, exponential.standard_deviation(), 1e-6);
}

TEST(InverseCdf, MissingQuantile) {
    EXPECT_THROW(({ variate::Generator g(0.0, variate::InverseCdf{}, 1); }), std::invalid_argument);
}

TEST(InverseCdf, SetParameter) {
    variate::Generator generator(0.0, linear_family(), 4);

    generator.next();
    generator.set_parameter("b", 8.0);

    ASSERT_FALSE(generator.engine().has_buffered_value());
    ASSERT_NEAR(5.0, generator.mean(), 1e-9);
    EXPECT_THROW(generator.set_parameter("c", 1.0), std::invalid_argument);
    EXPECT_THROW(generator.set_loc(1.0), std::invalid_argument);
}

/**
 * Tests that parameter setters discard the held raw value.
 */
TEST(Generator, SettersDiscardHeldValue) {
    variate::Generator normal(0.5, variate::Normal{}, 1);
    normal.next();
    normal.set_loc(3.0);
    ASSERT_FALSE(normal.engine().has_buffered_value());
    ASSERT_DOUBLE_EQ(3.0, normal.mean());

    variate::Generator uniform(0.5, variate::Uniform{}, 1);
    uniform.next();
    uniform.set_high(2.0);
    ASSERT_FALSE(uniform.engine().has_buffered_value());
    ASSERT_DOUBLE_EQ(1.0, uniform.mean());

    variate::Generator exponential(0.5, variate::Exponential{}, 1);
    exponential.next();
    exponential.set_scale(3.0);
    ASSERT_FALSE(exponential.engine().has_buffered_value());
    ASSERT_DOUBLE_EQ(3.0, exponential.standard_deviation());
}

TEST(Generator, SetCorrelation) {
    variate::Generator generator(0.5, variate::Uniform{}, 1);

    generator.next();
    generator.set_correlation(-0.25);

    ASSERT_FALSE(generator.engine().has_buffered_value());
    ASSERT_NEAR(-0.25, generator.correlation(), 1e-12);
}

/**
 * Tests that a rejected setter leaves parameters and the held value unchanged.
 */
TEST(Generator, FailedSetterLeavesState) {
    variate::Generator generator(0.5, variate::Uniform{.low = 0.0, .high = 1.0}, 1);
    generator.next();

    EXPECT_THROW(generator.set_high(0.0), std::invalid_argument);
    EXPECT_THROW(generator.set_scale(2.0), std::invalid_argument);
    EXPECT_THROW(generator.set_correlation(3.0), std::invalid_argument);
    EXPECT_THROW(generator.set_parameter("rate", 1.0), std::invalid_argument);

    ASSERT_TRUE(generator.engine().has_buffered_value());
    ASSERT_EQ((variate::ParameterSet{{"low", 0.0}, {"high", 1.0}}), generator.parameters());
    ASSERT_NEAR(0.5, generator.correlation(), 1e-12);
}

TEST(Generator, SetParameterByName) {
    variate::Generator generator(0.0, variate::Uniform{}, 1);

    generator.set_parameter("low", -1.0);

    ASSERT_DOUBLE_EQ(0.0, generator.mean());
}

TEST(Generator, SetSeedRestartsStream) {
    variate::Generator generator(-0.5, variate::Exponential{}, 1);
    variate::Generator fresh(-0.5, variate::Exponential{}, 99);

    generator.next();
    generator.set_seed(99);

    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(fresh.next(), generator.next());
    }
}

TEST(Generator, Describe) {
    variate::Generator generator(-0.5, variate::Normal{}, 1);

    ASSERT_EQ("Normal(correlation = -0.500000, loc = 0.000000, scale = 1.000000)", generator.describe());
}

TEST(Generator, Move) {
    variate::Generator a(0.1, variate::Normal{}, 1);
    variate::Generator b(0.1, variate::Normal{}, 1);
    a.next();
    b.next();

    variate::Generator moved(std::move(a));

    ASSERT_EQ(b.next(), moved.next());
}
