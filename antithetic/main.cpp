/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "spdlog/spdlog.h"

#include "antithetic/flags.hpp"
#include "antithetic/marginal.hpp"
#include "antithetic/pairing_engine.hpp"
#include "antithetic/stats.hpp"
#include "antithetic/variate.hpp"

/* Define cli args */
ABSL_FLAG(int, num_pairs, 10000, "Number of correlated pairs per distribution");
ABSL_FLAG(double, correlation, -0.5, "Within-pair correlation");
ABSL_FLAG(std::uint64_t, seed, 1, "Seed of the first generator, incremented for each following one");
ABSL_FLAG(pairing::AssemblyMethod, method, pairing::AssemblyMethod::Zip, "Sequence assembly method");
ABSL_FLAG(spdlog::level::level_enum, verbosity, spdlog::level::info, "Logging verbosity");

namespace {

/**
 * @brief Log sample moments and the correlation within and across pairs of a zipped sequence.
 */
void report_moments(const std::vector<double> &seq) {
    stats::RunningStats moments;
    for (double x : seq) {
        moments.add(x);
    }

    std::vector<double> first;
    std::vector<double> second;
    for (std::size_t i = 0; i + 1 < seq.size(); i += 2) {
        first.push_back(seq[i]);
        second.push_back(seq[i + 1]);
    }
    std::span<const double> across_lo(second.data(), second.size() - 1);
    std::span<const double> across_hi(first.data() + 1, first.size() - 1);

    spdlog::info("Sample mean:     {:8.5f}", moments.mean());
    spdlog::info("Sample variance: {:8.5f}", moments.variance());
    spdlog::info("Sample correlation, within pairs: {:8.5f}", stats::correlation(first, second));
    spdlog::info("Sample correlation, across pairs: {:8.5f}", stats::correlation(across_lo, across_hi));
}

void report_normal_histogram(const std::vector<double> &seq) {
    spdlog::info("Partial histogram");
    spdlog::info("  Bin   | Exp. | Obs.");
    spdlog::info("--------+------+-----");
    for (int i = -3; i < 3; ++i) {
        const double prob = marginal::normal_cdf(i + 1) - marginal::normal_cdf(i);
        const auto observed = std::count_if(seq.begin(), seq.end(), [i](double x) { return i < x && x <= i + 1; });
        spdlog::info("{:+d}<X<{:+d} | {:4d} | {:4d}", i, i + 1, static_cast<int>(prob * seq.size()), observed);
    }
}

void report_quadrants(const std::vector<double> &seq, double split) {
    int counts[2][2] = {{0, 0}, {0, 0}};
    for (std::size_t i = 0; i + 1 < seq.size(); i += 2) {
        ++counts[seq[i] > split][seq[i + 1] > split];
    }
    spdlog::info("Quadrant counts within pairs");
    spdlog::info("X1 < {0}, X2 < {0} | {1:4d}", split, counts[0][0]);
    spdlog::info("X1 > {0}, X2 < {0} | {1:4d}", split, counts[1][0]);
    spdlog::info("X1 < {0}, X2 > {0} | {1:4d}", split, counts[0][1]);
    spdlog::info("X1 > {0}, X2 > {0} | {1:4d}", split, counts[1][1]);
}

void run(variate::Generator &generator, int num_pairs, pairing::AssemblyMethod method) {
    spdlog::info("Generating {} pairs: {}", num_pairs, generator.describe());
    spdlog::info("\tmean: {}", generator.mean());
    spdlog::info("\tvariance: {}", generator.variance());

    std::vector<double> seq = generator.sequence(2 * num_pairs, method);

    if (method == pairing::AssemblyMethod::Zip) {
        report_moments(seq);
    } else {
        spdlog::info("Pairs are not adjacent with method {}, skipping correlation report",
                     pairing::to_string(method));
    }

    if (std::holds_alternative<variate::Normal>(generator.family())) {
        report_normal_histogram(seq);
    } else if (method == pairing::AssemblyMethod::Zip) {
        report_quadrants(seq, generator.mean());
    }
}

} /* namespace */

int main(int argc, char *argv[]) {
    absl::ParseCommandLine(argc, argv);

    auto num_pairs = absl::GetFlag(FLAGS_num_pairs);
    auto correlation = absl::GetFlag(FLAGS_correlation);
    auto seed = absl::GetFlag(FLAGS_seed);
    auto method = absl::GetFlag(FLAGS_method);
    auto verbosity = absl::GetFlag(FLAGS_verbosity);

    spdlog::set_level(verbosity);

    spdlog::info("Parameters:");
    spdlog::info("\tnum_pairs: {}", num_pairs);
    spdlog::info("\tcorrelation: {}", correlation);
    spdlog::info("\tseed: {}", seed);
    spdlog::info("\tmethod: {}", pairing::to_string(method));

    if (num_pairs < 2) {
        spdlog::error("num_pairs must be >= 2, got {}", num_pairs);
        return 1;
    }

    try {
        variate::Generator normal(correlation, variate::Normal{.loc = 0.0, .scale = 1.0}, seed);
        variate::Generator uniform(correlation, variate::Uniform{.low = 0.0, .high = 1.0}, seed + 1);
        variate::Generator exponential(correlation, variate::Exponential{.loc = 0.0, .scale = 1.0}, seed + 2);

        run(normal, num_pairs, method);
        run(uniform, num_pairs, method);
        run(exponential, num_pairs, method);
    } catch (const std::invalid_argument &e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    }

    return 0;
}
