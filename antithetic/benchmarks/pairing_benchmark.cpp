/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "antithetic/pairing_engine.hpp"
#include "antithetic/variate.hpp"

#include <benchmark/benchmark.h>

#include <vector>

constexpr double rho = -0.5;

static void BM_SequentialNextRawNormal(benchmark::State &state) {
    pairing::PairingEngine engine(rho, 123);
    const int n = static_cast<int>(state.range(0));

    for (auto _ : state) {
        for (int i = 0; i < n; ++i) {
            double x = engine.next_raw_normal();
            benchmark::DoNotOptimize(x);
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
}

static void BM_SequenceRawNormal(benchmark::State &state, pairing::AssemblyMethod method) {
    pairing::PairingEngine engine(rho, 123);
    const int n = static_cast<int>(state.range(0));

    for (auto _ : state) {
        std::vector<double> values = engine.sequence_raw_normal(n, method);
        benchmark::DoNotOptimize(values.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * n);
}

static void BM_UniformSequence(benchmark::State &state) {
    variate::Generator generator(rho, variate::Uniform{}, 123);
    const int n = static_cast<int>(state.range(0));

    for (auto _ : state) {
        std::vector<double> values = generator.sequence(n);
        benchmark::DoNotOptimize(values.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * n);
}

BENCHMARK(BM_SequentialNextRawNormal)->Range(8, 1 << 16);
BENCHMARK_CAPTURE(BM_SequenceRawNormal, zip, pairing::AssemblyMethod::Zip)->Range(8, 1 << 16);
BENCHMARK_CAPTURE(BM_SequenceRawNormal, concatenate, pairing::AssemblyMethod::Concatenate)->Range(8, 1 << 16);
BENCHMARK_CAPTURE(BM_SequenceRawNormal, shuffle, pairing::AssemblyMethod::Shuffle)->Range(8, 1 << 16);
BENCHMARK(BM_UniformSequence)->Range(8, 1 << 16);

BENCHMARK_MAIN();
