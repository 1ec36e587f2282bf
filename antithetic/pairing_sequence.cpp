/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "antithetic/pairing_engine.hpp"

namespace pairing {

std::vector<double> PairingEngine::sequence_raw_normal(int n, AssemblyMethod method, bool mix_singles) {
    if (method != AssemblyMethod::Zip && method != AssemblyMethod::Shuffle && method != AssemblyMethod::Concatenate) {
        spdlog::error("Unrecognized assembly method {}", static_cast<int>(method));
        throw std::invalid_argument("Unrecognized method: " + std::to_string(static_cast<int>(method)));
    }
    if (n <= 0) {
        spdlog::error("Cannot generate {} values", n);
        throw std::invalid_argument("Cannot generate " + std::to_string(n) + " values.");
    }
    if (n == 1) {
        return {next_raw_normal()};
    }

    std::vector<double> values(n);

    /* start with the held value, if available */
    const bool front_single = have_;
    if (front_single) {
        values[0] = hold_;
    }

    /* an odd remainder leaves the last slot unpaired */
    const bool back_single = (n - static_cast<int>(front_single)) % 2 == 1;

    const int first = static_cast<int>(front_single);
    const int n_interior = n - first - static_cast<int>(back_single);
    const int n_pairs = n_interior / 2;

    spdlog::debug("Assembling {} raw normals: front single {}, {} pairs, back single {}, method {}", n, front_single,
                  n_pairs, back_single, to_string(method));

    for (int k = 0; k < n_pairs; ++k) {
        auto [x, z] = draw_pair();
        if (method == AssemblyMethod::Zip) {
            values[first + 2 * k] = x;
            values[first + 2 * k + 1] = z;
        } else {
            values[first + k] = x;
            values[first + n_pairs + k] = z;
        }
    }

    /* the back single starts a new pair whose second member is held for the next draw */
    have_ = back_single;
    if (back_single) {
        auto [x, z] = draw_pair();
        values[n - 1] = x;
        hold_ = z;
    }

    if (method == AssemblyMethod::Shuffle) {
        if (mix_singles) {
            std::shuffle(values.begin(), values.end(), engine_);
        } else {
            std::shuffle(values.begin() + first, values.begin() + first + n_interior, engine_);
        }
    }

    return values;
}

}; /* namespace pairing */
