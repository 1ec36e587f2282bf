/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

#include "spdlog/spdlog.h"

#include "antithetic/parameter_set.hpp"

namespace variate {

ParameterSet::ParameterSet(std::initializer_list<Entry> entries) {
    for (const auto &[name, value] : entries) {
        set(name, value);
    }
}

double ParameterSet::get(std::string_view name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &e) { return e.first == name; });
    if (it == entries_.end()) {
        spdlog::error("Unknown distributional parameter {}", name);
        throw std::out_of_range("Unknown parameter: " + std::string(name));
    }
    return it->second;
}

void ParameterSet::set(std::string_view name, double value) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &e) { return e.first == name; });
    if (it == entries_.end()) {
        entries_.emplace_back(std::string(name), value);
    } else {
        it->second = value;
    }
}

bool ParameterSet::contains(std::string_view name) const noexcept {
    return std::any_of(entries_.begin(), entries_.end(), [&](const Entry &e) { return e.first == name; });
}

}; /* namespace variate */
