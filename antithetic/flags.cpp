/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <array>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "fmt/format.h"

#include "antithetic/flags.hpp"
#include "antithetic/pairing_engine.hpp"

namespace pairing {

bool AbslParseFlag(absl::string_view text, AssemblyMethod *method, std::string *error) {
    const std::string_view value(text.data(), text.size());
    for (auto candidate : {AssemblyMethod::Zip, AssemblyMethod::Shuffle, AssemblyMethod::Concatenate}) {
        if (value == to_string(candidate)) {
            *method = candidate;
            return true;
        }
    }
    *error = fmt::format("Invalid assembly method {}, expected zip, shuffle or concatenate", std::string(text));
    return false;
}

std::string AbslUnparseFlag(AssemblyMethod method) { return to_string(method); }

}; /* namespace pairing */

namespace spdlog::level {

namespace {

constexpr std::array<std::pair<std::string_view, level_enum>, 7> level_names{{
    {"trace", trace},
    {"debug", debug},
    {"info", info},
    {"warn", warn},
    {"err", err},
    {"critical", critical},
    {"off", off},
}};

} /* namespace */

bool AbslParseFlag(absl::string_view text, level_enum *level, std::string *error) {
    const std::string_view requested(text.data(), text.size());
    for (const auto &[name, value] : level_names) {
        if (requested == name) {
            *level = value;
            return true;
        }
    }
    *error = fmt::format("Invalid verbosity {}", std::string(text));
    return false;
}

std::string AbslUnparseFlag(level_enum level) {
    for (const auto &[name, value] : level_names) {
        if (level == value) {
            return std::string(name);
        }
    }
    return "unknown";
}

}; /* namespace spdlog::level */
