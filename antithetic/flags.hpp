/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "absl/strings/string_view.h"
#include "spdlog/common.h"

#include "antithetic/pairing_engine.hpp"

/* Command line flag support for custom types; found by argument-dependent lookup from ABSL_FLAG. */

namespace pairing {

/**
 * @brief Parse an assembly method flag ("zip", "shuffle" or "concatenate").
 *
 * @param[in] text    Flag value.
 * @param[out] method Parsed assembly method.
 * @param[out] error  Error message if parsing fails.
 *
 * @returns True if parsing was successful, false otherwise.
 */
bool AbslParseFlag(absl::string_view text, AssemblyMethod *method, std::string *error);

std::string AbslUnparseFlag(AssemblyMethod method);

}; /* namespace pairing */

namespace spdlog::level {

/**
 * @brief Parse a logging verbosity level ("trace", "debug", "info", "warn", "err", "critical", "off").
 *
 * @param[in] text   Flag value.
 * @param[out] level Parsed verbosity level.
 * @param[out] error Error message if parsing fails.
 *
 * @returns True if parsing was successful, false otherwise.
 */
bool AbslParseFlag(absl::string_view text, level_enum *level, std::string *error);

std::string AbslUnparseFlag(level_enum level);

}; /* namespace spdlog::level */
