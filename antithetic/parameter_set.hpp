/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace variate {

/**
 * @brief Ordered set of named distributional parameters.
 *
 * Names are unique; insertion order is preserved.
 */
class ParameterSet {
public:
    using Entry = std::pair<std::string, double>;

    ParameterSet() = default;

    /**
     * @brief Construct from (name, value) entries; a repeated name keeps the last value.
     */
    ParameterSet(std::initializer_list<Entry> entries);

    /**
     * @brief Value of the named parameter.
     *
     * @throws std::out_of_range if no parameter has this name.
     */
    double get(std::string_view name) const;

    /**
     * @brief Set the named parameter, appending it if absent.
     */
    void set(std::string_view name, double value);

    bool contains(std::string_view name) const noexcept;

    std::size_t size() const noexcept { return entries_.size(); }

    bool empty() const noexcept { return entries_.empty(); }

    std::vector<Entry>::const_iterator begin() const noexcept { return entries_.begin(); }

    std::vector<Entry>::const_iterator end() const noexcept { return entries_.end(); }

    bool operator==(const ParameterSet &other) const = default;

private:
    std::vector<Entry> entries_;
};

}; /* namespace variate */
