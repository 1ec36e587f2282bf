/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include "antithetic/consts.hpp"
#include "antithetic/corr_map.hpp"
#include "antithetic/integration.hpp"
#include "antithetic/marginal.hpp"
#include "antithetic/pairing_engine.hpp"
#include "antithetic/variate.hpp"

namespace variate {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::invalid_argument invalid(const std::string &message) {
    spdlog::error("{}", message);
    return std::invalid_argument(message);
}

void check_scale(double scale) {
    if (!(scale > 0.0)) {
        throw invalid(fmt::format("Invalid scale parameter: {}", scale));
    }
}

/**
 * @brief Validate family parameters and bring them to canonical form (ordered bounds, rate folded into scale).
 */
Family normalize(Family family) {
    std::visit(overloaded{
                   [](Normal &f) { check_scale(f.scale); },
                   [](Uniform &f) {
                       if (f.low == f.high) {
                           throw invalid(fmt::format("Degenerate distribution: low == high == {}", f.low));
                       }
                       if (f.low > f.high) {
                           std::swap(f.low, f.high);
                       }
                   },
                   [](Exponential &f) {
                       if (f.correlation_target == ExponentialCorrelation::Exponential) {
                           throw invalid("Exponential-level correlation is not supported, specify the correlation of "
                                         "the underlying uniforms");
                       }
                       if (f.rate) {
                           if (!(*f.rate > 0.0)) {
                               throw invalid(fmt::format("Invalid rate parameter: {}", *f.rate));
                           }
                           f.scale = 1.0 / *f.rate;
                           f.rate.reset();
                       }
                       check_scale(f.scale);
                   },
                   [](InverseCdf &f) {
                       if (!f.quantile) {
                           throw invalid(fmt::format("No quantile function given for {}", f.name));
                       }
                   },
               },
               family);
    return family;
}

double raw_from_public(const Family &family, double correlation) {
    if (std::holds_alternative<Normal>(family)) {
        return corr_map::normal_raw_from_public(correlation);
    }
    return corr_map::uniform_raw_from_public(correlation);
}

double integrate_unit(const std::function<double(double)> &f) {
    return integration::gauss_kronrod_15(f, 0.0, 1.0, consts::moment_eps_abs, consts::moment_eps_rel,
                                         consts::moment_max_intervals);
}

double quantile_mean(const InverseCdf &f) {
    return integrate_unit([&](double u) { return f.quantile(u, f.parameters); });
}

double quantile_variance(const InverseCdf &f) {
    const double mean = quantile_mean(f);
    return integrate_unit([&](double u) {
        const double d = f.quantile(u, f.parameters) - mean;
        return d * d;
    });
}

} /* namespace */

Generator::Generator(double correlation, Family family, const pairing::Seed &seed)
    : family_(normalize(std::move(family))), engine_(raw_from_public(family_, correlation), seed) {
    spdlog::debug("Created {}", describe());
}

double Generator::next() { return transform(engine_.next_raw_normal()); }

std::vector<double> Generator::sequence(int n, pairing::AssemblyMethod method, bool mix_singles) {
    std::vector<double> values = engine_.sequence_raw_normal(n, method, mix_singles);
    std::transform(values.begin(), values.end(), values.begin(), [this](double raw) { return transform(raw); });
    return values;
}

void Generator::set_seed(const pairing::Seed &seed) { engine_.set_seed(seed); }

double Generator::mean() const {
    return std::visit(overloaded{
                          [](const Normal &f) { return f.loc; },
                          [](const Uniform &f) { return 0.5 * (f.low + f.high); },
                          [](const Exponential &f) { return f.loc + f.scale; },
                          [](const InverseCdf &f) { return quantile_mean(f); },
                      },
                      family_);
}

double Generator::standard_deviation() const {
    return std::visit(overloaded{
                          [](const Normal &f) { return f.scale; },
                          [](const Uniform &f) { return consts::inv_sqrt_12 * (f.high - f.low); },
                          [](const Exponential &f) { return f.scale; },
                          [](const InverseCdf &f) { return std::sqrt(quantile_variance(f)); },
                      },
                      family_);
}

double Generator::variance() const {
    return std::visit(overloaded{
                          [](const Normal &f) { return f.scale * f.scale; },
                          [](const Uniform &f) { return consts::inv_12 * (f.high - f.low) * (f.high - f.low); },
                          [](const Exponential &f) { return f.scale * f.scale; },
                          [](const InverseCdf &f) { return quantile_variance(f); },
                      },
                      family_);
}

double Generator::correlation() const {
    if (std::holds_alternative<Normal>(family_)) {
        return corr_map::normal_public_from_raw(engine_.raw_correlation());
    }
    return corr_map::uniform_public_from_raw(engine_.raw_correlation());
}

void Generator::set_correlation(double correlation) {
    engine_.set_raw_correlation(raw_from_public(family_, correlation));
}

void Generator::set_loc(double loc) {
    Family updated = family_;
    if (auto *normal = std::get_if<Normal>(&updated)) {
        normal->loc = loc;
    } else if (auto *exponential = std::get_if<Exponential>(&updated)) {
        exponential->loc = loc;
    } else {
        throw invalid(fmt::format("{} has no parameter loc", family_name()));
    }
    commit(std::move(updated));
}

void Generator::set_scale(double scale) {
    Family updated = family_;
    if (auto *normal = std::get_if<Normal>(&updated)) {
        normal->scale = scale;
    } else if (auto *exponential = std::get_if<Exponential>(&updated)) {
        exponential->scale = scale;
    } else {
        throw invalid(fmt::format("{} has no parameter scale", family_name()));
    }
    commit(std::move(updated));
}

void Generator::set_rate(double rate) {
    Family updated = family_;
    if (auto *f = std::get_if<Exponential>(&updated)) {
        f->rate = rate;
    } else {
        throw invalid(fmt::format("{} has no parameter rate", family_name()));
    }
    commit(std::move(updated));
}

void Generator::set_low(double low) {
    Family updated = family_;
    if (auto *f = std::get_if<Uniform>(&updated)) {
        f->low = low;
    } else {
        throw invalid(fmt::format("{} has no parameter low", family_name()));
    }
    commit(std::move(updated));
}

void Generator::set_high(double high) {
    Family updated = family_;
    if (auto *f = std::get_if<Uniform>(&updated)) {
        f->high = high;
    } else {
        throw invalid(fmt::format("{} has no parameter high", family_name()));
    }
    commit(std::move(updated));
}

void Generator::set_parameter(std::string_view name, double value) {
    if (auto *f = std::get_if<InverseCdf>(&family_)) {
        if (!f->parameters.contains(name)) {
            throw invalid(fmt::format("{} has no parameter {}", family_name(), name));
        }
        Family updated = family_;
        std::get<InverseCdf>(updated).parameters.set(name, value);
        commit(std::move(updated));
        return;
    }

    if (name == "loc") {
        set_loc(value);
    } else if (name == "scale") {
        set_scale(value);
    } else if (name == "rate") {
        set_rate(value);
    } else if (name == "low") {
        set_low(value);
    } else if (name == "high") {
        set_high(value);
    } else {
        throw invalid(fmt::format("{} has no parameter {}", family_name(), name));
    }
}

ParameterSet Generator::parameters() const {
    return std::visit(overloaded{
                          [](const Normal &f) { return ParameterSet{{"loc", f.loc}, {"scale", f.scale}}; },
                          [](const Uniform &f) { return ParameterSet{{"low", f.low}, {"high", f.high}}; },
                          [](const Exponential &f) { return ParameterSet{{"loc", f.loc}, {"scale", f.scale}}; },
                          [](const InverseCdf &f) { return f.parameters; },
                      },
                      family_);
}

std::string Generator::family_name() const {
    return std::visit(overloaded{
                          [](const Normal &) { return std::string("Normal"); },
                          [](const Uniform &) { return std::string("Uniform"); },
                          [](const Exponential &) { return std::string("Exponential"); },
                          [](const InverseCdf &f) { return f.name; },
                      },
                      family_);
}

std::string Generator::describe() const {
    std::string text = fmt::format("{}(correlation = {:f}", family_name(), correlation());
    for (const auto &[name, value] : parameters()) {
        text += fmt::format(", {} = {:f}", name, value);
    }
    return text + ")";
}

void Generator::commit(Family family) {
    family_ = normalize(std::move(family));
    engine_.discard_buffered_value();
    spdlog::debug("Parameters changed: {}", describe());
}

double Generator::transform(double raw) const {
    return std::visit(overloaded{
                          [raw](const Normal &f) { return marginal::affine(raw, f.loc, f.scale); },
                          [raw](const Uniform &f) {
                              return marginal::uniform_quantile(marginal::uniform_from_normal(raw), f.low, f.high);
                          },
                          [raw](const Exponential &f) {
                              return marginal::exponential_quantile(marginal::uniform_from_normal(raw), f.loc,
                                                                    f.scale);
                          },
                          [raw](const InverseCdf &f) {
                              return f.quantile(marginal::uniform_from_normal(raw), f.parameters);
                          },
                      },
                      family_);
}

}; /* namespace variate */
