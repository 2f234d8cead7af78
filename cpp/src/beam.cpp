#include "beamcalc/beam.hpp"
#include "beamcalc/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace beamcalc {

Beam::Beam(const BeamConfig& config)
    : config_(config),
      grid_(config.length, config.sections),
      shear_moment_(config, grid_)
{
    check_support_samples(config_, grid_);

    spdlog::debug("Beam created: L={:.6g}, supports=({:.6g}, {:.6g}), {}, {} sections",
                  config_.length, config_.left_support, config_.right_support,
                  config_.cantilever ? "cantilever" : "simply-supported",
                  config_.sections);
}

Beam::Beam(double length, double left_support, double right_support, bool cantilever,
           double EI, AnalysisMethod method, int sections, double rotation_step)
    : Beam(make_config(length, left_support, right_support, cantilever, EI, method,
                       sections, rotation_step))
{
}

BeamConfig Beam::make_config(double length, double left_support, double right_support,
                             bool cantilever, double EI, AnalysisMethod method,
                             int sections, double rotation_step) {
    BeamConfig config;
    config.length = length;
    config.left_support = left_support;
    config.right_support = right_support;
    config.cantilever = cantilever;
    config.EI = EI;
    config.method = method;
    config.sections = sections;
    config.rotation_step = rotation_step;
    return config;
}

void Beam::add_load(const Load& load) {
    check_bounds(load, config_.length);
    loads_.push_back(load);
}

// =============================================================================
// Analysis
// =============================================================================

ShearMomentResult Beam::calculate_shear_moment() const {
    return shear_moment_.compute(loads_);
}

DeflectionResult Beam::calculate_deflection() const {
    ShearMomentResult sm = calculate_shear_moment();
    DeflectionSolver solver(config_, grid_, deflection_settings_);
    return solver.solve(sm.moment);
}

CriticalCombinations Beam::find_critical_combinations() const {
    CombinationEvaluator evaluator(shear_moment_, config_.method);
    return evaluator.evaluate(loads_);
}

// =============================================================================
// Diagnostics
// =============================================================================

WarningList Beam::check() const {
    WarningList result;

    if (config_.sections < 100) {
        result.add(BeamcalcWarning::coarse_discretization(config_.sections));
    }

    if (config_.cantilever) {
        if (!grid_.is_on_grid(config_.left_support)) {
            result.add(BeamcalcWarning::support_off_grid(
                "fixed", config_.left_support,
                grid_.x(grid_.nearest_index(config_.left_support))));
        }
    } else {
        if (!grid_.is_on_grid(config_.left_support)) {
            result.add(BeamcalcWarning::support_off_grid(
                "left", config_.left_support,
                grid_.x(grid_.nearest_index(config_.left_support))));
        }
        if (!grid_.is_on_grid(config_.right_support)) {
            result.add(BeamcalcWarning::support_off_grid(
                "right", config_.right_support,
                grid_.x(grid_.nearest_index(config_.right_support))));
        }
    }

    if (loads_.empty()) {
        result.add(BeamcalcWarning::no_loads());
    }

    std::vector<int> untagged;
    for (size_t i = 0; i < loads_.size(); ++i) {
        int idx = static_cast<int>(i);
        if (load_type(loads_[i]) == LoadType::None) {
            untagged.push_back(idx);
        }
        if (const auto* p = std::get_if<PointLoad>(&loads_[i])) {
            if (!grid_.is_on_grid(p->location)) {
                result.add(BeamcalcWarning::load_off_grid(idx, p->location));
            }
        }
    }
    if (!untagged.empty()) {
        result.add(BeamcalcWarning::untagged_loads(untagged));
    }

    for (const auto& w : result.warnings) {
        spdlog::warn("{}", w.to_string());
    }
    return result;
}

WarningList Beam::check_deflection(const DeflectionResult& result) const {
    WarningList warnings;

    double peak = std::max(std::abs(result.max_deflection.value),
                           std::abs(result.min_deflection.value));
    if (peak > config_.length / 240.0) {
        warnings.add(BeamcalcWarning::large_deflection(peak, config_.length));
        spdlog::warn("{}", warnings.warnings.back().to_string());
    }
    return warnings;
}

} // namespace beamcalc
