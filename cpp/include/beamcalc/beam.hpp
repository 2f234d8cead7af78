#pragma once

#include "beamcalc/beam_config.hpp"
#include "beamcalc/deflection_solver.hpp"
#include "beamcalc/load.hpp"
#include "beamcalc/load_combination.hpp"
#include "beamcalc/results.hpp"
#include "beamcalc/section_grid.hpp"
#include "beamcalc/shear_moment.hpp"
#include "beamcalc/warnings.hpp"

#include <vector>

namespace beamcalc {

/**
 * @brief Top-level Beam class for shear, moment and deflection analysis
 *
 * The Beam owns the configuration and the ordered load list, and runs the
 * analysis workflow on demand:
 *
 * 1. Beam definition (geometry, supports, EI, section count)
 * 2. Loads (point shear/moment loads and distributed loads)
 * 3. Analysis (shear/moment, deflection, load combinations)
 *
 * Every calculation recomputes from the current loads; nothing is cached.
 *
 * Usage:
 *   Beam beam(BeamConfig::make_simply_supported(20.0, 29e6 * 510.0));
 *   beam.add_load(PointLoad(10.0, -1000.0, PointLoadKind::Shear, LoadType::Dead));
 *   beam.add_load(DistLoad(0.0, 20.0, -50.0, -50.0, LoadType::Live));
 *   ShearMomentResult sm = beam.calculate_shear_moment();
 *   DeflectionResult d = beam.calculate_deflection();
 *   CriticalCombinations cc = beam.find_critical_combinations();
 */
class Beam {
public:
    /**
     * @brief Construct a beam from a configuration
     * @throws BeamcalcException (INVALID_PARAMETER) if the configuration is
     *         invalid or the supports fall on the same section sample
     */
    explicit Beam(const BeamConfig& config);

    /**
     * @brief Construct a beam from individual parameters
     * @param length Beam length L
     * @param left_support Left support location (fixed end for cantilevers)
     * @param right_support Right support location (fixed end for cantilevers)
     * @param cantilever Cantilever or simply-supported
     * @param EI Flexural rigidity
     * @param method Load combination table
     * @param sections Number of integration sections
     * @param rotation_step Shooting probe step
     */
    Beam(double length, double left_support, double right_support, bool cantilever,
         double EI, AnalysisMethod method = AnalysisMethod::LRFD,
         int sections = 1000, double rotation_step = 1e-4);

    /**
     * @brief Append a load
     * @throws BeamcalcException (LOAD_OUT_OF_BOUNDS) if any location lies
     *         outside [0, L]; the load list is left unchanged
     */
    void add_load(const Load& load);

    const std::vector<Load>& loads() const { return loads_; }

    void clear_loads() { loads_.clear(); }

    const BeamConfig& config() const { return config_; }
    const SectionGrid& grid() const { return grid_; }

    DeflectionSettings& deflection_settings() { return deflection_settings_; }
    const DeflectionSettings& deflection_settings() const { return deflection_settings_; }

    /**
     * @brief Shear and moment diagrams for the current loads
     */
    ShearMomentResult calculate_shear_moment() const;

    /**
     * @brief Rotation and deflection for the current loads
     *
     * Runs the shear/moment calculation first.
     *
     * @throws BeamcalcException (SOLVER_CONVERGENCE_FAILED) if shooting
     *         does not converge
     */
    DeflectionResult calculate_deflection() const;

    /**
     * @brief Governing shear/moment over the applicable load combinations
     * @throws BeamcalcException (PRECONDITION_NOT_MET) if no load carries a
     *         load type
     */
    CriticalCombinations find_critical_combinations() const;

    /**
     * @brief Check the beam for questionable but legal configurations
     *
     * Each warning is also logged.
     */
    WarningList check() const;

    /**
     * @brief Check a deflection result against span / 240
     */
    WarningList check_deflection(const DeflectionResult& result) const;

private:
    BeamConfig config_;
    SectionGrid grid_;
    ShearMomentComputer shear_moment_;
    DeflectionSettings deflection_settings_;
    std::vector<Load> loads_;

    static BeamConfig make_config(double length, double left_support, double right_support,
                                  bool cantilever, double EI, AnalysisMethod method,
                                  int sections, double rotation_step);
};

} // namespace beamcalc
