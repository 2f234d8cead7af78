#pragma once

#include "beamcalc/beam_config.hpp"
#include "beamcalc/load.hpp"
#include "beamcalc/results.hpp"
#include "beamcalc/section_grid.hpp"

#include <Eigen/Dense>
#include <vector>

namespace beamcalc {

/**
 * @brief Compute shear and moment diagrams from a load set
 *
 * Equilibrium approach:
 *   1. Superpose the unreacted contribution of every load (in list order)
 *   2. Take the totals at the free end x_N: F = V_raw(L), M = M_raw(L)
 *   3. Solve the support reactions from the two equilibrium equations
 *        simply-supported:  F + Rl + Rr = 0
 *                           M + Rl (L - dl) + Rr (L - dr) = 0
 *        cantilever:        R = -F,  Mr = -(M + R (L - xf))
 *   4. Add each reaction as a point load at its support
 *
 * Using the integrated totals (rather than closed-form resultants) keeps the
 * diagrams closed to round-off: shear and moment vanish at x_N.
 *
 * A cantilever fixed at x = L is the exception. Its reaction is reported in
 * ShearMomentResult::reactions only, and x_N carries the fixed-end shear and
 * moment, mirroring a cantilever fixed at x = 0.
 */
class ShearMomentComputer {
public:
    /**
     * @brief Construct a computer for a validated beam configuration
     * @param config Beam geometry and supports
     * @param grid Sampling grid of the beam
     */
    ShearMomentComputer(const BeamConfig& config, const SectionGrid& grid);

    /**
     * @brief Compute reacted shear and moment for a load set
     * @param loads Loads in application order
     * @return Diagrams, reactions and extrema
     */
    ShearMomentResult compute(const std::vector<Load>& loads) const;

    /**
     * @brief Superpose unreacted load contributions
     * @param loads Loads in application order
     * @param shear Output shear array (resized to grid size)
     * @param moment Output moment array (resized to grid size)
     */
    void accumulate_loads(const std::vector<Load>& loads,
                          Eigen::VectorXd& shear, Eigen::VectorXd& moment) const;

    /**
     * @brief Solve support reactions from unreacted end totals
     * @param total_force Unreacted shear at x = L
     * @param total_moment Unreacted moment at x = L
     * @return Reactions, left support first
     */
    std::vector<Reaction> resolve_reactions(double total_force, double total_moment) const;

private:
    BeamConfig config_;
    SectionGrid grid_;
};

} // namespace beamcalc
