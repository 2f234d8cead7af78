#pragma once

#include "beamcalc/beam_config.hpp"
#include "beamcalc/results.hpp"
#include "beamcalc/section_grid.hpp"

#include <Eigen/Dense>

namespace beamcalc {

/**
 * @brief Boundary-condition solve used by the deflection solver
 */
enum class DeflectionMethod {
    ClosedForm,  ///< Direct linear solve for initial rotation and offset (default)
    Shooting     ///< Secant shooting on the initial rotation, probed with rotation_step
};

/**
 * @brief Settings for the deflection solver
 */
struct DeflectionSettings {
    /// Boundary-condition solve
    DeflectionMethod method = DeflectionMethod::ClosedForm;

    /// Shooting convergence tolerance on the support deflection,
    /// relative to max |uncorrected deflection|
    double tolerance = 1e-10;

    /// Maximum number of shots before giving up
    int max_iterations = 50;
};

/**
 * @brief Check that the supports of a simply-supported beam land on distinct samples
 * @param config Validated beam configuration
 * @param grid Sampling grid of the beam
 * @throws BeamcalcException (INVALID_PARAMETER) if both supports snap to the
 *         same sample; cantilevers always pass
 */
void check_support_samples(const BeamConfig& config, const SectionGrid& grid);

/**
 * @brief Integrate a moment diagram into rotation and deflection
 *
 * Euler-Bernoulli small-deflection theory with constant EI:
 *   d(theta)/dx = M / EI,   dw/dx = theta
 *
 * The uncorrected rotation0/deflection0 are obtained by cumulative
 * trapezoidal integration from x = 0 with theta0 = 0 and w0 = 0. Since the
 * integration is linear in the start values,
 *   theta(x) = rotation0(x) + theta0
 *   w(x)     = deflection0(x) + theta0 * x + c
 * and theta0, c are chosen to satisfy the boundary conditions:
 * - Simply-supported: w = 0 at the samples nearest both supports
 * - Cantilever: w = 0 and theta = 0 at the fixed end
 *
 * Usage:
 *   DeflectionSolver solver(config, grid);
 *   DeflectionResult r = solver.solve(shear_moment.moment);
 */
class DeflectionSolver {
public:
    /**
     * @brief Construct a solver
     * @param config Beam configuration (EI, supports, rotation_step)
     * @param grid Sampling grid of the beam
     * @param settings Solver settings
     * @throws BeamcalcException (INVALID_PARAMETER) if the supports snap to
     *         the same sample
     */
    DeflectionSolver(const BeamConfig& config, const SectionGrid& grid,
                     const DeflectionSettings& settings = DeflectionSettings{});

    /**
     * @brief Solve rotation and deflection for a moment diagram
     * @param moment Moment at each grid sample
     * @return Rotation, deflection and extrema
     * @throws BeamcalcException (PRECONDITION_NOT_MET) if the moment array
     *         does not match the grid, (SOLVER_CONVERGENCE_FAILED) if shooting
     *         does not converge
     */
    DeflectionResult solve(const Eigen::VectorXd& moment) const;

    /**
     * @brief Integrate curvature twice from a given initial rotation
     * @param moment Moment at each grid sample
     * @param theta0 Rotation at x = 0
     * @param rotation Output rotation array
     * @param deflection Output deflection array (zero at x = 0)
     */
    void integrate(const Eigen::VectorXd& moment, double theta0,
                   Eigen::VectorXd& rotation, Eigen::VectorXd& deflection) const;

    /// Sample index of the left support (the fixed end for cantilevers)
    int left_index() const { return left_index_; }

    /// Sample index of the right support (the fixed end for cantilevers)
    int right_index() const { return right_index_; }

    const DeflectionSettings& settings() const { return settings_; }

private:
    BeamConfig config_;
    SectionGrid grid_;
    DeflectionSettings settings_;
    int left_index_;
    int right_index_;

    void solve_closed_form(const Eigen::VectorXd& rotation0,
                           const Eigen::VectorXd& deflection0,
                           DeflectionResult& result) const;

    void solve_shooting(const Eigen::VectorXd& moment,
                        const Eigen::VectorXd& deflection0,
                        DeflectionResult& result) const;
};

} // namespace beamcalc
