#include "beamcalc/deflection_solver.hpp"
#include "beamcalc/errors.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <string>

namespace beamcalc {

void check_support_samples(const BeamConfig& config, const SectionGrid& grid) {
    if (config.cantilever) return;

    if (grid.nearest_index(config.left_support) == grid.nearest_index(config.right_support)) {
        BeamcalcError err = BeamcalcError::invalid_parameter(
            "right_support", config.right_support,
            "at least one section width away from left_support");
        err.details["section_width"] = std::to_string(grid.spacing());
        err.suggestion = "Increase the number of sections.";
        throw BeamcalcException(err);
    }
}

DeflectionSolver::DeflectionSolver(const BeamConfig& config, const SectionGrid& grid,
                                   const DeflectionSettings& settings)
    : config_(config), grid_(grid), settings_(settings),
      left_index_(0), right_index_(0)
{
    config_.validate();
    if (grid_.length() != config_.length) {
        throw BeamcalcException(BeamcalcError::invalid_parameter(
            "grid length", grid_.length(), "equal to the beam length"));
    }

    check_support_samples(config_, grid_);

    left_index_ = grid_.nearest_index(config_.left_support);
    right_index_ = grid_.nearest_index(config_.right_support);
}

void DeflectionSolver::integrate(const Eigen::VectorXd& moment, double theta0,
                                 Eigen::VectorXd& rotation,
                                 Eigen::VectorXd& deflection) const {
    const int n = grid_.size();
    rotation.resize(n);
    deflection.resize(n);

    rotation(0) = theta0;
    deflection(0) = 0.0;
    for (int i = 1; i < n; ++i) {
        double h = grid_.x(i) - grid_.x(i - 1);
        rotation(i) = rotation(i - 1) + h * 0.5 * (moment(i - 1) + moment(i)) / config_.EI;
        deflection(i) = deflection(i - 1) + h * 0.5 * (rotation(i - 1) + rotation(i));
    }
}

void DeflectionSolver::solve_closed_form(const Eigen::VectorXd& rotation0,
                                         const Eigen::VectorXd& deflection0,
                                         DeflectionResult& result) const {
    if (config_.cantilever) {
        const int f = left_index_;
        result.initial_rotation = -rotation0(f);
        result.deflection_offset = -deflection0(f) - result.initial_rotation * grid_.x(f);
        return;
    }

    const int il = left_index_;
    const int ir = right_index_;

    // [ 1  xl ] [ c      ]     [ w0(xl) ]
    // [ 1  xr ] [ theta0 ] = - [ w0(xr) ]
    Eigen::Matrix2d A;
    A << 1.0, grid_.x(il),
         1.0, grid_.x(ir);
    Eigen::Vector2d b(-deflection0(il), -deflection0(ir));
    Eigen::Vector2d sol = A.partialPivLu().solve(b);

    result.deflection_offset = sol(0);
    result.initial_rotation = sol(1);
}

void DeflectionSolver::solve_shooting(const Eigen::VectorXd& moment,
                                      const Eigen::VectorXd& deflection0,
                                      DeflectionResult& result) const {
    Eigen::VectorXd rotation;
    Eigen::VectorXd deflection;

    if (config_.cantilever) {
        // Rotation condition at the fixed end fixes theta0 in one shot
        const int f = left_index_;
        integrate(moment, 0.0, rotation, deflection);
        result.initial_rotation = -rotation(f);
        result.deflection_offset = -deflection(f) - result.initial_rotation * grid_.x(f);
        result.iterations = 1;
        return;
    }

    const int il = left_index_;
    const int ir = right_index_;

    // Deflection at the right support once the left support is pinned to zero
    auto support_error = [&](double theta) {
        integrate(moment, theta, rotation, deflection);
        return deflection(ir) - deflection(il);
    };

    const double tol = settings_.tolerance * deflection0.cwiseAbs().maxCoeff();
    const double delta = config_.rotation_step / config_.EI;

    double theta_prev = 0.0;
    double err_prev = support_error(theta_prev);
    int shots = 1;

    double theta = theta_prev;
    double err = err_prev;

    if (std::abs(err) > tol) {
        theta = delta;
        err = support_error(theta);
        ++shots;
    }

    while (std::abs(err) > tol) {
        if (shots >= settings_.max_iterations || err == err_prev) {
            throw BeamcalcException(BeamcalcError::not_converged(shots, err));
        }
        double theta_next = theta - err * (theta - theta_prev) / (err - err_prev);
        theta_prev = theta;
        err_prev = err;
        theta = theta_next;
        err = support_error(theta);
        ++shots;
    }

    result.initial_rotation = theta;
    result.deflection_offset = -deflection(il);
    result.iterations = shots;

    spdlog::debug("Deflection shooting converged in {} shots (theta0={:.6e}, residual={:.3e})",
                  shots, theta, err);
}

DeflectionResult DeflectionSolver::solve(const Eigen::VectorXd& moment) const {
    if (moment.size() != grid_.size()) {
        BeamcalcError err = BeamcalcError::precondition(
            "Moment array does not match the section grid",
            "Compute the moment diagram on the same grid before solving deflection.");
        err.details["moment_size"] = std::to_string(moment.size());
        err.details["grid_size"] = std::to_string(grid_.size());
        throw BeamcalcException(err);
    }

    DeflectionResult result;
    result.x = grid_.locations();

    Eigen::VectorXd rotation0;
    Eigen::VectorXd deflection0;
    integrate(moment, 0.0, rotation0, deflection0);

    switch (settings_.method) {
        case DeflectionMethod::ClosedForm:
            solve_closed_form(rotation0, deflection0, result);
            break;
        case DeflectionMethod::Shooting:
            solve_shooting(moment, deflection0, result);
            break;
    }

    const double theta0 = result.initial_rotation;
    const double c = result.deflection_offset;
    result.rotation = rotation0.array() + theta0;
    result.deflection = deflection0.array() + theta0 * result.x.array() + c;

    auto [max_w, min_w] = find_extremes(result.x, result.deflection);
    result.max_deflection = max_w;
    result.min_deflection = min_w;

    return result;
}

} // namespace beamcalc
