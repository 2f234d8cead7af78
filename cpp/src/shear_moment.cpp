#include "beamcalc/shear_moment.hpp"
#include "beamcalc/errors.hpp"

#include <spdlog/spdlog.h>

namespace beamcalc {

ShearMomentComputer::ShearMomentComputer(const BeamConfig& config, const SectionGrid& grid)
    : config_(config), grid_(grid)
{
    config_.validate();
    if (grid_.length() != config_.length) {
        throw BeamcalcException(BeamcalcError::invalid_parameter(
            "grid length", grid_.length(), "equal to the beam length"));
    }
}

void ShearMomentComputer::accumulate_loads(const std::vector<Load>& loads,
                                           Eigen::VectorXd& shear,
                                           Eigen::VectorXd& moment) const {
    shear = Eigen::VectorXd::Zero(grid_.size());
    moment = Eigen::VectorXd::Zero(grid_.size());

    for (const auto& load : loads) {
        add_contribution(load, grid_, shear, moment);
    }
}

std::vector<Reaction> ShearMomentComputer::resolve_reactions(double total_force,
                                                             double total_moment) const {
    const double L = config_.length;
    std::vector<Reaction> reactions;

    if (config_.cantilever) {
        const double xf = config_.left_support;
        double R = -total_force;
        double Mr = -(total_moment + R * (L - xf));
        reactions.emplace_back(xf, R, Mr);
        return reactions;
    }

    const double dl = config_.left_support;
    const double dr = config_.right_support;

    // [ 1       1      ] [Rl]   [-F]
    // [ L - dl  L - dr ] [Rr] = [-M]
    Eigen::Matrix2d A;
    A << 1.0, 1.0,
         L - dl, L - dr;
    Eigen::Vector2d b(-total_force, -total_moment);
    Eigen::Vector2d R = A.partialPivLu().solve(b);

    reactions.emplace_back(dl, R(0));
    reactions.emplace_back(dr, R(1));
    return reactions;
}

ShearMomentResult ShearMomentComputer::compute(const std::vector<Load>& loads) const {
    ShearMomentResult result;
    result.x = grid_.locations();

    accumulate_loads(loads, result.shear, result.moment);

    const int last = grid_.size() - 1;
    result.reactions = resolve_reactions(result.shear(last), result.moment(last));

    // A right fixed end closes the beam: its reaction stays out of the arrays so
    // that x_N keeps the left limit, the fixed-end shear and moment
    const bool closes_at_end = config_.cantilever && config_.fixed_end() == FixedEnd::Right;

    for (const auto& reaction : result.reactions) {
        spdlog::debug("Reaction at x={:.6g}: force={:.6g}, moment={:.6g}",
                      reaction.x, reaction.force, reaction.moment);
        if (closes_at_end) {
            continue;
        }
        add_contribution(PointLoad(reaction.x, reaction.force, PointLoadKind::Shear),
                         grid_, result.shear, result.moment);
        if (reaction.moment != 0.0) {
            add_contribution(PointLoad(reaction.x, reaction.moment, PointLoadKind::Moment),
                             grid_, result.shear, result.moment);
        }
    }

    auto [max_v, min_v] = find_extremes(result.x, result.shear);
    auto [max_m, min_m] = find_extremes(result.x, result.moment);
    result.max_shear = max_v;
    result.min_shear = min_v;
    result.max_moment = max_m;
    result.min_moment = min_m;

    spdlog::debug("Shear/moment computed for {} loads on {} sections", loads.size(),
                  grid_.sections());
    return result;
}

} // namespace beamcalc
