#include "beamcalc/load.hpp"
#include "beamcalc/errors.hpp"

#include <algorithm>
#include <cmath>

namespace beamcalc {

namespace {

void require_finite(const char* name, double value) {
    if (!std::isfinite(value)) {
        throw BeamcalcException(BeamcalcError::invalid_parameter(name, value, "finite"));
    }
}

void require_within(double location, double length) {
    if (location < 0.0 || location > length) {
        throw BeamcalcException(BeamcalcError::load_out_of_bounds(location, length));
    }
}

void add_point_contribution(const PointLoad& load, const SectionGrid& grid,
                            Eigen::VectorXd& shear, Eigen::VectorXd& moment) {
    for (int i = 0; i < grid.size(); ++i) {
        if (!grid.at_or_after(i, load.location)) continue;

        if (load.is_shear()) {
            shear(i) += load.magnitude;
            moment(i) += load.magnitude * (grid.x(i) - load.location);
        } else {
            moment(i) += load.magnitude;
        }
    }
}

void add_distributed_contribution(const DistLoad& load, const SectionGrid& grid,
                                  Eigen::VectorXd& shear, Eigen::VectorXd& moment) {
    const int n = grid.size();
    Eigen::VectorXd dshear = Eigen::VectorXd::Zero(n);

    // Running integral of w over [start, x_i]; trapezoid is exact on the
    // clipped sub-interval because w is linear there.
    double running = 0.0;
    for (int i = 1; i < n; ++i) {
        double a = std::max(grid.x(i - 1), load.start);
        double b = std::min(grid.x(i), load.end);
        if (b > a) {
            running += 0.5 * (load.intensity_at(a) + load.intensity_at(b)) * (b - a);
        }
        dshear(i) = running;
    }

    double moment_sum = 0.0;
    for (int i = 0; i < n; ++i) {
        if (i > 0) {
            moment_sum += 0.5 * (dshear(i - 1) + dshear(i)) * (grid.x(i) - grid.x(i - 1));
        }
        shear(i) += dshear(i);
        moment(i) += moment_sum;
    }
}

} // namespace

std::string load_type_symbol(LoadType type) {
    switch (type) {
        case LoadType::None: return "None";
        case LoadType::Dead: return "D";
        case LoadType::Live: return "L";
        case LoadType::RoofLive: return "Lr";
        case LoadType::Snow: return "S";
        case LoadType::Rain: return "R";
        case LoadType::Wind: return "W";
        case LoadType::Earthquake: return "E";
        default: return "None";
    }
}

// =============================================================================
// PointLoad / DistLoad
// =============================================================================

PointLoad::PointLoad(double location, double magnitude, PointLoadKind kind, LoadType type)
    : location(location), magnitude(magnitude), kind(kind), type(type)
{
    require_finite("location", location);
    require_finite("magnitude", magnitude);
}

DistLoad::DistLoad(double start, double end, double start_magnitude, double end_magnitude,
                   LoadType type)
    : start(start), end(end),
      start_magnitude(start_magnitude), end_magnitude(end_magnitude),
      type(type)
{
    require_finite("start", start);
    require_finite("end", end);
    require_finite("start_magnitude", start_magnitude);
    require_finite("end_magnitude", end_magnitude);

    if (start > end) {
        BeamcalcError err = BeamcalcError::invalid_parameter("end", end, ">= start");
        err.details["start"] = std::to_string(start);
        throw BeamcalcException(err);
    }
}

double DistLoad::intensity_at(double x) const {
    if (x < start || x > end) return 0.0;
    double len = span();
    if (len <= 0.0) return start_magnitude;
    return start_magnitude + (end_magnitude - start_magnitude) * (x - start) / len;
}

double DistLoad::resultant() const {
    return 0.5 * (start_magnitude + end_magnitude) * span();
}

double DistLoad::first_moment() const {
    // Integral of w(s) * (start + s) over [0, span]
    double len = span();
    return resultant() * start + len * len * (start_magnitude + 2.0 * end_magnitude) / 6.0;
}

// =============================================================================
// Load variant operations
// =============================================================================

LoadType load_type(const Load& load) {
    return std::visit([](const auto& l) { return l.type; }, load);
}

Load scaled(const Load& load, double factor) {
    if (const auto* p = std::get_if<PointLoad>(&load)) {
        return PointLoad(p->location, p->magnitude * factor, p->kind, p->type);
    }
    const auto& d = std::get<DistLoad>(load);
    return DistLoad(d.start, d.end,
                    d.start_magnitude * factor, d.end_magnitude * factor, d.type);
}

void check_bounds(const Load& load, double length) {
    if (const auto* p = std::get_if<PointLoad>(&load)) {
        require_within(p->location, length);
        return;
    }
    const auto& d = std::get<DistLoad>(load);
    require_within(d.start, length);
    require_within(d.end, length);
}

void add_contribution(const Load& load, const SectionGrid& grid,
                      Eigen::VectorXd& shear, Eigen::VectorXd& moment) {
    if (const auto* p = std::get_if<PointLoad>(&load)) {
        add_point_contribution(*p, grid, shear, moment);
    } else {
        add_distributed_contribution(std::get<DistLoad>(load), grid, shear, moment);
    }
}

} // namespace beamcalc
