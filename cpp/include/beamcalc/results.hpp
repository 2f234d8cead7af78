#pragma once

#include <Eigen/Dense>
#include <utility>
#include <vector>

namespace beamcalc {

/**
 * @brief Extremum location and value
 *
 * Used to report shear, moment and deflection extrema along the beam.
 */
struct ActionExtreme {
    double x = 0.0;      ///< Position along beam
    double value = 0.0;  ///< Value at extremum
    int index = 0;       ///< Grid sample index of the extremum

    ActionExtreme() = default;
    ActionExtreme(double pos, double val, int idx) : x(pos), value(val), index(idx) {}
};

/**
 * @brief Find the maximum and minimum of a result array
 *
 * Ties keep the first (lowest index) occurrence.
 *
 * @param locations Grid sample locations
 * @param values Result array aligned with @p locations
 * @return Pair of (max, min) extrema
 */
inline std::pair<ActionExtreme, ActionExtreme> find_extremes(
    const Eigen::VectorXd& locations, const Eigen::VectorXd& values)
{
    ActionExtreme max_ext(locations(0), values(0), 0);
    ActionExtreme min_ext(locations(0), values(0), 0);
    for (Eigen::Index i = 1; i < values.size(); ++i) {
        int idx = static_cast<int>(i);
        if (values(i) > max_ext.value) max_ext = ActionExtreme(locations(i), values(i), idx);
        if (values(i) < min_ext.value) min_ext = ActionExtreme(locations(i), values(i), idx);
    }
    return {max_ext, min_ext};
}

/**
 * @brief Support reaction
 *
 * Sign convention matches applied loads: a reaction is reported as the
 * point load the support applies to the beam.
 */
struct Reaction {
    double x = 0.0;       ///< Support location
    double force = 0.0;   ///< Transverse reaction force
    double moment = 0.0;  ///< Reaction moment (cantilever fixed end only)

    Reaction() = default;
    Reaction(double pos, double f, double m = 0.0) : x(pos), force(f), moment(m) {}
};

/**
 * @brief Shear and moment diagrams for one load set
 *
 * Sign convention: shear at x is the sum of all transverse forces
 * (applied loads and reactions) at or to the left of x; moment is the
 * running integral of shear plus concentrated moments. A downward load
 * between two supports therefore produces positive (sagging) moment.
 */
struct ShearMomentResult {
    Eigen::VectorXd x;        ///< Sample locations
    Eigen::VectorXd shear;    ///< Shear at each sample
    Eigen::VectorXd moment;   ///< Moment at each sample

    std::vector<Reaction> reactions;  ///< One per support (one for cantilevers)

    ActionExtreme max_shear;
    ActionExtreme min_shear;
    ActionExtreme max_moment;
    ActionExtreme min_moment;
};

/**
 * @brief Rotation and deflection for one load set
 */
struct DeflectionResult {
    Eigen::VectorXd x;           ///< Sample locations
    Eigen::VectorXd rotation;    ///< Slope at each sample [rad]
    Eigen::VectorXd deflection;  ///< Transverse displacement at each sample

    double initial_rotation = 0.0;   ///< Solved rotation at x = 0
    double deflection_offset = 0.0;  ///< Solved deflection at x = 0

    ActionExtreme max_deflection;  ///< Largest (most positive) deflection
    ActionExtreme min_deflection;  ///< Most negative deflection

    int iterations = 0;  ///< Shots taken (0 for the closed-form solve)
};

} // namespace beamcalc
