#pragma once

#include "beamcalc/section_grid.hpp"

#include <Eigen/Dense>
#include <string>
#include <variant>

namespace beamcalc {

/**
 * @brief Load category used by code load combinations
 *
 * Categories follow ASCE 7 notation. Loads tagged None take part in the
 * plain shear/moment calculation but are ignored by load combinations.
 */
enum class LoadType {
    None,        ///< Untagged
    Dead,        ///< D  - dead load
    Live,        ///< L  - live load
    RoofLive,    ///< Lr - roof live load
    Snow,        ///< S  - snow load
    Rain,        ///< R  - rain load
    Wind,        ///< W  - wind load
    Earthquake   ///< E  - earthquake load
};

/**
 * @brief Short code-style symbol for a load type ("D", "L", "Lr", ...)
 */
std::string load_type_symbol(LoadType type);

/**
 * @brief Kind of a concentrated load
 */
enum class PointLoadKind {
    Shear,   ///< Concentrated transverse force
    Moment   ///< Concentrated moment
};

/**
 * @brief Concentrated force or moment at a single location
 *
 * Contribution to the unreacted diagrams:
 * - Shear kind:  V += m for x >= d,  M += m * (x - d) for x >= d
 * - Moment kind: M += m for x >= d
 */
struct PointLoad {
    double location;                            ///< Distance d from the left end
    double magnitude;                           ///< Signed magnitude m
    PointLoadKind kind = PointLoadKind::Shear;  ///< Force or moment
    LoadType type = LoadType::None;             ///< Combination category

    /**
     * @throws BeamcalcException (INVALID_PARAMETER) if a value is not finite
     */
    PointLoad(double location, double magnitude,
              PointLoadKind kind = PointLoadKind::Shear,
              LoadType type = LoadType::None);

    bool is_shear() const { return kind == PointLoadKind::Shear; }

    /// Net transverse force (zero for a moment load)
    double resultant() const { return is_shear() ? magnitude : 0.0; }
};

/**
 * @brief Linearly varying distributed load between two locations
 *
 * Intensity varies linearly: w(x) = ml + (mr - ml) * (x - dl) / (dr - dl)
 * for dl <= x <= dr, and is zero elsewhere. A uniform load has ml == mr.
 */
struct DistLoad {
    double start;                    ///< Start location dl
    double end;                      ///< End location dr
    double start_magnitude;          ///< Intensity ml at dl
    double end_magnitude;            ///< Intensity mr at dr
    LoadType type = LoadType::None;  ///< Combination category

    /**
     * @throws BeamcalcException (INVALID_PARAMETER) if start > end or a
     *         value is not finite
     */
    DistLoad(double start, double end, double start_magnitude, double end_magnitude,
             LoadType type = LoadType::None);

    double span() const { return end - start; }

    bool is_uniform() const { return start_magnitude == end_magnitude; }

    /**
     * @brief Load intensity at location x (zero outside [start, end])
     */
    double intensity_at(double x) const;

    /// Total force (area under the intensity ramp)
    double resultant() const;

    /// First moment of the load about x = 0
    double first_moment() const;
};

/**
 * @brief A load applied to a beam
 */
using Load = std::variant<PointLoad, DistLoad>;

/// Combination category of a load
LoadType load_type(const Load& load);

/**
 * @brief Copy of a load with every magnitude multiplied by a factor
 */
Load scaled(const Load& load, double factor);

/**
 * @brief Verify that every location of a load lies within [0, length]
 * @throws BeamcalcException (LOAD_OUT_OF_BOUNDS)
 */
void check_bounds(const Load& load, double length);

/**
 * @brief Add a load's unreacted contribution to shear and moment arrays
 *
 * Point loads contribute exact step/ramp values. A distributed load's shear
 * is the running integral of its intensity, accumulated per grid interval
 * over the part that overlaps the load; its moment is the cumulative
 * trapezoidal integral of that shear.
 *
 * @param load Load to apply
 * @param grid Sampling grid
 * @param shear Shear array (size grid.size()), accumulated in place
 * @param moment Moment array (size grid.size()), accumulated in place
 */
void add_contribution(const Load& load, const SectionGrid& grid,
                      Eigen::VectorXd& shear, Eigen::VectorXd& moment);

} // namespace beamcalc
