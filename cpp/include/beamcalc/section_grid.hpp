#pragma once

#include <Eigen/Dense>

namespace beamcalc {

/**
 * @brief Uniform sampling of the beam axis
 *
 * Divides a beam of length L into N equal sections, giving N+1 sample
 * locations x_0 = 0 ... x_N = L with spacing h = L / N. Interior samples
 * are computed as i * L / N; both end samples are exact.
 *
 * All result arrays (shear, moment, rotation, deflection) are aligned
 * index-for-index with the grid.
 */
class SectionGrid {
public:
    /**
     * @brief Build the grid
     * @param length Beam length L (> 0)
     * @param sections Number of sections N (>= 2)
     * @throws BeamcalcException (INVALID_PARAMETER) on invalid input
     */
    SectionGrid(double length, int sections);

    double length() const { return length_; }
    int sections() const { return sections_; }

    /// Number of samples (N + 1)
    int size() const { return static_cast<int>(x_.size()); }

    /// Section width h = L / N
    double spacing() const { return spacing_; }

    /// Sample location x_i
    double x(int i) const { return x_(i); }

    /// All sample locations
    const Eigen::VectorXd& locations() const { return x_; }

    /**
     * @brief Tolerance used to decide whether a location coincides with a sample
     *
     * 1e-9 of the section width.
     */
    double tolerance() const { return 1e-9 * spacing_; }

    /**
     * @brief Index of the sample nearest to a location
     *
     * On a tie between two samples the lower index is returned.
     */
    int nearest_index(double location) const;

    /**
     * @brief Check whether a location coincides with a sample
     */
    bool is_on_grid(double location) const;

    /**
     * @brief Check whether sample i lies at or beyond a location
     *
     * Used for right-continuous step functions: a jump at @p location is
     * realized at the first sample for which this returns true.
     */
    bool at_or_after(int i, double location) const {
        return x_(i) + tolerance() >= location;
    }

private:
    double length_;
    int sections_;
    double spacing_;
    Eigen::VectorXd x_;
};

} // namespace beamcalc
