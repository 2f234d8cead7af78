#include "beamcalc/section_grid.hpp"
#include "beamcalc/errors.hpp"

#include <cmath>

namespace beamcalc {

SectionGrid::SectionGrid(double length, int sections)
    : length_(length), sections_(sections), spacing_(0.0)
{
    if (!std::isfinite(length) || length <= 0.0) {
        throw BeamcalcException(BeamcalcError::invalid_parameter("length", length, "> 0"));
    }
    if (sections < 2) {
        throw BeamcalcException(BeamcalcError::invalid_parameter(
            "sections", static_cast<double>(sections), ">= 2"));
    }

    spacing_ = length / sections;

    x_.resize(sections + 1);
    x_(0) = 0.0;
    for (int i = 1; i < sections; ++i) {
        x_(i) = (static_cast<double>(i) * length) / sections;
    }
    x_(sections) = length;
}

int SectionGrid::nearest_index(double location) const {
    // Uniform spacing: round to the closest index, then correct for drift
    int i = static_cast<int>(std::floor(location / spacing_));
    if (i < 0) return 0;
    if (i >= sections_) return sections_;

    double d_lo = std::abs(x_(i) - location);
    double d_hi = std::abs(x_(i + 1) - location);
    return (d_hi < d_lo) ? i + 1 : i;
}

bool SectionGrid::is_on_grid(double location) const {
    int i = nearest_index(location);
    return std::abs(x_(i) - location) <= tolerance();
}

} // namespace beamcalc
