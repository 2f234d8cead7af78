#include "beamcalc/beam_config.hpp"
#include "beamcalc/errors.hpp"

#include <cmath>
#include <string>

namespace beamcalc {

namespace {

void require(bool condition, const std::string& name, double value,
             const std::string& requirement) {
    if (!condition) {
        throw BeamcalcException(BeamcalcError::invalid_parameter(name, value, requirement));
    }
}

} // namespace

void BeamConfig::validate() const {
    require(std::isfinite(length) && length > 0.0, "length", length, "> 0");
    require(std::isfinite(EI) && EI > 0.0, "EI", EI, "> 0");
    require(sections >= 2, "sections", sections, ">= 2");
    require(std::isfinite(rotation_step) && rotation_step > 0.0,
            "rotation_step", rotation_step, "> 0");

    require(std::isfinite(left_support) && left_support >= 0.0 && left_support <= length,
            "left_support", left_support, "within [0, length]");
    require(std::isfinite(right_support) && right_support >= 0.0 && right_support <= length,
            "right_support", right_support, "within [0, length]");

    if (cantilever) {
        require(left_support == right_support, "right_support", right_support,
                "equal to left_support (the fixed end) for a cantilever");
        require(left_support == 0.0 || left_support == length, "left_support", left_support,
                "0 or length (the fixed end) for a cantilever");
    } else {
        require(left_support < right_support, "right_support", right_support,
                "greater than left_support for a simply-supported beam");
    }
}

} // namespace beamcalc
