/**
 * @file test_load.cpp
 * @brief C++ tests for load value objects and their contributions
 *
 * Tests include:
 * - Load validation, intensity, resultants and scaling
 * - Bounds checking against the beam length
 * - Raw load contributions on a coarse grid
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "beamcalc/errors.hpp"
#include "beamcalc/load.hpp"
#include "beamcalc/section_grid.hpp"

#include <Eigen/Dense>
#include <limits>
#include <variant>

using namespace beamcalc;
using Catch::Matchers::WithinAbs;

namespace {

template <typename Fn>
ErrorCode error_code_of(Fn&& fn) {
    try {
        fn();
    } catch (const BeamcalcException& e) {
        return e.code();
    }
    return ErrorCode::OK;
}

} // namespace

// =============================================================================
// Loads
// =============================================================================

TEST_CASE("Loads reject non-finite values", "[Load][errors]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    REQUIRE(error_code_of([&] { PointLoad(nan, 1.0); }) == ErrorCode::INVALID_PARAMETER);
    REQUIRE(error_code_of([&] { PointLoad(0.5, nan); }) == ErrorCode::INVALID_PARAMETER);
    REQUIRE(error_code_of([&] { DistLoad(0.0, 1.0, nan, 1.0); })
            == ErrorCode::INVALID_PARAMETER);
}

TEST_CASE("Distributed load requires start <= end", "[Load][errors]") {
    REQUIRE(error_code_of([] { DistLoad(0.6, 0.2, 1.0, 1.0); })
            == ErrorCode::INVALID_PARAMETER);
    REQUIRE(error_code_of([] { DistLoad(0.4, 0.4, 1.0, 1.0); }) == ErrorCode::OK);
}

TEST_CASE("Distributed load intensity and resultants", "[Load]") {
    DistLoad ramp(0.2, 0.6, 1.0, 3.0, LoadType::Snow);

    REQUIRE_THAT(ramp.intensity_at(0.2), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(ramp.intensity_at(0.4), WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(ramp.intensity_at(0.6), WithinAbs(3.0, 1e-12));
    REQUIRE(ramp.intensity_at(0.1) == 0.0);
    REQUIRE(ramp.intensity_at(0.7) == 0.0);

    REQUIRE_THAT(ramp.resultant(), WithinAbs(0.8, 1e-12));
    // Integral of w(x) * x over [0.2, 0.6]
    REQUIRE_THAT(ramp.first_moment(), WithinAbs(0.08 + 0.16 + 0.32 / 3.0, 1e-12));
    REQUIRE_FALSE(ramp.is_uniform());
}

TEST_CASE("Scaling multiplies magnitudes and keeps the load type", "[Load]") {
    Load point = PointLoad(0.3, -2.0, PointLoadKind::Moment, LoadType::Wind);
    Load dist = DistLoad(0.0, 1.0, -1.0, -3.0, LoadType::Live);

    Load sp = scaled(point, 1.5);
    Load sd = scaled(dist, 0.5);

    const auto& p = std::get<PointLoad>(sp);
    REQUIRE_THAT(p.magnitude, WithinAbs(-3.0, 1e-15));
    REQUIRE(p.location == 0.3);
    REQUIRE(p.kind == PointLoadKind::Moment);
    REQUIRE(load_type(sp) == LoadType::Wind);

    const auto& d = std::get<DistLoad>(sd);
    REQUIRE_THAT(d.start_magnitude, WithinAbs(-0.5, 1e-15));
    REQUIRE_THAT(d.end_magnitude, WithinAbs(-1.5, 1e-15));
    REQUIRE(load_type(sd) == LoadType::Live);
}

TEST_CASE("Bounds check rejects locations outside the beam", "[Load][errors]") {
    REQUIRE(error_code_of([] { check_bounds(PointLoad(0.0, 1.0), 1.0); }) == ErrorCode::OK);
    REQUIRE(error_code_of([] { check_bounds(PointLoad(1.0, 1.0), 1.0); }) == ErrorCode::OK);
    REQUIRE(error_code_of([] { check_bounds(PointLoad(1.5, 1.0), 1.0); })
            == ErrorCode::LOAD_OUT_OF_BOUNDS);
    REQUIRE(error_code_of([] { check_bounds(PointLoad(-0.1, 1.0), 1.0); })
            == ErrorCode::LOAD_OUT_OF_BOUNDS);
    REQUIRE(error_code_of([] { check_bounds(DistLoad(0.5, 1.2, 1.0, 1.0), 1.0); })
            == ErrorCode::LOAD_OUT_OF_BOUNDS);
}

TEST_CASE("Load type symbols", "[Load]") {
    REQUIRE(load_type_symbol(LoadType::Dead) == "D");
    REQUIRE(load_type_symbol(LoadType::RoofLive) == "Lr");
    REQUIRE(load_type_symbol(LoadType::Earthquake) == "E");
    REQUIRE(load_type_symbol(LoadType::None) == "None");
}

// =============================================================================
// Raw contributions
// =============================================================================

TEST_CASE("Point shear load steps shear and ramps moment", "[Load][contribution]") {
    SectionGrid grid(1.0, 10);
    Eigen::VectorXd shear = Eigen::VectorXd::Zero(grid.size());
    Eigen::VectorXd moment = Eigen::VectorXd::Zero(grid.size());

    add_contribution(PointLoad(0.5, -1.0), grid, shear, moment);

    REQUIRE(shear(4) == 0.0);
    REQUIRE(shear(5) == -1.0);
    REQUIRE(shear(10) == -1.0);
    REQUIRE(moment(5) == 0.0);
    REQUIRE_THAT(moment(10), WithinAbs(-0.5, 1e-12));
}

TEST_CASE("Point moment load steps moment only", "[Load][contribution]") {
    SectionGrid grid(1.0, 10);
    Eigen::VectorXd shear = Eigen::VectorXd::Zero(grid.size());
    Eigen::VectorXd moment = Eigen::VectorXd::Zero(grid.size());

    add_contribution(PointLoad(0.5, 2.0, PointLoadKind::Moment), grid, shear, moment);

    REQUIRE(shear.cwiseAbs().maxCoeff() == 0.0);
    REQUIRE(moment(4) == 0.0);
    REQUIRE(moment(5) == 2.0);
    REQUIRE(moment(10) == 2.0);
}

TEST_CASE("Uniform load integrates exactly on the grid", "[Load][contribution]") {
    SectionGrid grid(1.0, 10);
    Eigen::VectorXd shear = Eigen::VectorXd::Zero(grid.size());
    Eigen::VectorXd moment = Eigen::VectorXd::Zero(grid.size());

    add_contribution(DistLoad(0.0, 1.0, -2.0, -2.0), grid, shear, moment);

    for (int i = 0; i < grid.size(); ++i) {
        double x = grid.x(i);
        REQUIRE_THAT(shear(i), WithinAbs(-2.0 * x, 1e-12));
        REQUIRE_THAT(moment(i), WithinAbs(-x * x, 1e-12));
    }
}

TEST_CASE("Partial load between samples is clipped to its extent", "[Load][contribution]") {
    SectionGrid grid(1.0, 10);
    Eigen::VectorXd shear = Eigen::VectorXd::Zero(grid.size());
    Eigen::VectorXd moment = Eigen::VectorXd::Zero(grid.size());

    add_contribution(DistLoad(0.25, 0.75, 1.0, 1.0), grid, shear, moment);

    REQUIRE(shear(2) == 0.0);
    REQUIRE_THAT(shear(3), WithinAbs(0.05, 1e-12));
    REQUIRE_THAT(shear(7), WithinAbs(0.45, 1e-12));
    REQUIRE_THAT(shear(8), WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(shear(10), WithinAbs(0.5, 1e-12));
}
