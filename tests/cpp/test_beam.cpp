/**
 * @file test_beam.cpp
 * @brief C++ tests for the Beam facade: validation, loads and diagnostics
 *
 * Tests include:
 * - Configuration validation error codes
 * - add_load bounds checking without state change
 * - check() and check_deflection() warnings
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "beamcalc/beam.hpp"
#include "beamcalc/errors.hpp"
#include "beamcalc/warnings.hpp"

#include <string>
#include <vector>

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

ErrorCode construct(const BeamConfig& config) {
    return error_code_of([&] { Beam beam(config); });
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

TEST_CASE("Beam stores its configuration", "[Beam]") {
    Beam beam(12.0, 1.0, 11.0, false, 5.0e4, AnalysisMethod::ASD, 600, 2e-4);

    REQUIRE(beam.config().length == 12.0);
    REQUIRE(beam.config().left_support == 1.0);
    REQUIRE(beam.config().right_support == 11.0);
    REQUIRE_FALSE(beam.config().cantilever);
    REQUIRE(beam.config().EI == 5.0e4);
    REQUIRE(beam.config().method == AnalysisMethod::ASD);
    REQUIRE(beam.config().sections == 600);
    REQUIRE(beam.config().rotation_step == 2e-4);
    REQUIRE(beam.grid().size() == 601);
    REQUIRE(beam.loads().empty());
    REQUIRE(beam.deflection_settings().method == DeflectionMethod::ClosedForm);
}

TEST_CASE("Default configuration", "[Beam][config]") {
    BeamConfig config;

    REQUIRE(config.sections == 1000);
    REQUIRE(config.rotation_step == 1e-4);
    REQUIRE(config.method == AnalysisMethod::LRFD);
    REQUIRE_FALSE(config.cantilever);
    REQUIRE(construct(config) == ErrorCode::OK);

    BeamConfig right = BeamConfig::make_cantilever(3.0, 1.0, FixedEnd::Right);
    REQUIRE(right.left_support == 3.0);
    REQUIRE(right.right_support == 3.0);
    REQUIRE(right.fixed_end() == FixedEnd::Right);
}

TEST_CASE("Invalid beam parameters are rejected", "[Beam][errors]") {
    BeamConfig base = BeamConfig::make_simply_supported(10.0, 1.0);

    SECTION("length") {
        BeamConfig c = base;
        c.length = 0.0;
        REQUIRE(construct(c) == ErrorCode::INVALID_PARAMETER);
    }

    SECTION("EI") {
        BeamConfig c = base;
        c.EI = -1.0;
        REQUIRE(construct(c) == ErrorCode::INVALID_PARAMETER);
    }

    SECTION("sections") {
        BeamConfig c = base;
        c.sections = 1;
        REQUIRE(construct(c) == ErrorCode::INVALID_PARAMETER);
    }

    SECTION("rotation step") {
        BeamConfig c = base;
        c.rotation_step = 0.0;
        REQUIRE(construct(c) == ErrorCode::INVALID_PARAMETER);
    }

    SECTION("supports out of order") {
        BeamConfig c = base;
        c.left_support = 6.0;
        c.right_support = 4.0;
        REQUIRE(construct(c) == ErrorCode::INVALID_PARAMETER);
    }

    SECTION("coincident supports") {
        BeamConfig c = base;
        c.left_support = 5.0;
        c.right_support = 5.0;
        REQUIRE(construct(c) == ErrorCode::INVALID_PARAMETER);
    }

    SECTION("support outside the beam") {
        BeamConfig c = base;
        c.right_support = 10.5;
        REQUIRE(construct(c) == ErrorCode::INVALID_PARAMETER);
    }

    SECTION("cantilever fixed end inside the span") {
        BeamConfig c = BeamConfig::make_cantilever(10.0, 1.0);
        c.left_support = 5.0;
        c.right_support = 5.0;
        REQUIRE(construct(c) == ErrorCode::INVALID_PARAMETER);
    }

    SECTION("cantilever with two support locations") {
        BeamConfig c = BeamConfig::make_cantilever(10.0, 1.0);
        c.right_support = 10.0;
        REQUIRE(construct(c) == ErrorCode::INVALID_PARAMETER);
    }
}

TEST_CASE("Error carries details and a readable message", "[Beam][errors]") {
    try {
        Beam beam(-2.0, 0.0, 1.0, false, 1.0);
        FAIL("Expected BeamcalcException");
    } catch (const BeamcalcException& e) {
        REQUIRE(e.code() == ErrorCode::INVALID_PARAMETER);
        REQUIRE(e.error().details.count("value") == 1);
        REQUIRE(std::string(e.what()).find("INVALID_PARAMETER") != std::string::npos);
    }
}

// =============================================================================
// Loads
// =============================================================================

TEST_CASE("Out-of-bounds loads leave the beam unchanged", "[Beam][loads][errors]") {
    Beam beam(1.0, 0.0, 1.0, false, 1.0);
    beam.add_load(PointLoad(0.5, -1.0));

    REQUIRE(error_code_of([&] { beam.add_load(PointLoad(1.5, -1.0)); })
            == ErrorCode::LOAD_OUT_OF_BOUNDS);
    REQUIRE(error_code_of([&] { beam.add_load(DistLoad(0.5, 1.2, -1.0, -1.0)); })
            == ErrorCode::LOAD_OUT_OF_BOUNDS);
    REQUIRE(error_code_of([&] { beam.add_load(PointLoad(-0.01, -1.0)); })
            == ErrorCode::LOAD_OUT_OF_BOUNDS);

    REQUIRE(beam.loads().size() == 1);
    ShearMomentResult r = beam.calculate_shear_moment();
    REQUIRE_THAT(r.max_moment.value, WithinAbs(0.25, 1e-12));
}

TEST_CASE("Loads at the beam ends are accepted", "[Beam][loads]") {
    Beam beam(1.0, 0.0, 1.0, false, 1.0);
    beam.add_load(PointLoad(0.0, -1.0));
    beam.add_load(PointLoad(1.0, -1.0));
    beam.add_load(DistLoad(0.0, 1.0, -1.0, 0.0));

    REQUIRE(beam.loads().size() == 3);

    beam.clear_loads();
    REQUIRE(beam.loads().empty());
}

// =============================================================================
// Diagnostics
// =============================================================================

TEST_CASE("Well-posed beam produces no warnings", "[Beam][warnings]") {
    Beam beam(1.0, 0.0, 1.0, false, 1.0);
    beam.add_load(PointLoad(0.5, -1.0, PointLoadKind::Shear, LoadType::Dead));

    WarningList warnings = beam.check();

    REQUIRE_FALSE(warnings.has_warnings());
    REQUIRE(warnings.summary() == "No warnings");
}

TEST_CASE("Questionable configurations are reported", "[Beam][warnings]") {
    SECTION("coarse discretization and no loads") {
        Beam beam(1.0, 0.0, 1.0, false, 1.0, AnalysisMethod::LRFD, 50);
        WarningList warnings = beam.check();

        REQUIRE(warnings.contains(WarningCode::COARSE_DISCRETIZATION));
        REQUIRE(warnings.contains(WarningCode::NO_LOADS));
        REQUIRE(warnings.count() == 2);
    }

    SECTION("untagged loads") {
        Beam beam(1.0, 0.0, 1.0, false, 1.0);
        beam.add_load(PointLoad(0.5, -1.0));
        beam.add_load(PointLoad(0.5, -1.0, PointLoadKind::Shear, LoadType::Live));
        beam.add_load(DistLoad(0.0, 1.0, -1.0, -1.0));
        WarningList warnings = beam.check();

        REQUIRE(warnings.contains(WarningCode::UNTAGGED_LOADS));
        REQUIRE(warnings.count() == 1);
        REQUIRE(warnings.warnings[0].involved_loads == std::vector<int>{0, 2});
        REQUIRE(warnings.warnings[0].severity == WarningSeverity::Medium);
    }

    SECTION("point load between samples") {
        Beam beam(1.0, 0.0, 1.0, false, 1.0);
        beam.add_load(PointLoad(0.0005, -1.0, PointLoadKind::Shear, LoadType::Dead));
        WarningList warnings = beam.check();

        REQUIRE(warnings.contains(WarningCode::LOAD_OFF_GRID));
        REQUIRE(warnings.warnings[0].involved_loads == std::vector<int>{0});
    }

    SECTION("support between samples") {
        Beam beam(1.0, 0.1004, 1.0, false, 1.0);
        beam.add_load(PointLoad(0.5, -1.0, PointLoadKind::Shear, LoadType::Dead));
        WarningList warnings = beam.check();

        REQUIRE(warnings.contains(WarningCode::SUPPORT_OFF_GRID));
        REQUIRE(warnings.warnings[0].details.at("support") == "left");
    }
}

TEST_CASE("Large deflection is flagged against span/240", "[Beam][warnings]") {
    SECTION("flexible beam") {
        Beam beam(1.0, 0.0, 1.0, false, 1.0);
        beam.add_load(PointLoad(0.5, -1.0));
        WarningList warnings = beam.check_deflection(beam.calculate_deflection());

        REQUIRE(warnings.contains(WarningCode::LARGE_DEFLECTION));
        REQUIRE(warnings.count_by_severity(WarningSeverity::High) == 1);
    }

    SECTION("stiff beam") {
        Beam beam(1.0, 0.0, 1.0, false, 29e6);
        beam.add_load(PointLoad(0.5, -1.0));
        WarningList warnings = beam.check_deflection(beam.calculate_deflection());

        REQUIRE_FALSE(warnings.has_warnings());
    }
}
