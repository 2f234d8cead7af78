#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include <spdlog/spdlog.h>

#include "beamcalc/beam.hpp"
#include "beamcalc/beam_config.hpp"
#include "beamcalc/deflection_solver.hpp"
#include "beamcalc/errors.hpp"
#include "beamcalc/load.hpp"
#include "beamcalc/load_combination.hpp"
#include "beamcalc/results.hpp"
#include "beamcalc/section_grid.hpp"
#include "beamcalc/shear_moment.hpp"
#include "beamcalc/warnings.hpp"

#include <string>

namespace py = pybind11;

namespace {

spdlog::level::level_enum parse_level(const std::string& level) {
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw beamcalc::BeamcalcException(beamcalc::BeamcalcError(
            beamcalc::ErrorCode::INVALID_PARAMETER,
            "Unknown log level '" + level + "'"));
    }
    return parsed;
}

} // namespace

/**
 * beamcalc C++ Python bindings module.
 * This module exposes the beam analysis engine to Python via pybind11.
 */
PYBIND11_MODULE(_beamcalc_cpp, m) {
    m.doc() = "beamcalc C++ core module - Beam shear, moment and deflection engine";

    m.attr("__version__") = "1.0.0";

    m.def("set_log_level",
          [](const std::string& level) { spdlog::set_level(parse_level(level)); },
          py::arg("level"),
          "Set the engine log level (trace, debug, info, warn, error, critical, off)");

    // ========================================================================
    // Errors and Warnings
    // ========================================================================

    py::enum_<beamcalc::ErrorCode>(m, "ErrorCode", "Error codes for beamcalc failures")
        .value("OK", beamcalc::ErrorCode::OK, "No error")
        .value("INVALID_PARAMETER", beamcalc::ErrorCode::INVALID_PARAMETER,
               "Beam or load parameter is invalid")
        .value("LOAD_OUT_OF_BOUNDS", beamcalc::ErrorCode::LOAD_OUT_OF_BOUNDS,
               "Load location lies outside the beam")
        .value("PRECONDITION_NOT_MET", beamcalc::ErrorCode::PRECONDITION_NOT_MET,
               "Operation called in a state that does not allow it")
        .value("SOLVER_CONVERGENCE_FAILED", beamcalc::ErrorCode::SOLVER_CONVERGENCE_FAILED,
               "Deflection shooting did not converge")
        .value("UNKNOWN_ERROR", beamcalc::ErrorCode::UNKNOWN_ERROR, "Unknown error");

    py::class_<beamcalc::BeamcalcError>(m, "BeamcalcError",
        "Structured error with code, message, details and suggestion")
        .def(py::init<>())
        .def(py::init<beamcalc::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &beamcalc::BeamcalcError::code, "Error code")
        .def_readwrite("message", &beamcalc::BeamcalcError::message, "Error message")
        .def_readwrite("details", &beamcalc::BeamcalcError::details,
                       "Additional key-value details")
        .def_readwrite("suggestion", &beamcalc::BeamcalcError::suggestion,
                       "Suggested fix")
        .def("is_ok", &beamcalc::BeamcalcError::is_ok)
        .def("is_error", &beamcalc::BeamcalcError::is_error)
        .def("code_string", &beamcalc::BeamcalcError::code_string)
        .def("to_string", &beamcalc::BeamcalcError::to_string)
        .def("__repr__", &beamcalc::BeamcalcError::to_string);

    py::register_exception<beamcalc::BeamcalcException>(m, "BeamcalcException");

    py::enum_<beamcalc::WarningCode>(m, "WarningCode", "Warning codes for questionable beams")
        .value("COARSE_DISCRETIZATION", beamcalc::WarningCode::COARSE_DISCRETIZATION)
        .value("SUPPORT_OFF_GRID", beamcalc::WarningCode::SUPPORT_OFF_GRID)
        .value("LOAD_OFF_GRID", beamcalc::WarningCode::LOAD_OFF_GRID)
        .value("NO_LOADS", beamcalc::WarningCode::NO_LOADS)
        .value("UNTAGGED_LOADS", beamcalc::WarningCode::UNTAGGED_LOADS)
        .value("LARGE_DEFLECTION", beamcalc::WarningCode::LARGE_DEFLECTION);

    py::enum_<beamcalc::WarningSeverity>(m, "WarningSeverity", "Warning severity levels")
        .value("Low", beamcalc::WarningSeverity::Low)
        .value("Medium", beamcalc::WarningSeverity::Medium)
        .value("High", beamcalc::WarningSeverity::High);

    py::class_<beamcalc::BeamcalcWarning>(m, "BeamcalcWarning",
        "Structured warning with code, severity, message, details and suggestion")
        .def_readwrite("code", &beamcalc::BeamcalcWarning::code)
        .def_readwrite("severity", &beamcalc::BeamcalcWarning::severity)
        .def_readwrite("message", &beamcalc::BeamcalcWarning::message)
        .def_readwrite("involved_loads", &beamcalc::BeamcalcWarning::involved_loads,
                       "Indices of the loads involved")
        .def_readwrite("details", &beamcalc::BeamcalcWarning::details)
        .def_readwrite("suggestion", &beamcalc::BeamcalcWarning::suggestion)
        .def("code_string", &beamcalc::BeamcalcWarning::code_string)
        .def("severity_string", &beamcalc::BeamcalcWarning::severity_string)
        .def("to_string", &beamcalc::BeamcalcWarning::to_string)
        .def("__repr__", &beamcalc::BeamcalcWarning::to_string);

    py::class_<beamcalc::WarningList>(m, "WarningList", "Collection of warnings")
        .def(py::init<>())
        .def_readonly("warnings", &beamcalc::WarningList::warnings)
        .def("has_warnings", &beamcalc::WarningList::has_warnings)
        .def("count", &beamcalc::WarningList::count)
        .def("count_by_severity", &beamcalc::WarningList::count_by_severity,
             py::arg("severity"))
        .def("contains", &beamcalc::WarningList::contains, py::arg("code"))
        .def("summary", &beamcalc::WarningList::summary)
        .def("__len__", &beamcalc::WarningList::count);

    // ========================================================================
    // Configuration
    // ========================================================================

    py::enum_<beamcalc::AnalysisMethod>(m, "AnalysisMethod",
        "Design method selecting the load combination table")
        .value("LRFD", beamcalc::AnalysisMethod::LRFD, "Load and Resistance Factor Design")
        .value("ASD", beamcalc::AnalysisMethod::ASD, "Allowable Stress Design");

    py::enum_<beamcalc::FixedEnd>(m, "FixedEnd", "Fixed end of a cantilever")
        .value("Left", beamcalc::FixedEnd::Left)
        .value("Right", beamcalc::FixedEnd::Right);

    py::class_<beamcalc::BeamConfig>(m, "BeamConfig", "Beam and analysis parameters")
        .def(py::init<>())
        .def_readwrite("length", &beamcalc::BeamConfig::length, "Beam length")
        .def_readwrite("left_support", &beamcalc::BeamConfig::left_support,
                       "Left support location")
        .def_readwrite("right_support", &beamcalc::BeamConfig::right_support,
                       "Right support location")
        .def_readwrite("cantilever", &beamcalc::BeamConfig::cantilever,
                       "Cantilever (one fixed end) or simply-supported")
        .def_readwrite("EI", &beamcalc::BeamConfig::EI, "Flexural rigidity")
        .def_readwrite("method", &beamcalc::BeamConfig::method, "Load combination table")
        .def_readwrite("sections", &beamcalc::BeamConfig::sections,
                       "Number of integration sections")
        .def_readwrite("rotation_step", &beamcalc::BeamConfig::rotation_step,
                       "Shooting probe step")
        .def_static("make_simply_supported", &beamcalc::BeamConfig::make_simply_supported,
                    py::arg("length"), py::arg("EI"))
        .def_static("make_cantilever", &beamcalc::BeamConfig::make_cantilever,
                    py::arg("length"), py::arg("EI"),
                    py::arg("end") = beamcalc::FixedEnd::Left)
        .def("validate", &beamcalc::BeamConfig::validate)
        .def("fixed_end", &beamcalc::BeamConfig::fixed_end);

    py::enum_<beamcalc::DeflectionMethod>(m, "DeflectionMethod",
        "Boundary-condition solve used by the deflection solver")
        .value("ClosedForm", beamcalc::DeflectionMethod::ClosedForm)
        .value("Shooting", beamcalc::DeflectionMethod::Shooting);

    py::class_<beamcalc::DeflectionSettings>(m, "DeflectionSettings",
        "Settings for the deflection solver")
        .def(py::init<>())
        .def_readwrite("method", &beamcalc::DeflectionSettings::method)
        .def_readwrite("tolerance", &beamcalc::DeflectionSettings::tolerance)
        .def_readwrite("max_iterations", &beamcalc::DeflectionSettings::max_iterations);

    py::class_<beamcalc::SectionGrid>(m, "SectionGrid", "Uniform sampling of the beam axis")
        .def(py::init<double, int>(), py::arg("length"), py::arg("sections"))
        .def_property_readonly("length", &beamcalc::SectionGrid::length)
        .def_property_readonly("sections", &beamcalc::SectionGrid::sections)
        .def_property_readonly("spacing", &beamcalc::SectionGrid::spacing)
        .def("size", &beamcalc::SectionGrid::size)
        .def("locations", &beamcalc::SectionGrid::locations)
        .def("nearest_index", &beamcalc::SectionGrid::nearest_index, py::arg("location"))
        .def("is_on_grid", &beamcalc::SectionGrid::is_on_grid, py::arg("location"));

    // ========================================================================
    // Loads
    // ========================================================================

    py::enum_<beamcalc::LoadType>(m, "LoadType", "Load category for load combinations")
        .value("None_", beamcalc::LoadType::None, "Untagged")
        .value("Dead", beamcalc::LoadType::Dead, "D")
        .value("Live", beamcalc::LoadType::Live, "L")
        .value("RoofLive", beamcalc::LoadType::RoofLive, "Lr")
        .value("Snow", beamcalc::LoadType::Snow, "S")
        .value("Rain", beamcalc::LoadType::Rain, "R")
        .value("Wind", beamcalc::LoadType::Wind, "W")
        .value("Earthquake", beamcalc::LoadType::Earthquake, "E");

    m.def("load_type_symbol", &beamcalc::load_type_symbol, py::arg("type"));

    py::enum_<beamcalc::PointLoadKind>(m, "PointLoadKind", "Kind of a concentrated load")
        .value("Shear", beamcalc::PointLoadKind::Shear)
        .value("Moment", beamcalc::PointLoadKind::Moment);

    py::class_<beamcalc::PointLoad>(m, "PointLoad", "Concentrated force or moment")
        .def(py::init<double, double, beamcalc::PointLoadKind, beamcalc::LoadType>(),
             py::arg("location"), py::arg("magnitude"),
             py::arg("kind") = beamcalc::PointLoadKind::Shear,
             py::arg("type") = beamcalc::LoadType::None)
        .def_readwrite("location", &beamcalc::PointLoad::location)
        .def_readwrite("magnitude", &beamcalc::PointLoad::magnitude)
        .def_readwrite("kind", &beamcalc::PointLoad::kind)
        .def_readwrite("type", &beamcalc::PointLoad::type)
        .def("resultant", &beamcalc::PointLoad::resultant);

    py::class_<beamcalc::DistLoad>(m, "DistLoad", "Linearly varying distributed load")
        .def(py::init<double, double, double, double, beamcalc::LoadType>(),
             py::arg("start"), py::arg("end"),
             py::arg("start_magnitude"), py::arg("end_magnitude"),
             py::arg("type") = beamcalc::LoadType::None)
        .def_readwrite("start", &beamcalc::DistLoad::start)
        .def_readwrite("end", &beamcalc::DistLoad::end)
        .def_readwrite("start_magnitude", &beamcalc::DistLoad::start_magnitude)
        .def_readwrite("end_magnitude", &beamcalc::DistLoad::end_magnitude)
        .def_readwrite("type", &beamcalc::DistLoad::type)
        .def("intensity_at", &beamcalc::DistLoad::intensity_at, py::arg("x"))
        .def("resultant", &beamcalc::DistLoad::resultant)
        .def("first_moment", &beamcalc::DistLoad::first_moment);

    // ========================================================================
    // Results
    // ========================================================================

    py::class_<beamcalc::ActionExtreme>(m, "ActionExtreme", "Extremum location and value")
        .def_readonly("x", &beamcalc::ActionExtreme::x)
        .def_readonly("value", &beamcalc::ActionExtreme::value)
        .def_readonly("index", &beamcalc::ActionExtreme::index);

    py::class_<beamcalc::Reaction>(m, "Reaction", "Support reaction")
        .def_readonly("x", &beamcalc::Reaction::x)
        .def_readonly("force", &beamcalc::Reaction::force)
        .def_readonly("moment", &beamcalc::Reaction::moment);

    py::class_<beamcalc::ShearMomentResult>(m, "ShearMomentResult",
        "Shear and moment diagrams for one load set")
        .def_readonly("x", &beamcalc::ShearMomentResult::x)
        .def_readonly("shear", &beamcalc::ShearMomentResult::shear)
        .def_readonly("moment", &beamcalc::ShearMomentResult::moment)
        .def_readonly("reactions", &beamcalc::ShearMomentResult::reactions)
        .def_readonly("max_shear", &beamcalc::ShearMomentResult::max_shear)
        .def_readonly("min_shear", &beamcalc::ShearMomentResult::min_shear)
        .def_readonly("max_moment", &beamcalc::ShearMomentResult::max_moment)
        .def_readonly("min_moment", &beamcalc::ShearMomentResult::min_moment);

    py::class_<beamcalc::DeflectionResult>(m, "DeflectionResult",
        "Rotation and deflection for one load set")
        .def_readonly("x", &beamcalc::DeflectionResult::x)
        .def_readonly("rotation", &beamcalc::DeflectionResult::rotation)
        .def_readonly("deflection", &beamcalc::DeflectionResult::deflection)
        .def_readonly("initial_rotation", &beamcalc::DeflectionResult::initial_rotation)
        .def_readonly("deflection_offset", &beamcalc::DeflectionResult::deflection_offset)
        .def_readonly("max_deflection", &beamcalc::DeflectionResult::max_deflection)
        .def_readonly("min_deflection", &beamcalc::DeflectionResult::min_deflection)
        .def_readonly("iterations", &beamcalc::DeflectionResult::iterations);

    // ========================================================================
    // Load Combinations
    // ========================================================================

    py::class_<beamcalc::LoadCombinationTerm>(m, "LoadCombinationTerm",
        "Term in a load combination (load type + factor)")
        .def_readonly("type", &beamcalc::LoadCombinationTerm::type)
        .def_readonly("factor", &beamcalc::LoadCombinationTerm::factor);

    py::class_<beamcalc::LoadCombination>(m, "LoadCombination",
        "Factored combination of load categories")
        .def(py::init<int, const std::string&>(), py::arg("index"), py::arg("name") = "")
        .def_property_readonly("index", &beamcalc::LoadCombination::index)
        .def_property_readonly("name", &beamcalc::LoadCombination::name)
        .def("get_type_factor", &beamcalc::LoadCombination::get_type_factor, py::arg("type"))
        .def("set_type_factor", &beamcalc::LoadCombination::set_type_factor,
             py::arg("type"), py::arg("factor"))
        .def("references", &beamcalc::LoadCombination::references, py::arg("type"))
        .def("get_terms", &beamcalc::LoadCombination::get_terms)
        .def("__repr__", [](const beamcalc::LoadCombination& c) {
            return "<LoadCombination " + std::to_string(c.index()) + ": " + c.name() + ">";
        });

    m.def("combination_table", &beamcalc::combination_table, py::arg("method"),
          py::return_value_policy::copy,
          "Code-defined load combination table for a design method");

    py::class_<beamcalc::CriticalValue>(m, "CriticalValue",
        "Governing value of one response quantity")
        .def_readonly("value", &beamcalc::CriticalValue::value)
        .def_readonly("x", &beamcalc::CriticalValue::x)
        .def_readonly("combination_index", &beamcalc::CriticalValue::combination_index)
        .def_readonly("combination_name", &beamcalc::CriticalValue::combination_name);

    py::class_<beamcalc::CombinationExtremes>(m, "CombinationExtremes",
        "Shear/moment extremes of a single combination")
        .def_readonly("combination_index", &beamcalc::CombinationExtremes::combination_index)
        .def_readonly("combination_name", &beamcalc::CombinationExtremes::combination_name)
        .def_readonly("max_shear", &beamcalc::CombinationExtremes::max_shear)
        .def_readonly("min_shear", &beamcalc::CombinationExtremes::min_shear)
        .def_readonly("max_moment", &beamcalc::CombinationExtremes::max_moment)
        .def_readonly("min_moment", &beamcalc::CombinationExtremes::min_moment);

    py::class_<beamcalc::CriticalCombinations>(m, "CriticalCombinations",
        "Governing extremes and envelopes over all applicable combinations")
        .def_readonly("max_shear", &beamcalc::CriticalCombinations::max_shear)
        .def_readonly("min_shear", &beamcalc::CriticalCombinations::min_shear)
        .def_readonly("max_moment", &beamcalc::CriticalCombinations::max_moment)
        .def_readonly("min_moment", &beamcalc::CriticalCombinations::min_moment)
        .def_readonly("x", &beamcalc::CriticalCombinations::x)
        .def_readonly("shear_max", &beamcalc::CriticalCombinations::shear_max)
        .def_readonly("shear_min", &beamcalc::CriticalCombinations::shear_min)
        .def_readonly("moment_max", &beamcalc::CriticalCombinations::moment_max)
        .def_readonly("moment_min", &beamcalc::CriticalCombinations::moment_min)
        .def_readonly("combinations", &beamcalc::CriticalCombinations::combinations);

    // ========================================================================
    // Beam
    // ========================================================================

    py::class_<beamcalc::Beam>(m, "Beam", "Beam shear, moment and deflection analysis")
        .def(py::init<const beamcalc::BeamConfig&>(), py::arg("config"))
        .def(py::init<double, double, double, bool, double, beamcalc::AnalysisMethod,
                      int, double>(),
             py::arg("length"), py::arg("left_support"), py::arg("right_support"),
             py::arg("cantilever"), py::arg("EI"),
             py::arg("method") = beamcalc::AnalysisMethod::LRFD,
             py::arg("sections") = 1000, py::arg("rotation_step") = 1e-4)
        .def("add_load", [](beamcalc::Beam& self, const beamcalc::PointLoad& load) {
                 self.add_load(load);
             }, py::arg("load"), "Append a point load")
        .def("add_load", [](beamcalc::Beam& self, const beamcalc::DistLoad& load) {
                 self.add_load(load);
             }, py::arg("load"), "Append a distributed load")
        .def("clear_loads", &beamcalc::Beam::clear_loads)
        .def("num_loads", [](const beamcalc::Beam& self) { return self.loads().size(); })
        .def_property_readonly("config", &beamcalc::Beam::config)
        .def_property_readonly("grid", &beamcalc::Beam::grid)
        .def_property("deflection_settings",
            [](const beamcalc::Beam& self) { return self.deflection_settings(); },
            [](beamcalc::Beam& self, const beamcalc::DeflectionSettings& s) {
                self.deflection_settings() = s;
            })
        .def("calculate_shear_moment", &beamcalc::Beam::calculate_shear_moment)
        .def("calculate_deflection", &beamcalc::Beam::calculate_deflection)
        .def("find_critical_combinations", &beamcalc::Beam::find_critical_combinations)
        .def("check", &beamcalc::Beam::check)
        .def("check_deflection", &beamcalc::Beam::check_deflection, py::arg("result"));
}
