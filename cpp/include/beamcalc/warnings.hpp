/**
 * @file warnings.hpp
 * @brief Warning system for questionable beam configurations.
 *
 * Warnings indicate potential issues that don't prevent analysis
 * but may indicate modeling errors or produce unreliable results.
 */

#ifndef BEAMCALC_WARNINGS_HPP
#define BEAMCALC_WARNINGS_HPP

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace beamcalc {

/**
 * @brief Warning codes for questionable beam configurations.
 */
enum class WarningCode {
    // === Discretization Warnings (100-199) ===

    /// Few sections; distributed load and deflection integration is coarse
    COARSE_DISCRETIZATION = 100,

    /// Support location does not coincide with a section sample
    SUPPORT_OFF_GRID = 101,

    /// Point load location does not coincide with a section sample
    LOAD_OFF_GRID = 102,

    // === Load Warnings (200-299) ===

    /// Beam carries no loads
    NO_LOADS = 200,

    /// Loads without a load type are ignored by load combinations
    UNTAGGED_LOADS = 201,

    // === Result Warnings (300-399) ===

    /// Deflection exceeds span / 240 (small-deflection theory may be invalid)
    LARGE_DEFLECTION = 300
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Likely indicates a modeling error
    High = 2
};

inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::COARSE_DISCRETIZATION: return "COARSE_DISCRETIZATION";
        case WarningCode::SUPPORT_OFF_GRID: return "SUPPORT_OFF_GRID";
        case WarningCode::LOAD_OFF_GRID: return "LOAD_OFF_GRID";
        case WarningCode::NO_LOADS: return "NO_LOADS";
        case WarningCode::UNTAGGED_LOADS: return "UNTAGGED_LOADS";
        case WarningCode::LARGE_DEFLECTION: return "LARGE_DEFLECTION";
        default: return "UNKNOWN_WARNING";
    }
}

inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information for beamcalc.
 */
struct BeamcalcWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Indices of the loads involved (position in the beam's load list)
    std::vector<int> involved_loads;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    BeamcalcWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }
    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        if (!involved_loads.empty()) {
            result += "\n  Loads: ";
            for (size_t i = 0; i < involved_loads.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_loads[i]);
            }
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    static BeamcalcWarning coarse_discretization(int sections) {
        BeamcalcWarning warn(WarningCode::COARSE_DISCRETIZATION, WarningSeverity::Low,
            "Beam is divided into few sections");
        warn.details["sections"] = std::to_string(sections);
        warn.suggestion = "Distributed load moments and deflections are integrated numerically; "
                          "use at least 100 sections for accurate results";
        return warn;
    }

    /**
     * @brief Create warning for a support that does not fall on a sample.
     * @param side "left" or "right" ("fixed" for cantilevers)
     * @param location Requested support location
     * @param snapped Location of the sample used for deflection boundary conditions
     */
    static BeamcalcWarning support_off_grid(const std::string& side, double location,
                                            double snapped) {
        BeamcalcWarning warn(WarningCode::SUPPORT_OFF_GRID, WarningSeverity::Medium,
            "Support does not coincide with a section sample");
        warn.details["support"] = side;
        warn.details["location"] = std::to_string(location);
        warn.details["snapped_to"] = std::to_string(snapped);
        warn.suggestion = "Choose a section count that places the support on a sample";
        return warn;
    }

    static BeamcalcWarning load_off_grid(int load_index, double location) {
        BeamcalcWarning warn(WarningCode::LOAD_OFF_GRID, WarningSeverity::Low,
            "Point load does not coincide with a section sample; its jump appears at the next sample");
        warn.involved_loads.push_back(load_index);
        warn.details["location"] = std::to_string(location);
        return warn;
    }

    static BeamcalcWarning no_loads() {
        BeamcalcWarning warn(WarningCode::NO_LOADS, WarningSeverity::Low,
            "Beam carries no loads");
        return warn;
    }

    static BeamcalcWarning untagged_loads(const std::vector<int>& load_indices) {
        BeamcalcWarning warn(WarningCode::UNTAGGED_LOADS, WarningSeverity::Medium,
            "Loads without a load type are ignored by load combinations");
        warn.involved_loads = load_indices;
        warn.suggestion = "Assign a LoadType (D, L, Lr, S, R, W, E) to every load";
        return warn;
    }

    static BeamcalcWarning large_deflection(double deflection, double span) {
        BeamcalcWarning warn(WarningCode::LARGE_DEFLECTION, WarningSeverity::High,
            "Large deflection detected - small-deflection theory may be invalid");
        warn.details["max_deflection"] = std::to_string(deflection);
        warn.details["deflection_to_span_ratio"] = std::to_string(deflection / span);
        warn.suggestion = "Check EI and load units; deflection exceeds span/240";
        return warn;
    }
};

/**
 * @brief Collection of warnings from beam validation.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<BeamcalcWarning> warnings;

    void add(const BeamcalcWarning& warning) {
        warnings.push_back(warning);
    }

    void add(BeamcalcWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    /**
     * @brief Check if a warning with the given code is present.
     */
    bool contains(WarningCode code) const {
        for (const auto& w : warnings) {
            if (w.code == code) return true;
        }
        return false;
    }

    void clear() { warnings.clear(); }

    /**
     * @brief Get formatted summary string.
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace beamcalc

#endif  // BEAMCALC_WARNINGS_HPP
