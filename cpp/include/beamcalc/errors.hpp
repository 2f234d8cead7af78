/**
 * @file errors.hpp
 * @brief Structured error handling for beamcalc.
 *
 * This file defines error codes and error structures for reporting
 * invalid beam definitions and analysis failures in a machine-readable
 * format. Errors are raised as BeamcalcException so the caller can
 * inspect the code of the failure.
 */

#ifndef BEAMCALC_ERRORS_HPP
#define BEAMCALC_ERRORS_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace beamcalc {

/**
 * @brief Error codes for beamcalc failures.
 */
enum class ErrorCode {
    /// No error
    OK = 0,

    // === Parameter Errors (100-199) ===

    /// Beam or load parameter is invalid (length, EI, section count, supports)
    INVALID_PARAMETER = 100,

    // === Load Errors (200-299) ===

    /// Load location lies outside the beam [0, length]
    LOAD_OUT_OF_BOUNDS = 200,

    // === Analysis Errors (300-399) ===

    /// Operation called in a state that does not allow it
    PRECONDITION_NOT_MET = 300,

    /// Deflection shooting did not converge
    SOLVER_CONVERGENCE_FAILED = 301,

    // === Generic Errors (900-999) ===

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_PARAMETER: return "INVALID_PARAMETER";
        case ErrorCode::LOAD_OUT_OF_BOUNDS: return "LOAD_OUT_OF_BOUNDS";
        case ErrorCode::PRECONDITION_NOT_MET: return "PRECONDITION_NOT_MET";
        case ErrorCode::SOLVER_CONVERGENCE_FAILED: return "SOLVER_CONVERGENCE_FAILED";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for beamcalc.
 *
 * Contains machine-readable error code, human-readable message,
 * key-value details and a suggested fix.
 */
struct BeamcalcError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    BeamcalcError()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code and message.
     */
    BeamcalcError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }
    bool is_error() const { return code != ErrorCode::OK; }

    /**
     * @brief Get string representation of the error code.
     */
    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    /**
     * @brief Create error for an invalid beam or load parameter.
     * @param name Parameter name (e.g. "length", "EI")
     * @param value Offending value
     * @param requirement Condition the value must satisfy (e.g. "> 0")
     */
    static BeamcalcError invalid_parameter(const std::string& name, double value,
                                           const std::string& requirement) {
        BeamcalcError err(ErrorCode::INVALID_PARAMETER,
            "Invalid parameter '" + name + "': must be " + requirement);
        err.details["parameter"] = name;
        err.details["value"] = std::to_string(value);
        return err;
    }

    /**
     * @brief Create error for a load located outside the beam.
     */
    static BeamcalcError load_out_of_bounds(double location, double length) {
        BeamcalcError err(ErrorCode::LOAD_OUT_OF_BOUNDS,
            "Load location lies outside the beam");
        err.details["location"] = std::to_string(location);
        err.details["beam_length"] = std::to_string(length);
        err.suggestion = "Load locations are measured from the left end and must lie in [0, length].";
        return err;
    }

    /**
     * @brief Create error for an operation called in the wrong state.
     */
    static BeamcalcError precondition(const std::string& what,
                                      const std::string& suggestion = "") {
        BeamcalcError err(ErrorCode::PRECONDITION_NOT_MET, what);
        err.suggestion = suggestion;
        return err;
    }

    /**
     * @brief Create error for a shooting solve that did not converge.
     */
    static BeamcalcError not_converged(int iterations, double residual) {
        BeamcalcError err(ErrorCode::SOLVER_CONVERGENCE_FAILED,
            "Deflection shooting did not converge");
        err.details["iterations"] = std::to_string(iterations);
        err.details["residual"] = std::to_string(residual);
        err.suggestion = "Use DeflectionMethod::ClosedForm or increase max_iterations.";
        return err;
    }
};

/**
 * @brief Exception carrying a structured BeamcalcError.
 */
class BeamcalcException : public std::runtime_error {
public:
    explicit BeamcalcException(BeamcalcError error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    const BeamcalcError& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    BeamcalcError error_;
};

}  // namespace beamcalc

#endif  // BEAMCALC_ERRORS_HPP
