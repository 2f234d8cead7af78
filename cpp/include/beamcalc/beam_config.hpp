#pragma once

namespace beamcalc {

/**
 * @brief Design method selecting the load combination table
 */
enum class AnalysisMethod {
    LRFD,  ///< Load and Resistance Factor Design (strength combinations)
    ASD    ///< Allowable Stress Design (service combinations)
};

/**
 * @brief Fixed end of a cantilever
 */
enum class FixedEnd {
    Left,   ///< Fixed at x = 0, free at x = L
    Right   ///< Fixed at x = L, free at x = 0
};

/**
 * @brief Beam and analysis parameters
 *
 * Units are caller-defined but must be consistent: EI has to be expressed
 * in the length and force units used for the beam and its loads.
 *
 * Simply-supported beams rest on supports at left_support and right_support
 * (overhangs allowed). Cantilevers use left_support == right_support ==
 * fixed-end location, which must be 0 or length.
 *
 * Usage:
 * @code
 *   auto config = BeamConfig::make_simply_supported(20.0, 29e6 * 510.0);
 *   config.sections = 2000;
 *   Beam beam(config);
 * @endcode
 */
struct BeamConfig {
    double length = 1.0;          ///< Beam length L
    double left_support = 0.0;    ///< Left support location dl
    double right_support = 1.0;   ///< Right support location dr
    bool cantilever = false;      ///< Cantilever (one fixed end) or simply-supported
    double EI = 1.0;              ///< Flexural rigidity
    AnalysisMethod method = AnalysisMethod::LRFD;  ///< Load combination table
    int sections = 1000;          ///< Number of integration sections N
    double rotation_step = 1e-4;  ///< Shooting probe step (multiplier of 1/EI)

    /**
     * @brief Simply-supported beam with supports at both ends
     */
    static BeamConfig make_simply_supported(double length, double EI) {
        BeamConfig config;
        config.length = length;
        config.left_support = 0.0;
        config.right_support = length;
        config.EI = EI;
        return config;
    }

    /**
     * @brief Cantilever fixed at one end
     */
    static BeamConfig make_cantilever(double length, double EI,
                                      FixedEnd end = FixedEnd::Left) {
        BeamConfig config;
        config.length = length;
        config.cantilever = true;
        config.left_support = (end == FixedEnd::Left) ? 0.0 : length;
        config.right_support = config.left_support;
        config.EI = EI;
        return config;
    }

    /**
     * @brief Check all parameters
     * @throws BeamcalcException (INVALID_PARAMETER) on the first violation
     */
    void validate() const;

    /**
     * @brief Fixed end of a cantilever (meaningless for simply-supported beams)
     */
    FixedEnd fixed_end() const {
        return (left_support == 0.0) ? FixedEnd::Left : FixedEnd::Right;
    }
};

} // namespace beamcalc
