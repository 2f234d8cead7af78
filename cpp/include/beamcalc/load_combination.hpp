#pragma once

#include "beamcalc/beam_config.hpp"
#include "beamcalc/load.hpp"
#include "beamcalc/results.hpp"
#include "beamcalc/shear_moment.hpp"

#include <Eigen/Dense>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace beamcalc {

/**
 * @brief Term in a load combination (load type + factor)
 */
struct LoadCombinationTerm {
    LoadType type;   ///< Load category
    double factor;   ///< Load factor to apply

    LoadCombinationTerm(LoadType t, double f) : type(t), factor(f) {}
};

/**
 * @brief Factored combination of load categories
 *
 * A LoadCombination scales every load of a referenced category by the
 * category's factor; loads of categories the combination does not
 * reference contribute nothing.
 *
 * Usage:
 * @code
 *   LoadCombination combo(1, "1.2D + 1.6L");
 *   combo.set_type_factor(LoadType::Dead, 1.2);
 *   combo.set_type_factor(LoadType::Live, 1.6);
 * @endcode
 */
class LoadCombination {
public:
    /**
     * @brief Construct an empty combination
     * @param index Position in its code table
     * @param name Display name; generated from the terms when empty
     */
    explicit LoadCombination(int index, const std::string& name = "");

    int index() const { return index_; }

    /**
     * @brief Display name, e.g. "1.2D + 1.6L + 0.5Lr"
     */
    std::string name() const;

    /**
     * @brief Factor for a load type (0 if the type is not referenced)
     */
    double get_type_factor(LoadType type) const;

    /**
     * @brief Set or add the factor for a load type
     *
     * LoadType::None cannot be referenced and is ignored.
     */
    void set_type_factor(LoadType type, double factor);

    bool references(LoadType type) const;

    const std::vector<LoadCombinationTerm>& get_terms() const { return terms_; }

    size_t size() const { return terms_.size(); }
    bool empty() const { return terms_.empty(); }

    /**
     * @brief Terms restricted to the load types present on the beam
     */
    std::vector<LoadCombinationTerm> effective_terms(const std::set<LoadType>& present) const;

    /**
     * @brief Factored copy of a load set
     *
     * Loads whose category is not referenced (including untagged loads)
     * are dropped; load order is preserved.
     */
    std::vector<Load> factored_loads(const std::vector<Load>& loads) const;

private:
    int index_;
    std::string name_;
    std::vector<LoadCombinationTerm> terms_;
};

/**
 * @brief Code-defined combination table
 *
 * LRFD: ASCE 7-16 section 2.3.1 (seismic per 2.3.6).
 * ASD:  ASCE 7-16 section 2.4.1 (seismic per 2.4.5).
 * "Or" alternatives, e.g. 0.5(Lr or S or R), expand into separate entries
 * in the order written in the code. Each entry's index() is its position
 * in the returned table.
 */
const std::vector<LoadCombination>& combination_table(AnalysisMethod method);

/**
 * @brief Load types carried by a load set (LoadType::None excluded)
 */
std::set<LoadType> present_load_types(const std::vector<Load>& loads);

/**
 * @brief Select the table entries that apply to the present load types
 *
 * An entry applies when it references at least one present type; absent
 * types contribute zero. Entries that reduce to the same effective terms are
 * all kept, and the tie rule of CombinationEvaluator makes the first of them
 * govern. Table order is preserved.
 */
std::vector<LoadCombination> applicable_combinations(AnalysisMethod method,
                                                     const std::set<LoadType>& present);

/**
 * @brief Governing value of one response quantity
 */
struct CriticalValue {
    double value = 0.0;          ///< Extreme value
    double x = 0.0;              ///< Location of the extreme
    int combination_index = -1;  ///< Table index of the governing combination
    std::string combination_name;

    CriticalValue() = default;
};

/**
 * @brief Shear/moment extremes of a single combination
 */
struct CombinationExtremes {
    int combination_index = -1;
    std::string combination_name;
    ActionExtreme max_shear;
    ActionExtreme min_shear;
    ActionExtreme max_moment;
    ActionExtreme min_moment;
};

/**
 * @brief Governing extremes and envelopes over all applicable combinations
 */
struct CriticalCombinations {
    CriticalValue max_shear;
    CriticalValue min_shear;
    CriticalValue max_moment;
    CriticalValue min_moment;

    Eigen::VectorXd x;            ///< Sample locations
    Eigen::VectorXd shear_max;    ///< Per-sample max shear over combinations
    Eigen::VectorXd shear_min;    ///< Per-sample min shear over combinations
    Eigen::VectorXd moment_max;   ///< Per-sample max moment over combinations
    Eigen::VectorXd moment_min;   ///< Per-sample min moment over combinations

    std::vector<CombinationExtremes> combinations;  ///< In table order
};

/**
 * @brief Evaluate code load combinations and reduce to governing extremes
 *
 * For every applicable combination the loads are factored and run through
 * the ShearMomentComputer. Reduction keeps the first combination in table
 * order (then the first sample) on ties.
 */
class CombinationEvaluator {
public:
    CombinationEvaluator(const ShearMomentComputer& computer, AnalysisMethod method);

    /**
     * @brief Evaluate all applicable combinations for a load set
     * @throws BeamcalcException (PRECONDITION_NOT_MET) if no load is tagged
     *         with a load type
     */
    CriticalCombinations evaluate(const std::vector<Load>& loads) const;

    AnalysisMethod method() const { return method_; }

private:
    const ShearMomentComputer& computer_;  // non-owning
    AnalysisMethod method_;
};

} // namespace beamcalc
