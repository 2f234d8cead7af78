#include "beamcalc/load_combination.hpp"
#include "beamcalc/errors.hpp"

#include <spdlog/spdlog.h>

#include <initializer_list>
#include <sstream>

namespace beamcalc {

namespace {

std::string format_term(const LoadCombinationTerm& term) {
    std::string symbol = load_type_symbol(term.type);
    if (term.factor == 1.0) return symbol;

    std::ostringstream oss;
    oss << term.factor << symbol;
    return oss.str();
}

/**
 * @brief Appends table entries, assigning consecutive indices
 */
class TableBuilder {
public:
    void add(std::initializer_list<LoadCombinationTerm> terms) {
        LoadCombination combo(static_cast<int>(table_.size()));
        for (const auto& term : terms) {
            combo.set_type_factor(term.type, term.factor);
        }
        table_.push_back(combo);
    }

    std::vector<LoadCombination> take() { return std::move(table_); }

private:
    std::vector<LoadCombination> table_;
};

const LoadType kRoofTypes[] = {LoadType::RoofLive, LoadType::Snow, LoadType::Rain};

std::vector<LoadCombination> build_lrfd_table() {
    using T = LoadType;
    TableBuilder b;

    b.add({{T::Dead, 1.4}});
    for (T roof : kRoofTypes) {
        b.add({{T::Dead, 1.2}, {T::Live, 1.6}, {roof, 0.5}});
    }
    for (T roof : kRoofTypes) {
        b.add({{T::Dead, 1.2}, {roof, 1.6}, {T::Live, 1.0}});
        b.add({{T::Dead, 1.2}, {roof, 1.6}, {T::Wind, 0.5}});
    }
    for (T roof : kRoofTypes) {
        b.add({{T::Dead, 1.2}, {T::Wind, 1.0}, {T::Live, 1.0}, {roof, 0.5}});
    }
    b.add({{T::Dead, 1.2}, {T::Earthquake, 1.0}, {T::Live, 1.0}, {T::Snow, 0.2}});
    b.add({{T::Dead, 0.9}, {T::Wind, 1.0}});
    b.add({{T::Dead, 0.9}, {T::Earthquake, 1.0}});

    return b.take();
}

std::vector<LoadCombination> build_asd_table() {
    using T = LoadType;
    TableBuilder b;

    b.add({{T::Dead, 1.0}});
    b.add({{T::Dead, 1.0}, {T::Live, 1.0}});
    for (T roof : kRoofTypes) {
        b.add({{T::Dead, 1.0}, {roof, 1.0}});
    }
    for (T roof : kRoofTypes) {
        b.add({{T::Dead, 1.0}, {T::Live, 0.75}, {roof, 0.75}});
    }
    b.add({{T::Dead, 1.0}, {T::Wind, 0.6}});
    b.add({{T::Dead, 1.0}, {T::Earthquake, 0.7}});
    for (T roof : kRoofTypes) {
        b.add({{T::Dead, 1.0}, {T::Live, 0.75}, {T::Wind, 0.45}, {roof, 0.75}});
    }
    b.add({{T::Dead, 1.0}, {T::Live, 0.75}, {T::Earthquake, 0.525}, {T::Snow, 0.75}});
    b.add({{T::Dead, 0.6}, {T::Wind, 0.6}});
    b.add({{T::Dead, 0.6}, {T::Earthquake, 0.7}});

    return b.take();
}

void update_critical(CriticalValue& critical, const ActionExtreme& extreme,
                     const LoadCombination& combo, bool is_max, bool first) {
    bool better = is_max ? extreme.value > critical.value
                         : extreme.value < critical.value;
    if (first || better) {
        critical.value = extreme.value;
        critical.x = extreme.x;
        critical.combination_index = combo.index();
        critical.combination_name = combo.name();
    }
}

} // namespace

// =============================================================================
// LoadCombination Implementation
// =============================================================================

LoadCombination::LoadCombination(int index, const std::string& name)
    : index_(index), name_(name)
{
}

std::string LoadCombination::name() const {
    if (!name_.empty()) return name_;

    std::string result;
    for (const auto& term : terms_) {
        if (!result.empty()) result += " + ";
        result += format_term(term);
    }
    return result;
}

double LoadCombination::get_type_factor(LoadType type) const {
    for (const auto& term : terms_) {
        if (term.type == type) return term.factor;
    }
    return 0.0;
}

void LoadCombination::set_type_factor(LoadType type, double factor) {
    if (type == LoadType::None) return;

    for (auto& term : terms_) {
        if (term.type == type) {
            term.factor = factor;
            return;
        }
    }
    terms_.emplace_back(type, factor);
}

bool LoadCombination::references(LoadType type) const {
    for (const auto& term : terms_) {
        if (term.type == type) return true;
    }
    return false;
}

std::vector<LoadCombinationTerm> LoadCombination::effective_terms(
    const std::set<LoadType>& present) const
{
    std::vector<LoadCombinationTerm> result;
    for (const auto& term : terms_) {
        if (present.count(term.type) > 0) {
            result.push_back(term);
        }
    }
    return result;
}

std::vector<Load> LoadCombination::factored_loads(const std::vector<Load>& loads) const {
    std::vector<Load> result;
    result.reserve(loads.size());
    for (const auto& load : loads) {
        LoadType type = load_type(load);
        if (type == LoadType::None || !references(type)) continue;
        result.push_back(scaled(load, get_type_factor(type)));
    }
    return result;
}

// =============================================================================
// Tables
// =============================================================================

const std::vector<LoadCombination>& combination_table(AnalysisMethod method) {
    static const std::vector<LoadCombination> lrfd = build_lrfd_table();
    static const std::vector<LoadCombination> asd = build_asd_table();
    return (method == AnalysisMethod::LRFD) ? lrfd : asd;
}

std::set<LoadType> present_load_types(const std::vector<Load>& loads) {
    std::set<LoadType> present;
    for (const auto& load : loads) {
        LoadType type = load_type(load);
        if (type != LoadType::None) {
            present.insert(type);
        }
    }
    return present;
}

std::vector<LoadCombination> applicable_combinations(AnalysisMethod method,
                                                     const std::set<LoadType>& present) {
    std::vector<LoadCombination> result;
    for (const auto& combo : combination_table(method)) {
        if (!combo.effective_terms(present).empty()) {
            result.push_back(combo);
        }
    }
    return result;
}

// =============================================================================
// CombinationEvaluator Implementation
// =============================================================================

CombinationEvaluator::CombinationEvaluator(const ShearMomentComputer& computer,
                                           AnalysisMethod method)
    : computer_(computer), method_(method)
{
}

CriticalCombinations CombinationEvaluator::evaluate(const std::vector<Load>& loads) const {
    std::set<LoadType> present = present_load_types(loads);
    if (present.empty()) {
        throw BeamcalcException(BeamcalcError::precondition(
            "No load carries a load type; load combinations cannot be formed",
            "Tag loads with a LoadType (D, L, Lr, S, R, W, E) before finding critical combinations."));
    }

    std::vector<LoadCombination> combos = applicable_combinations(method_, present);
    spdlog::debug("Evaluating {} applicable load combinations", combos.size());

    CriticalCombinations critical;
    bool first = true;

    for (const auto& combo : combos) {
        ShearMomentResult sm = computer_.compute(combo.factored_loads(loads));

        CombinationExtremes extremes;
        extremes.combination_index = combo.index();
        extremes.combination_name = combo.name();
        extremes.max_shear = sm.max_shear;
        extremes.min_shear = sm.min_shear;
        extremes.max_moment = sm.max_moment;
        extremes.min_moment = sm.min_moment;
        critical.combinations.push_back(extremes);

        update_critical(critical.max_shear, sm.max_shear, combo, true, first);
        update_critical(critical.min_shear, sm.min_shear, combo, false, first);
        update_critical(critical.max_moment, sm.max_moment, combo, true, first);
        update_critical(critical.min_moment, sm.min_moment, combo, false, first);

        if (first) {
            critical.x = sm.x;
            critical.shear_max = sm.shear;
            critical.shear_min = sm.shear;
            critical.moment_max = sm.moment;
            critical.moment_min = sm.moment;
        } else {
            critical.shear_max = critical.shear_max.cwiseMax(sm.shear);
            critical.shear_min = critical.shear_min.cwiseMin(sm.shear);
            critical.moment_max = critical.moment_max.cwiseMax(sm.moment);
            critical.moment_min = critical.moment_min.cwiseMin(sm.moment);
        }
        first = false;
    }

    spdlog::info("Governing moment: max {:.6g} ({}), min {:.6g} ({})",
                 critical.max_moment.value, critical.max_moment.combination_name,
                 critical.min_moment.value, critical.min_moment.combination_name);
    spdlog::info("Governing shear: max {:.6g} ({}), min {:.6g} ({})",
                 critical.max_shear.value, critical.max_shear.combination_name,
                 critical.min_shear.value, critical.min_shear.combination_name);

    return critical;
}

} // namespace beamcalc
