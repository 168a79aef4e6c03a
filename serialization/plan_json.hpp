#ifndef CUTPLAN_SERIALIZATION_PLAN_JSON_HPP
#define CUTPLAN_SERIALIZATION_PLAN_JSON_HPP

#include <nlohmann/json.hpp>
#include <plan/cut_request.hpp>
#include <plan/plan_summary.hpp>
#include <cstdint>

namespace cutplan {

// CutPlan serialization
inline void to_json(nlohmann::json& j, const CutPlan& plan) {
    j = {
        {"cuts", plan.cuts},
        {"waste", plan.waste}
    };
}

inline void from_json(const nlohmann::json& j, CutPlan& plan) {
    plan.cuts = j.value("cuts", std::vector<double>{});
    plan.waste = j.value("waste", 0.0);
}

// SummaryRow serialization
inline void to_json(nlohmann::json& j, const SummaryRow& row) {
    j = {
        {"length", row.length},
        {"made", row.made},
        {"needed", row.needed}
    };
}

inline void from_json(const nlohmann::json& j, SummaryRow& row) {
    row.length = j.value("length", 0.0);
    row.made = j.value("made", uint64_t{0});
    row.needed = j.value("needed", uint64_t{0});
}

// PlanSummary serialization
inline void to_json(nlohmann::json& j, const PlanSummary& summary) {
    j = {
        {"rows", summary.rows},
        {"total_made", summary.total_made},
        {"total_needed", summary.total_needed},
        {"total_waste", summary.total_waste},
        {"bars_used", summary.bars_used},
        {"bar_count", summary.bar_count}
    };
}

inline void from_json(const nlohmann::json& j, PlanSummary& summary) {
    summary.rows = j.value("rows", std::vector<SummaryRow>{});
    summary.total_made = j.value("total_made", uint64_t{0});
    summary.total_needed = j.value("total_needed", uint64_t{0});
    summary.total_waste = j.value("total_waste", 0.0);
    summary.bars_used = j.value("bars_used", 0u);
    summary.bar_count = j.value("bar_count", 0u);
}

}  // namespace cutplan

#endif // CUTPLAN_SERIALIZATION_PLAN_JSON_HPP
