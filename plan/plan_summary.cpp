#include "plan_summary.hpp"
#include <algorithm>
#include <cmath>

namespace cutplan {

bool same_length(double a, double b, double relative_tolerance) {
    double scale = std::max({std::fabs(a), std::fabs(b), 1.0});
    return std::fabs(a - b) <= relative_tolerance * scale;
}

PlanSummary summarize(const std::vector<CutRequest>& requests,
                      const std::vector<CutPlan>& plans) {
    PlanSummary summary;
    summary.bar_count = static_cast<uint32_t>(plans.size());

    // Group requests by distinct length
    for (const auto& request : requests) {
        auto it = std::find_if(summary.rows.begin(), summary.rows.end(),
            [&](const SummaryRow& row) { return same_length(row.length, request.length); });
        if (it == summary.rows.end()) {
            summary.rows.push_back(SummaryRow{request.length, 0, request.quantity});
        } else {
            it->needed += request.quantity;
        }
        summary.total_needed += request.quantity;
    }

    for (const auto& plan : plans) {
        summary.total_waste += plan.waste;
        summary.total_made += plan.cuts.size();
        if (!plan.empty()) {
            summary.bars_used++;
        }

        for (double cut : plan.cuts) {
            for (auto& row : summary.rows) {
                if (same_length(row.length, cut)) {
                    row.made++;
                    break;
                }
            }
        }
    }

    return summary;
}

}  // namespace cutplan
