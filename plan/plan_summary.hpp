#ifndef CUTPLAN_PLAN_PLAN_SUMMARY_HPP
#define CUTPLAN_PLAN_PLAN_SUMMARY_HPP

#include "cut_request.hpp"
#include <cstdint>
#include <vector>

namespace cutplan {

// Made vs. needed for one distinct requested length
struct SummaryRow {
    double length = 0.0;
    uint64_t made = 0;
    uint64_t needed = 0;
};

struct PlanSummary {
    std::vector<SummaryRow> rows;   // First-occurrence order of the requests
    // Sums of uint32_t quantities; 64 bits so they cannot wrap
    uint64_t total_made = 0;
    uint64_t total_needed = 0;
    double total_waste = 0.0;
    uint32_t bars_used = 0;         // Bars with at least one cut
    uint32_t bar_count = 0;

    uint64_t deficit() const {
        return total_needed > total_made ? total_needed - total_made : 0;
    }
    bool complete() const { return deficit() == 0; }
};

// Lengths are matched with a relative tolerance since they may have been
// through a unit round-trip.
bool same_length(double a, double b, double relative_tolerance = 1e-9);

// Reduce a plan sequence against the requests it was computed from.
// Requests and plans must be in the same unit.
PlanSummary summarize(const std::vector<CutRequest>& requests,
                      const std::vector<CutPlan>& plans);

}  // namespace cutplan

#endif // CUTPLAN_PLAN_PLAN_SUMMARY_HPP
