#ifndef CUTPLAN_JOB_CUT_JOB_HPP
#define CUTPLAN_JOB_CUT_JOB_HPP

#include <plan/cut_request.hpp>
#include <plan/plan_summary.hpp>
#include <units/unit.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace cutplan {

// Everything a user enters for one planning run, in the units they chose.
// Stock and cut lengths share length_unit; the kerf has its own unit.
struct CutJob {
    uint32_t stock_count = 25;
    double stock_length = 2000.0;
    Unit length_unit = Unit::Millimeter;
    double kerf_width = 3.2;
    Unit kerf_unit = Unit::Millimeter;
    std::vector<CutRequest> cuts = {CutRequest{1500.0, 6}};

    // A job with no cut requests and zero kerf
    static CutJob empty() {
        CutJob job;
        job.kerf_width = 0.0;
        job.cuts.clear();
        return job;
    }
};

struct ClampResult {
    CutJob job;
    std::vector<std::string> notes;  // One entry per coerced value
};

// Coerce out-of-range values the way the input form does: non-finite
// numbers become 0, then non-positive counts and lengths become 1 and a
// negative kerf becomes 0.
ClampResult clamp_job(const CutJob& job);

// Indices of requests longer than the stock bar; they can never be placed
std::vector<size_t> oversized_cuts(const CutJob& job);

// Kerf expressed in the job's length unit
double kerf_in_display_unit(const CutJob& job);

struct JobResult {
    CutJob job;                          // The clamped job actually planned
    std::vector<CutPlan> plans;          // Exactly job.stock_count, in length_unit
    PlanSummary summary;
    std::vector<std::string> warnings;   // Clamping notes and oversize warnings
};

// clamp -> normalise -> allocate -> denormalise -> summarise
JobResult plan_job(const CutJob& job);

}  // namespace cutplan

#endif // CUTPLAN_JOB_CUT_JOB_HPP
