#include "cut_job.hpp"
#include <common/logging.hpp>
#include <plan/allocator.hpp>
#include <cmath>
#include <sstream>
#include <utility>

namespace cutplan {

namespace {

double finite_or_zero(double value) {
    return std::isfinite(value) ? value : 0.0;
}

}  // namespace

ClampResult clamp_job(const CutJob& job) {
    ClampResult result{job, {}};
    CutJob& out = result.job;

    if (out.stock_count < 1) {
        out.stock_count = 1;
        result.notes.push_back("stock count raised to 1");
    }

    out.stock_length = finite_or_zero(out.stock_length);
    if (out.stock_length <= 0.0) {
        std::ostringstream oss;
        oss << "stock length " << out.stock_length << " raised to 1"
            << unit_suffix(out.length_unit);
        result.notes.push_back(oss.str());
        out.stock_length = 1.0;
    }

    if (!std::isfinite(out.kerf_width)) {
        result.notes.push_back("kerf width is not a number, using 0");
        out.kerf_width = 0.0;
    }
    if (out.kerf_width < 0.0) {
        std::ostringstream oss;
        oss << "kerf width " << out.kerf_width << " raised to 0";
        result.notes.push_back(oss.str());
        out.kerf_width = 0.0;
    }

    for (size_t i = 0; i < out.cuts.size(); ++i) {
        auto& cut = out.cuts[i];
        cut.length = finite_or_zero(cut.length);
        if (cut.length <= 0.0) {
            std::ostringstream oss;
            oss << "cut " << (i + 1) << ": length " << cut.length << " raised to 1"
                << unit_suffix(out.length_unit);
            result.notes.push_back(oss.str());
            cut.length = 1.0;
        }
    }

    return result;
}

std::vector<size_t> oversized_cuts(const CutJob& job) {
    std::vector<size_t> indices;
    double stock_mm = to_canonical(job.stock_length, job.length_unit);
    for (size_t i = 0; i < job.cuts.size(); ++i) {
        if (to_canonical(job.cuts[i].length, job.length_unit) > stock_mm) {
            indices.push_back(i);
        }
    }
    return indices;
}

double kerf_in_display_unit(const CutJob& job) {
    return convert_length(job.kerf_width, job.kerf_unit, job.length_unit);
}

JobResult plan_job(const CutJob& input) {
    auto log = logging::get_logger();

    ClampResult clamped = clamp_job(input);
    JobResult result;
    result.job = clamped.job;
    result.warnings = clamped.notes;

    const CutJob& job = result.job;
    for (const auto& note : clamped.notes) {
        log->warn("Input clamped: {}", note);
    }

    for (size_t index : oversized_cuts(job)) {
        std::ostringstream oss;
        oss << "cut " << (index + 1) << ": "
            << format_length(job.cuts[index].length, job.length_unit)
            << " exceeds stock length "
            << format_length(job.stock_length, job.length_unit);
        log->warn("{}", oss.str());
        result.warnings.push_back(oss.str());
    }

    // Normalise the two unit systems independently
    StockSpecification stock{to_canonical(job.stock_length, job.length_unit),
                             job.stock_count};
    Kerf kerf{to_canonical(job.kerf_width, job.kerf_unit)};

    std::vector<CutRequest> requests;
    requests.reserve(job.cuts.size());
    for (const auto& cut : job.cuts) {
        requests.push_back(CutRequest{to_canonical(cut.length, job.length_unit),
                                      cut.quantity});
    }

    log->debug("Planning {} requests: stock {}mm x {}, kerf {}mm",
               requests.size(), stock.length, stock.max_bars, kerf.width);

    std::vector<CutPlan> canonical = compute_plan_checked(stock, kerf, requests);

    // Back to the display unit. Cut lengths are taken from the request
    // as entered so they compare equal to it exactly.
    result.plans.reserve(canonical.size());
    for (const auto& plan : canonical) {
        CutPlan display;
        display.cuts.reserve(plan.cuts.size());
        for (double cut : plan.cuts) {
            double value = from_canonical(cut, job.length_unit);
            for (const auto& request : job.cuts) {
                if (same_length(request.length, value)) {
                    value = request.length;
                    break;
                }
            }
            display.cuts.push_back(value);
        }
        display.waste = from_canonical(plan.waste, job.length_unit);
        result.plans.push_back(std::move(display));
    }

    result.summary = summarize(job.cuts, result.plans);

    if (!result.summary.complete()) {
        log->warn("Plan is short by {} of {} pieces",
                  result.summary.deficit(), result.summary.total_needed);
    }
    log->debug("Planned {} cuts on {} of {} bars, total waste {}",
               result.summary.total_made, result.summary.bars_used,
               result.summary.bar_count, result.summary.total_waste);

    return result;
}

}  // namespace cutplan
