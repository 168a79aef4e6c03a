#include "allocator.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace cutplan {

namespace {

struct WorkingCut {
    double length;            // Nominal length, recorded on the bar
    double effective_length;  // Stock consumed per piece (length + kerf)
    uint32_t quantity;        // Pieces still to place
};

std::vector<WorkingCut> build_working_list(const Kerf& kerf,
                                           const std::vector<CutRequest>& requests) {
    std::vector<WorkingCut> working;
    working.reserve(requests.size());
    for (const auto& request : requests) {
        working.push_back(WorkingCut{request.length,
                                     request.length + kerf.width,
                                     request.quantity});
    }

    std::stable_sort(working.begin(), working.end(),
        [](const WorkingCut& a, const WorkingCut& b) {
            return a.effective_length > b.effective_length;
        });
    return working;
}

bool has_demand(const std::vector<WorkingCut>& working) {
    return std::any_of(working.begin(), working.end(),
                       [](const WorkingCut& c) { return c.quantity > 0; });
}

}  // namespace

std::vector<CutPlan> compute_plan(const StockSpecification& stock,
                                  const Kerf& kerf,
                                  const std::vector<CutRequest>& requests) {
    auto log = logging::get_logger();

    std::vector<WorkingCut> working = build_working_list(kerf, requests);

    std::vector<CutPlan> plans;
    plans.reserve(stock.max_bars);

    log->debug("Allocator: {} requests onto {} bars of {}, kerf {}",
               requests.size(), stock.max_bars, stock.length, kerf.width);

    uint32_t bar = 0;
    while (bar < stock.max_bars && has_demand(working)) {
        CutPlan plan;
        double remaining = stock.length;

        for (auto& cut : working) {
            while (cut.quantity > 0 && remaining >= cut.effective_length) {
                plan.cuts.push_back(cut.length);
                remaining -= cut.effective_length;
                cut.quantity--;
            }
        }

        plan.waste = remaining;
        log->debug("Allocator: bar {} - {} cuts, waste={}",
                   bar + 1, plan.cuts.size(), plan.waste);
        plans.push_back(std::move(plan));
        ++bar;
    }

    // Pad with untouched bars
    while (bar < stock.max_bars) {
        plans.push_back(CutPlan{{}, stock.length});
        ++bar;
    }

    uint64_t unplaced = 0;
    for (const auto& cut : working) {
        unplaced += cut.quantity;
    }
    if (unplaced > 0) {
        log->debug("Allocator: {} requested pieces left unplaced", unplaced);
    }

    return plans;
}

std::vector<std::string> check_preconditions(const StockSpecification& stock,
                                             const Kerf& kerf,
                                             const std::vector<CutRequest>& requests) {
    std::vector<std::string> problems;

    if (!std::isfinite(stock.length) || stock.length <= 0.0) {
        problems.push_back("stock length must be positive");
    }
    if (stock.max_bars < 1) {
        problems.push_back("at least one stock bar is required");
    }
    if (!std::isfinite(kerf.width) || kerf.width < 0.0) {
        problems.push_back("kerf width must not be negative");
    }
    for (size_t i = 0; i < requests.size(); ++i) {
        if (!std::isfinite(requests[i].length) || requests[i].length <= 0.0) {
            std::ostringstream oss;
            oss << "cut " << (i + 1) << ": length must be positive";
            problems.push_back(oss.str());
        }
    }

    return problems;
}

std::vector<CutPlan> compute_plan_checked(const StockSpecification& stock,
                                          const Kerf& kerf,
                                          const std::vector<CutRequest>& requests) {
    auto problems = check_preconditions(stock, kerf, requests);
    if (!problems.empty()) {
        std::ostringstream oss;
        oss << "Invalid plan inputs: ";
        for (size_t i = 0; i < problems.size(); ++i) {
            if (i > 0) oss << "; ";
            oss << problems[i];
        }
        throw std::invalid_argument(oss.str());
    }
    return compute_plan(stock, kerf, requests);
}

}  // namespace cutplan
