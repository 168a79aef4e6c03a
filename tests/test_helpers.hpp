#ifndef CUTPLAN_TEST_HELPERS_HPP
#define CUTPLAN_TEST_HELPERS_HPP

#include <plan/cut_request.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <numeric>
#include <vector>

namespace cutplan {
namespace test {

// Check sum(cuts) + kerf * |cuts| + waste == stock for every bar
inline void expect_conserved(const std::vector<CutPlan>& plans,
                             double stock_length, double kerf) {
    for (size_t i = 0; i < plans.size(); ++i) {
        const auto& plan = plans[i];
        double used = std::accumulate(plan.cuts.begin(), plan.cuts.end(), 0.0);
        double total = used + kerf * static_cast<double>(plan.cuts.size()) + plan.waste;
        EXPECT_NEAR(total, stock_length, 1e-6 * stock_length) << "bar " << (i + 1);
        EXPECT_GE(plan.waste, -1e-9) << "bar " << (i + 1);
    }
}

// Number of placed pieces of the given length across all bars
inline size_t count_cuts(const std::vector<CutPlan>& plans, double length) {
    size_t count = 0;
    for (const auto& plan : plans) {
        for (double cut : plan.cuts) {
            if (cut == length) {
                ++count;
            }
        }
    }
    return count;
}

// A mixed workload used by several property checks
inline std::vector<CutRequest> mixed_requests() {
    return {
        {850.0, 3},
        {420.5, 7},
        {1200.0, 2},
        {95.25, 12},
        {420.5, 1},
        {2600.0, 1},   // Longer than the stock used in the tests
        {300.0, 0},
    };
}

}  // namespace test
}  // namespace cutplan

#endif // CUTPLAN_TEST_HELPERS_HPP
