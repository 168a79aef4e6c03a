#ifndef CUTPLAN_PLAN_CUT_REQUEST_HPP
#define CUTPLAN_PLAN_CUT_REQUEST_HPP

#include <cstdint>
#include <vector>

namespace cutplan {

// One distinct piece type to produce
struct CutRequest {
    double length = 0.0;
    uint32_t quantity = 0;
};

// Physical bar length and the number of bars available
struct StockSpecification {
    double length = 0.0;
    uint32_t max_bars = 1;
};

// Material lost per placed cut. Charged to every cut, including the last
// one on a bar, so reported waste is slightly conservative.
struct Kerf {
    double width = 0.0;
};

// Result for a single stock bar.
// sum(cuts) + kerf * cuts.size() + waste == stock length
struct CutPlan {
    std::vector<double> cuts;   // Nominal piece lengths, in cut order
    double waste = 0.0;

    bool empty() const { return cuts.empty(); }
};

}  // namespace cutplan

#endif // CUTPLAN_PLAN_CUT_REQUEST_HPP
