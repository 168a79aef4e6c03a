#ifndef CUTPLAN_PLAN_ALLOCATOR_HPP
#define CUTPLAN_PLAN_ALLOCATOR_HPP

#include "cut_request.hpp"
#include <string>
#include <vector>

namespace cutplan {

// Greedy largest-piece-first allocation of cut requests to stock bars.
//
// All lengths are in canonical units. Requests are ordered once by
// effective length (length + kerf), descending, ties kept in input order,
// and that order is reused for every bar. Each bar takes as many pieces of
// each request as still fit before moving to the next request.
//
// Always returns exactly stock.max_bars plans; bars opened after all demand
// is satisfied are empty with waste == stock.length. Requests that never
// fit are left unsatisfied without error. The caller's requests are not
// modified.
//
// Inputs are not re-validated; out-of-contract values give meaningless
// numbers rather than an error. Use compute_plan_checked to reject them.
std::vector<CutPlan> compute_plan(const StockSpecification& stock,
                                  const Kerf& kerf,
                                  const std::vector<CutRequest>& requests);

// Describe every violated precondition (empty when the inputs are valid)
std::vector<std::string> check_preconditions(const StockSpecification& stock,
                                             const Kerf& kerf,
                                             const std::vector<CutRequest>& requests);

// compute_plan, but throws std::invalid_argument listing the violations
// when check_preconditions reports any.
std::vector<CutPlan> compute_plan_checked(const StockSpecification& stock,
                                          const Kerf& kerf,
                                          const std::vector<CutRequest>& requests);

}  // namespace cutplan

#endif // CUTPLAN_PLAN_ALLOCATOR_HPP
