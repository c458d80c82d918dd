#pragma once
/*
================================================================================
Fragment 4.0 — Analysis: Cost Pipeline
FILE: cpp/engine/analysis/cost_pipeline.hpp

One pass of derived quantities -> direct works -> indirect waterfall ->
cashflow. Shared by the top-level calculation and by every sensitivity
branch, so both see identical arithmetic.
================================================================================
*/

#include <vector>

#include "engine/core/inputs.hpp"
#include "engine/core/results.hpp"

namespace mcc::analysis {

struct CostPipeline {
  DerivedQuantities derived;
  std::vector<LineItemCost> line_items;  // direct items, then indirect items
  double direct_works_cost = 0.0;
  double indirect_costs = 0.0;
  double total_nominal_cost = 0.0;
  std::vector<AnnualCashflow> cashflows;

  // Final cumulative discounted cost (0 when there are no cashflow years).
  double npv() const noexcept {
    return cashflows.empty() ? 0.0 : cashflows.back().cumulative_discounted;
  }
};

CostPipeline run_cost_pipeline(const InputState& in);

} // namespace mcc::analysis
