#pragma once
/*
================================================================================
Fragment 4.1 — Analysis: Breakdown Aggregator
FILE: cpp/engine/analysis/breakdown.hpp

Phase breakdown:    one entry per phase in phase order, zero-cost phases
                    included (0%).
Category breakdown: zero-value categories omitted, sorted by total cost
                    descending.

The asymmetry is intentional. Percentages are of `total_cost`; a zero total
yields 0%.
================================================================================
*/

#include <vector>

#include "engine/core/results.hpp"

namespace mcc::analysis {

std::vector<PhaseCostSummary> calculate_phase_breakdown(const std::vector<LineItemCost>& items,
                                                        double total_cost);

std::vector<CategoryCostSummary> calculate_category_breakdown(
    const std::vector<LineItemCost>& items, double total_cost);

// Sum of subtotals for one category.
double category_total(const std::vector<LineItemCost>& items, CostCategory c) noexcept;

} // namespace mcc::analysis
