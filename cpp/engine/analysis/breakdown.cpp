#include "engine/analysis/breakdown.hpp"

#include <algorithm>
#include <array>

#include "engine/core/safe_math.hpp"

namespace mcc::analysis {

std::vector<PhaseCostSummary> calculate_phase_breakdown(const std::vector<LineItemCost>& items,
                                                        double total_cost) {
  PhaseTable<double> totals;
  for (const auto& li : items) totals[li.phase] += li.subtotal;

  std::vector<PhaseCostSummary> out;
  out.reserve(kPhaseCount);
  for (ClosurePhase p : kAllPhases) {
    out.push_back(PhaseCostSummary{p, totals[p], percent_of(totals[p], total_cost)});
  }
  return out;
}

std::vector<CategoryCostSummary> calculate_category_breakdown(
    const std::vector<LineItemCost>& items, double total_cost) {
  std::array<double, kCategoryCount> totals{};
  for (const auto& li : items) totals[category_index(li.category)] += li.subtotal;

  std::vector<CategoryCostSummary> out;
  for (std::size_t i = 0; i < kCategoryCount; ++i) {
    if (totals[i] > 0.0) {
      out.push_back(CategoryCostSummary{static_cast<CostCategory>(i), totals[i],
                                        percent_of(totals[i], total_cost)});
    }
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const CategoryCostSummary& a, const CategoryCostSummary& b) {
                     return a.total_cost > b.total_cost;
                   });
  return out;
}

double category_total(const std::vector<LineItemCost>& items, CostCategory c) noexcept {
  double total = 0.0;
  for (const auto& li : items) {
    if (li.category == c) total += li.subtotal;
  }
  return total;
}

} // namespace mcc::analysis
