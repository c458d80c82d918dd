#pragma once

#include <string>
#include <utility>
#include <vector>

#include "engine/core/results.hpp"

namespace mcc::costing {

// Builds a line item with subtotal = quantity * unit_rate.
inline LineItemCost make_line_item(CostCategory category,
                                   std::string description,
                                   double quantity,
                                   std::string unit,
                                   double unit_rate,
                                   ClosurePhase phase) {
  LineItemCost li;
  li.category = category;
  li.description = std::move(description);
  li.quantity = quantity;
  li.unit = std::move(unit);
  li.unit_rate = unit_rate;
  li.subtotal = quantity * unit_rate;
  li.phase = phase;
  return li;
}

inline double sum_subtotals(const std::vector<LineItemCost>& items) noexcept {
  double total = 0.0;
  for (const auto& li : items) total += li.subtotal;
  return total;
}

} // namespace mcc::costing
