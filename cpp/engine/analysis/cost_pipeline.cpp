#include "engine/analysis/cost_pipeline.hpp"

#include <utility>

#include "engine/costing/derived_quantities.hpp"
#include "engine/costing/direct_works.hpp"
#include "engine/costing/indirect_costs.hpp"
#include "engine/costing/line_items.hpp"
#include "engine/schedule/cashflow.hpp"

namespace mcc::analysis {

CostPipeline run_cost_pipeline(const InputState& in) {
  CostPipeline p;
  p.derived = costing::calculate_derived_quantities(in);

  std::vector<LineItemCost> direct = costing::calculate_direct_works_costs(in, p.derived);
  p.direct_works_cost = costing::sum_subtotals(direct);

  std::vector<LineItemCost> indirect =
      costing::calculate_indirect_costs(p.direct_works_cost, in, p.derived);
  p.indirect_costs = costing::sum_subtotals(indirect);

  p.line_items = std::move(direct);
  p.line_items.insert(p.line_items.end(), indirect.begin(), indirect.end());
  p.total_nominal_cost = p.direct_works_cost + p.indirect_costs;

  p.cashflows = schedule::calculate_annual_cashflows(p.line_items, in);
  return p;
}

} // namespace mcc::analysis
