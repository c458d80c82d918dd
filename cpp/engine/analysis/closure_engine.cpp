#include "engine/analysis/closure_engine.hpp"

#include <sstream>
#include <utility>

#include "engine/analysis/breakdown.hpp"
#include "engine/analysis/cost_pipeline.hpp"
#include "engine/analysis/sensitivity.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/safe_math.hpp"
#include "engine/schedule/phase_schedule.hpp"

namespace mcc::analysis {

Results calculate_closure_costs(const InputState& in, const SensitivityConfig& sensitivity) {
  CostPipeline p = run_cost_pipeline(in);

  Results r;
  r.derived = p.derived;
  r.direct_works_cost = p.direct_works_cost;
  r.indirect_costs = p.indirect_costs;
  r.total_nominal_cost = p.total_nominal_cost;
  r.total_discounted_cost = p.npv();

  // Peak: first strictly-largest year.
  r.peak_annual_cashflow = 0.0;
  r.peak_cashflow_year = in.financial.closure_start_year;
  for (const auto& cf : p.cashflows) {
    if (cf.nominal_cost > r.peak_annual_cashflow) {
      r.peak_annual_cashflow = cf.nominal_cost;
      r.peak_cashflow_year = cf.year;
    }
  }

  r.phase_breakdown = calculate_phase_breakdown(p.line_items, r.total_nominal_cost);
  r.category_breakdown = calculate_category_breakdown(p.line_items, r.total_nominal_cost);
  r.sensitivity = calculate_sensitivity(in, sensitivity);
  r.monitoring_cost_share =
      percent_of(category_total(p.line_items, CostCategory::Monitoring), r.total_nominal_cost);
  r.total_duration_years = schedule::total_duration_years(in.phase_durations);

  r.line_items = std::move(p.line_items);
  r.annual_cashflows = std::move(p.cashflows);

  if (get_log_level() <= LogLevel::DEBUG) {
    std::ostringstream oss;
    oss << "closure costs '" << in.scenario_name << "': items=" << r.line_items.size()
        << " total=" << r.total_nominal_cost << " npv=" << r.total_discounted_cost
        << " years=" << r.annual_cashflows.size();
    log(LogLevel::DEBUG, oss.str());
  }
  return r;
}

} // namespace mcc::analysis
