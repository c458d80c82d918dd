#include "engine/schedule/cashflow.hpp"

#include <cmath>
#include <cstddef>

#include "engine/core/units.hpp"

namespace mcc::schedule {

namespace {

bool in_horizon(int year, int total) noexcept { return year >= 0 && year <= total; }

}  // namespace

std::vector<PhaseTable<double>> allocate_to_years(const std::vector<LineItemCost>& items,
                                                  const PhaseDurations& durations,
                                                  const PhaseSchedule& schedule) {
  const int total = schedule.total_duration_years;
  std::vector<PhaseTable<double>> years(static_cast<std::size_t>(total) + 1);

  for (const auto& item : items) {
    const int start = schedule.start_year[item.phase];
    const int span = durations[item.phase];

    if (span > 0) {
      const double annual = item.subtotal / static_cast<double>(span);
      for (int k = 0; k < span; ++k) {
        const int y = start + k;
        if (in_horizon(y, total)) years[static_cast<std::size_t>(y)][item.phase] += annual;
      }
    } else if (in_horizon(start, total)) {
      years[static_cast<std::size_t>(start)][item.phase] += item.subtotal;
    }
  }
  return years;
}

std::vector<AnnualCashflow> calculate_annual_cashflows(const std::vector<LineItemCost>& items,
                                                       const InputState& in) {
  const PhaseSchedule schedule = build_phase_schedule(in.phase_durations);
  const std::vector<PhaseTable<double>> allocation =
      allocate_to_years(items, in.phase_durations, schedule);

  const double escalation = units::pct_to_frac(in.financial.escalation_rate_percent);
  const double discount = units::pct_to_frac(in.financial.discount_rate_percent);

  std::vector<AnnualCashflow> out;
  out.reserve(allocation.size());

  double cumulative_nominal = 0.0;
  double cumulative_discounted = 0.0;

  for (std::size_t i = 0; i < allocation.size(); ++i) {
    const double y = static_cast<double>(i);

    AnnualCashflow cf;
    cf.year = in.financial.closure_start_year + static_cast<int>(i);
    cf.phase_costs = allocation[i];
    for (ClosurePhase p : kAllPhases) cf.nominal_cost += cf.phase_costs[p];

    cf.escalated_cost = cf.nominal_cost * std::pow(1.0 + escalation, y);
    cf.discounted_cost = cf.escalated_cost / std::pow(1.0 + discount, y);

    cumulative_nominal += cf.nominal_cost;
    cumulative_discounted += cf.discounted_cost;
    cf.cumulative_nominal = cumulative_nominal;
    cf.cumulative_discounted = cumulative_discounted;

    out.push_back(cf);
  }
  return out;
}

} // namespace mcc::schedule
