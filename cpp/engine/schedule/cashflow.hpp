#pragma once
/*
================================================================================
Fragment 3.2 — Schedule: Cashflow Distributor (Spread, Escalate, Discount)
FILE: cpp/engine/schedule/cashflow.hpp

For total duration D, builds D + 1 yearly buckets (relative years 0..D).

Spreading:
  - phase duration p > 0: subtotal / p into each of the p years starting at
    the phase start year (years outside [0, D] are dropped).
  - p == 0: the whole subtotal lands in the start year.

Per relative year y:
  nominal    = sum of phase contributions
  escalated  = nominal * (1 + e)^y
  discounted = escalated / (1 + r)^y
  cumulative nominal/discounted are running sums in year order.
  year label = closure_start_year + y

The discount-rate mode does not alter r (see DESIGN.md, open questions).
================================================================================
*/

#include <vector>

#include "engine/core/inputs.hpp"
#include "engine/core/results.hpp"
#include "engine/schedule/phase_schedule.hpp"

namespace mcc::schedule {

// Nominal per-phase allocation of line items into relative years 0..D.
std::vector<PhaseTable<double>> allocate_to_years(const std::vector<LineItemCost>& items,
                                                  const PhaseDurations& durations,
                                                  const PhaseSchedule& schedule);

std::vector<AnnualCashflow> calculate_annual_cashflows(const std::vector<LineItemCost>& items,
                                                       const InputState& in);

} // namespace mcc::schedule
