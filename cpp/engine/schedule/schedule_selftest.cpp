/*
  Fragment 3.9 — Schedule Selftest

  Checks phase start years under the overlap model, total duration, yearly
  spreading of line items (including zero-duration phases) and the
  escalation / discount arithmetic of the cashflow distributor.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string_view>
#include <vector>

#include "engine/core/inputs.hpp"
#include "engine/core/safe_math.hpp"
#include "engine/costing/line_items.hpp"
#include "engine/schedule/cashflow.hpp"
#include "engine/schedule/phase_schedule.hpp"

namespace mcc {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_eq_int(int a, int b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  got " << a << ", expected " << b << "\n";
  } else {
    pass(msg);
  }
}

void expect_near(double a, double b, std::string_view msg) {
  if (!near(a, b, 1e-12, 1e-6)) {
    fail(msg);
    std::cerr << "  got " << a << ", expected " << b << "\n";
  } else {
    pass(msg);
  }
}

PhaseDurations durations(PhaseTable<int> years) {
  PhaseDurations d;
  d.years = years;
  return d;
}

LineItemCost item(ClosurePhase phase, double subtotal) {
  return costing::make_line_item(CostCategory::Mobilisation, "test", 1.0, "lump sum", subtotal, phase);
}

void test_reference_starts() {
  const PhaseDurations d;  // 2,2,3,3,10,3,15,2
  using P = ClosurePhase;
  expect_eq_int(schedule::phase_start_year(P::PlanningApprovals, d), 0, "planning starts at 0");
  expect_eq_int(schedule::phase_start_year(P::DecommissioningDemolition, d), 2, "decommissioning after planning");
  expect_eq_int(schedule::phase_start_year(P::EarthworksLandform, d), 4, "earthworks after decommissioning");
  expect_eq_int(schedule::phase_start_year(P::TailingsWRDRehabilitation, d), 4, "TSF/WRD parallel with earthworks");
  expect_eq_int(schedule::phase_start_year(P::WaterManagement, d), 4, "water starts with earthworks");
  expect_eq_int(schedule::phase_start_year(P::RevegetationEcosystem, d), 7, "revegetation after landform");
  expect_eq_int(schedule::phase_start_year(P::MonitoringMaintenance, d), 10, "monitoring after revegetation");
  expect_eq_int(schedule::phase_start_year(P::RelinquishmentPostClosure, d), 25, "relinquishment after max(W, M)");
  expect_eq_int(schedule::total_duration_years(d), 27, "reference total duration");

  const schedule::PhaseSchedule s = schedule::build_phase_schedule(d);
  bool same = s.total_duration_years == 27;
  for (ClosurePhase p : kAllPhases) {
    if (s.start_year[p] != schedule::phase_start_year(p, d)) same = false;
  }
  expect_true(same, "build_phase_schedule agrees with the individual functions");
}

void test_overlap_cases() {
  using P = ClosurePhase;
  {
    // TSF/WRD longer than earthworks: revegetation waits for the longer one.
    const PhaseDurations d = durations({{1, 1, 2, 6, 1, 1, 1, 1}});
    expect_eq_int(schedule::phase_start_year(P::RevegetationEcosystem, d), 8, "landform end uses max(E, T)");
    expect_eq_int(schedule::total_duration_years(d), 1 + 1 + 6 + 1 + 1 + 1, "total with T > E");
  }
  {
    // Water longer than monitoring: relinquishment waits for water.
    const PhaseDurations d = durations({{2, 2, 3, 3, 30, 3, 5, 2}});
    expect_eq_int(schedule::phase_start_year(P::RelinquishmentPostClosure, d), 2 + 2 + 3 + 3 + 30,
                  "long water track delays relinquishment");
    expect_eq_int(schedule::total_duration_years(d), 42, "total with W > M");
  }
  {
    const PhaseDurations d = durations({{0, 0, 0, 0, 0, 0, 0, 0}});
    expect_eq_int(schedule::total_duration_years(d), 0, "all-zero durations -> total 0");
    for (ClosurePhase p : kAllPhases) {
      if (schedule::phase_start_year(p, d) != 0) fail("all-zero durations -> every start 0");
    }
  }
}

void test_spreading() {
  const PhaseDurations d = durations({{2, 0, 4, 4, 0, 1, 1, 1}});
  const schedule::PhaseSchedule s = schedule::build_phase_schedule(d);

  std::vector<LineItemCost> items = {
      item(ClosurePhase::PlanningApprovals, 100.0),
      item(ClosurePhase::DecommissioningDemolition, 50.0),  // zero duration
      item(ClosurePhase::EarthworksLandform, 400.0),
  };
  const auto years = schedule::allocate_to_years(items, d, s);

  expect_eq_int(static_cast<int>(years.size()), s.total_duration_years + 1, "D + 1 buckets");
  expect_near(years[0][ClosurePhase::PlanningApprovals], 50.0, "planning spread year 0");
  expect_near(years[1][ClosurePhase::PlanningApprovals], 50.0, "planning spread year 1");
  expect_near(years[2][ClosurePhase::DecommissioningDemolition], 50.0,
              "zero-duration phase lands whole in its start year");
  for (int y = 2; y < 6; ++y) {
    if (!near(years[static_cast<std::size_t>(y)][ClosurePhase::EarthworksLandform], 100.0)) {
      fail("earthworks spread evenly over four years");
    }
  }

  double total = 0.0;
  for (const auto& t : years) {
    for (ClosurePhase p : kAllPhases) total += t[p];
  }
  expect_near(total, 550.0, "spreading conserves the subtotal sum");
}

void test_escalation_and_discount() {
  InputState in = default_input_state();
  in.phase_durations = durations({{3, 0, 0, 0, 0, 0, 0, 0}});
  in.financial.closure_start_year = 2030;
  in.financial.escalation_rate_percent = 10.0;
  in.financial.discount_rate_percent = 5.0;

  const std::vector<LineItemCost> items = {item(ClosurePhase::PlanningApprovals, 300.0)};
  const auto cfs = schedule::calculate_annual_cashflows(items, in);

  expect_eq_int(static_cast<int>(cfs.size()), 4, "total 3 -> 4 buckets");
  if (cfs.size() != 4) return;
  expect_eq_int(cfs[0].year, 2030, "year label 0");
  expect_eq_int(cfs[3].year, 2033, "year label 3");
  expect_near(cfs[0].escalated_cost, 100.0, "no escalation in year 0");
  expect_near(cfs[2].escalated_cost, 100.0 * 1.1 * 1.1, "escalated = nominal (1+e)^y");
  expect_near(cfs[2].discounted_cost, 100.0 * 1.1 * 1.1 / (1.05 * 1.05), "discounted = escalated / (1+r)^y");
  expect_near(cfs[3].nominal_cost, 0.0, "trailing year is empty");
  expect_near(cfs[3].cumulative_nominal, 300.0, "cumulative nominal");
  expect_near(cfs[3].cumulative_discounted,
              100.0 + 100.0 * 1.1 / 1.05 + 100.0 * 1.21 / (1.05 * 1.05), "cumulative discounted");
  expect_near(cfs[1].phase_costs[ClosurePhase::PlanningApprovals], 100.0, "phase columns carried");

  in.financial.escalation_rate_percent = 0.0;
  in.financial.discount_rate_percent = 0.0;
  const auto flat = schedule::calculate_annual_cashflows(items, in);
  expect_near(flat.back().cumulative_discounted, flat.back().cumulative_nominal,
              "zero rates -> discounted equals nominal");

  in.financial.escalation_rate_percent = 3.0;
  in.financial.discount_rate_percent = 7.0;
  in.financial.discount_rate_mode = DiscountRateMode::Real;
  const auto real = schedule::calculate_annual_cashflows(items, in);
  in.financial.discount_rate_mode = DiscountRateMode::Nominal;
  const auto nominal = schedule::calculate_annual_cashflows(items, in);
  expect_true(real == nominal, "discount mode does not change the arithmetic");
}

}  // namespace
}  // namespace mcc

int main() {
  using namespace mcc;

  test_reference_starts();
  test_overlap_cases();
  test_spreading();
  test_escalation_and_discount();

  if (g_fail_count != 0) {
    std::cerr << "\nFAILED: " << g_fail_count << " check(s) failed.\n";
    return 1;
  }
  std::cerr << "\nPASS: schedule selftest\n";
  return 0;
}
