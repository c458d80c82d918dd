/*
  Fragment 4.9 — Closure Engine Selftest

  Objective
  ---------
  End-to-end checks of calculate_closure_costs():
    1) Reference scenario headline numbers and conservation (cashflows sum to
       the nominal total, breakdowns sum to 100%).
    2) Scenario properties: no TSF, no water treatment, high risk, discount
       rate monotonicity, zero rates.
    3) Breakdown asymmetry (all phases listed, zero categories omitted, sorted).
    4) Sensitivity ordering, zero-base skip, low <= high.
    5) Peak year, monitoring share, determinism.
    6) Presets pass validation; validation rejects out-of-range input.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/analysis/breakdown.hpp"
#include "engine/analysis/closure_engine.hpp"
#include "engine/analysis/sensitivity.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/inputs.hpp"
#include "engine/core/presets.hpp"
#include "engine/core/safe_math.hpp"

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

void expect_near(double a, double b, double tol, std::string_view msg) {
  if (std::fabs(a - b) > tol) {
    fail(msg);
    std::cerr << "  got " << a << ", expected " << b << " (tol " << tol << ")\n";
  } else {
    pass(msg);
  }
}

bool has_category(const Results& r, CostCategory c) {
  for (const auto& li : r.line_items) {
    if (li.category == c) return true;
  }
  return false;
}

double cashflow_sum(const Results& r) {
  double s = 0.0;
  for (const auto& cf : r.annual_cashflows) s += cf.nominal_cost;
  return s;
}

void set_all_risk(InputState& in, double v) {
  in.risk_factors.contamination_uncertainty = v;
  in.risk_factors.geotech_uncertainty = v;
  in.risk_factors.water_quality_uncertainty = v;
  in.risk_factors.regulatory_uncertainty = v;
  in.risk_factors.logistics_complexity = v;
}

template <typename Fn>
bool throws_validation(Fn fn) {
  try {
    fn();
  } catch (const ValidationError&) {
    return true;
  }
  return false;
}

void test_reference_scenario() {
  const InputState in = default_input_state();
  const Results r = analysis::calculate_closure_costs(in);

  expect_near(r.direct_works_cost, 118100000.0, 1e-3, "reference direct works");
  expect_near(r.indirect_costs, 68284475.2, 1e-3, "reference indirect costs");
  expect_near(r.total_nominal_cost, 186384475.2, 1e-3, "reference total nominal");
  expect_true(r.total_nominal_cost > 1000000.0, "total exceeds $1M");
  expect_true(r.total_duration_years > 0 && r.total_duration_years < 100, "duration in (0, 100)");
  expect_true(r.total_duration_years == 27, "reference duration 27 years");
  expect_true(r.annual_cashflows.size() == 28, "D + 1 cashflow years");
  expect_near(cashflow_sum(r), r.total_nominal_cost, 100.0, "cashflows sum to total nominal");
  expect_near(r.total_nominal_cost, r.direct_works_cost + r.indirect_costs, 1e-3,
              "total = direct + indirect");
  expect_true(r.total_discounted_cost < r.total_nominal_cost, "NPV below nominal at 7%");
  expect_near(r.total_discounted_cost, r.annual_cashflows.back().cumulative_discounted, 1e-6,
              "NPV = final cumulative discounted");
  expect_true(r.line_items.size() == 18, "13 direct + 5 indirect line items");
}

void test_breakdowns() {
  const Results r = analysis::calculate_closure_costs(default_input_state());

  expect_true(r.phase_breakdown.size() == kPhaseCount, "phase breakdown lists every phase");
  double phase_pct = 0.0;
  for (const auto& p : r.phase_breakdown) phase_pct += p.percent_of_total;
  expect_near(phase_pct, 100.0, 0.01, "phase percentages sum to 100");

  double cat_pct = 0.0;
  bool positive = true;
  bool sorted = true;
  for (std::size_t i = 0; i < r.category_breakdown.size(); ++i) {
    cat_pct += r.category_breakdown[i].percent_of_total;
    if (r.category_breakdown[i].total_cost <= 0.0) positive = false;
    if (i > 0 && r.category_breakdown[i].total_cost > r.category_breakdown[i - 1].total_cost) sorted = false;
  }
  expect_near(cat_pct, 100.0, 0.01, "category percentages sum to 100");
  expect_true(positive, "zero categories omitted");
  expect_true(sorted, "categories sorted by cost descending");
  expect_true(r.category_breakdown.size() == 17, "17 non-zero categories (no hazardous)");

  // Zero total: percentages are 0, not NaN.
  const auto phases = analysis::calculate_phase_breakdown({}, 0.0);
  bool zeros = phases.size() == kPhaseCount;
  for (const auto& p : phases) {
    if (p.percent_of_total != 0.0 || p.total_cost != 0.0) zeros = false;
  }
  expect_true(zeros, "empty phase breakdown is all zero");
  expect_true(analysis::calculate_category_breakdown({}, 0.0).empty(), "empty category breakdown");
}

void test_tsf_absent() {
  InputState in = default_input_state();
  in.quantities.tsf_area_ha = 0.0;
  in.quantities.tsf_cover_thickness_m = 0.0;
  const Results r = analysis::calculate_closure_costs(in);
  expect_true(!has_category(r, CostCategory::TSFClosure), "no TSF -> TSF closure absent");
  expect_true(has_category(r, CostCategory::WRDRehabilitation) &&
                  has_category(r, CostCategory::Revegetation) &&
                  has_category(r, CostCategory::Monitoring),
              "no TSF leaves other categories");
  expect_true(r.total_nominal_cost > 0.0, "no TSF total still positive");
}

void test_water_absent() {
  InputState in = default_input_state();
  const Results with_water = analysis::calculate_closure_costs(in);
  in.quantities.water_treatment_flow_ml_per_day = 0.0;
  in.quantities.water_treatment_duration_years = 0.0;
  const Results r = analysis::calculate_closure_costs(in);
  expect_true(!has_category(r, CostCategory::WaterTreatmentCapex) &&
                  !has_category(r, CostCategory::WaterTreatmentOpex),
              "no water treatment items");
  expect_true(r.total_nominal_cost < with_water.total_nominal_cost, "no water treatment costs less");
}

void test_high_risk() {
  InputState low = default_input_state();
  set_all_risk(low, 10.0);
  InputState high = default_input_state();
  set_all_risk(high, 80.0);

  const Results rl = analysis::calculate_closure_costs(low);
  const Results rh = analysis::calculate_closure_costs(high);
  expect_true(rh.total_nominal_cost > rl.total_nominal_cost, "high risk raises total");
  expect_near(rh.derived.risk_uplift_percent, 35.0, 1e-9, "all-80 risk -> 35% uplift");
  expect_near(analysis::category_total(rh.line_items, CostCategory::RiskUplift) -
                  analysis::category_total(rl.line_items, CostCategory::RiskUplift),
              rh.total_nominal_cost - rl.total_nominal_cost -
                  (analysis::category_total(rh.line_items, CostCategory::OwnersCosts) -
                   analysis::category_total(rl.line_items, CostCategory::OwnersCosts)),
              1e-3, "risk change flows only through uplift and owner's costs");
}

void test_discounting() {
  InputState in = default_input_state();
  double prev = 0.0;
  bool decreasing = true;
  for (int i = 0; i <= 6; ++i) {
    in.financial.discount_rate_percent = 2.0 * i;
    const double npv = analysis::calculate_closure_costs(in).total_discounted_cost;
    if (i > 0 && !(npv < prev)) decreasing = false;
    prev = npv;
  }
  expect_true(decreasing, "raising discount rate strictly lowers NPV");

  in.financial.discount_rate_percent = 0.0;
  in.financial.escalation_rate_percent = 0.0;
  const Results flat = analysis::calculate_closure_costs(in);
  expect_near(flat.total_discounted_cost, flat.total_nominal_cost, 1.0,
              "zero rates -> NPV equals nominal");
}

void test_sensitivity() {
  const InputState in = default_input_state();
  const auto rows = analysis::calculate_sensitivity(in);

  expect_true(rows.size() == 8, "all eight drivers for the reference scenario");
  bool ordered = true;
  bool low_le_high = true;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    if (i > 0 && std::fabs(rows[i].delta_cost) > std::fabs(rows[i - 1].delta_cost)) ordered = false;
    if (rows[i].low_total_cost > rows[i].high_total_cost) low_le_high = false;
  }
  expect_true(ordered, "sorted by |delta cost| descending");
  expect_true(low_le_high, "low total <= high total");

  for (const auto& s : rows) {
    if (s.driver_key == std::string("discountRate")) {
      expect_near(s.delta_cost, 0.0, 1e-6, "discount rate leaves nominal cost unchanged");
      expect_true(s.delta_npv < 0.0, "higher discount rate lowers NPV");
      expect_near(s.low_value, 6.3, 1e-9, "low = base x 0.9");
      expect_near(s.high_value, 7.7, 1e-9, "high = base x 1.1");
    }
  }

  InputState no_tsf = in;
  no_tsf.quantities.tsf_area_ha = 0.0;
  bool skipped = true;
  for (const auto& s : analysis::calculate_sensitivity(no_tsf)) {
    if (s.driver_key == std::string("tsfArea")) skipped = false;
  }
  expect_true(skipped, "zero-base driver is skipped");

  const auto wide = analysis::calculate_sensitivity(in, 20.0);
  bool wider = !wide.empty();
  for (const auto& s : wide) {
    for (const auto& n : rows) {
      if (n.driver_key == s.driver_key && std::fabs(s.delta_cost) + 1e-6 < std::fabs(n.delta_cost)) {
        wider = false;
      }
    }
  }
  expect_true(wider, "20% variation swings at least as far as 10%");

  bool rejected = false;
  try {
    analysis::calculate_sensitivity(in, -5.0);
  } catch (const ArgumentError&) {
    rejected = true;
  }
  expect_true(rejected, "negative variation rejected");

  bool too_wide = false;
  try {
    analysis::calculate_sensitivity(in, 150.0);
  } catch (const ArgumentError&) {
    too_wide = true;
  }
  expect_true(too_wide, "variation above 100% rejected");

  bool edge_ok = true;
  try {
    const auto flat = analysis::calculate_sensitivity(in, 0.0);
    for (const auto& s : flat) {
      if (std::fabs(s.delta_cost) > 1e-6) edge_ok = false;
    }
  } catch (const MccError&) {
    edge_ok = false;
  }
  expect_true(edge_ok, "0% variation accepted with zero deltas");
}

void test_peak_and_share() {
  const InputState in = default_input_state();
  const Results r = analysis::calculate_closure_costs(in);

  double max_nominal = 0.0;
  int first_year = in.financial.closure_start_year;
  for (const auto& cf : r.annual_cashflows) {
    if (cf.nominal_cost > max_nominal) {
      max_nominal = cf.nominal_cost;
      first_year = cf.year;
    }
  }
  expect_near(r.peak_annual_cashflow, max_nominal, 1e-6, "peak = largest nominal year");
  expect_true(r.peak_cashflow_year == first_year, "peak year = first strictly-largest year");

  expect_near(r.monitoring_cost_share, 7500000.0 / r.total_nominal_cost * 100.0, 1e-9,
              "monitoring share of total");

  InputState empty = in;
  empty.phase_durations.years = PhaseTable<int>{{0, 0, 0, 0, 0, 0, 0, 0}};
  const Results e = analysis::calculate_closure_costs(empty);
  expect_true(e.annual_cashflows.size() == 1, "all-zero durations -> single bucket");
  expect_near(cashflow_sum(e), e.total_nominal_cost, 100.0, "single bucket holds everything");
  expect_true(e.peak_cashflow_year == in.financial.closure_start_year, "single bucket peak year");
}

void test_determinism() {
  const InputState in = default_input_state();
  const Results a = analysis::calculate_closure_costs(in);
  const Results b = analysis::calculate_closure_costs(in);
  expect_true(a == b, "identical inputs -> identical results");
}

void test_presets_and_validation() {
  bool all_valid = true;
  bool all_positive = true;
  for (const auto& p : scenario_presets()) {
    try {
      p.inputs.validate_or_throw();
    } catch (const ValidationError& e) {
      all_valid = false;
      std::cerr << "  " << p.id << ": " << e.what() << "\n";
    }
    if (!(analysis::calculate_closure_costs(p.inputs).total_nominal_cost > 0.0)) all_positive = false;
  }
  expect_true(scenario_presets().size() == 4, "four presets");
  expect_true(all_valid, "presets validate");
  expect_true(all_positive, "presets produce positive totals");
  expect_true(preset_inputs("tsf-dominant").has_value(), "preset lookup by id");
  expect_true(!preset_inputs("no-such-preset").has_value(), "unknown preset -> nullopt");

  bool default_ok = true;
  try {
    default_input_state().validate_or_throw();
  } catch (const ValidationError&) {
    default_ok = false;
  }
  expect_true(default_ok, "reference scenario validates");

  expect_true(throws_validation([] {
                InputState in = default_input_state();
                in.quantities.disturbed_area_ha = -1.0;
                in.validate_or_throw();
              }),
              "negative disturbed area rejected");
  expect_true(throws_validation([] {
                InputState in = default_input_state();
                in.quantities.tsf_cover_thickness_m = std::nan("");
                in.validate_or_throw();
              }),
              "NaN rejected");
  expect_true(throws_validation([] {
                InputState in = default_input_state();
                in.unit_rates.bulking_factor = 2.5;
                in.validate_or_throw();
              }),
              "bulking factor above 2 rejected");
  expect_true(throws_validation([] {
                InputState in = default_input_state();
                in.financial.closure_start_year = 2019;
                in.validate_or_throw();
              }),
              "start year before 2020 rejected");
  expect_true(throws_validation([] {
                InputState in = default_input_state();
                in.phase_durations[ClosurePhase::PlanningApprovals] = 11;
                in.validate_or_throw();
              }),
              "planning duration above 10 rejected");
  expect_true(throws_validation([] {
                InputState in = default_input_state();
                in.quantities.monitoring_duration_years = 0;
                in.validate_or_throw();
              }),
              "monitoring duration below 1 rejected");
  expect_true(throws_validation([] {
                InputState in = default_input_state();
                in.scenario_name.clear();
                in.validate_or_throw();
              }),
              "empty scenario name rejected");
}

}  // namespace
}  // namespace mcc

int main() {
  using namespace mcc;

  test_reference_scenario();
  test_breakdowns();
  test_tsf_absent();
  test_water_absent();
  test_high_risk();
  test_discounting();
  test_sensitivity();
  test_peak_and_share();
  test_determinism();
  test_presets_and_validation();

  if (g_fail_count != 0) {
    std::cerr << "\nFAILED: " << g_fail_count << " check(s) failed.\n";
    return 1;
  }
  std::cerr << "\nPASS: engine selftest\n";
  return 0;
}
