/*
  Fragment 2.9 — Costing Selftest

  Objective
  ---------
  Framework-free checks for the costing layer:
    1) Unit conversions (ha <-> m^2 inverse law, daily flow totals).
    2) Risk score weights + one-decimal rounding, uplift breakpoints and
       monotonicity.
    3) Derived quantities, including the survey earthworks override.
    4) Direct works inclusion rules (each gated item appears/disappears with
       its condition).
    5) Indirect waterfall exact values on the reference scenario.

  Usage
  -----
    ./costing_selftest        (non-zero return code indicates failure)
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/inputs.hpp"
#include "engine/core/safe_math.hpp"
#include "engine/core/units.hpp"
#include "engine/costing/derived_quantities.hpp"
#include "engine/costing/direct_works.hpp"
#include "engine/costing/indirect_costs.hpp"
#include "engine/costing/line_items.hpp"
#include "engine/costing/risk_score.hpp"

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

void expect_near(double a, double b, std::string_view msg, double abs = 1e-6) {
  if (!near(a, b, 1e-12, abs)) {
    fail(msg);
    std::cerr << "  got:      " << a << "\n";
    std::cerr << "  expected: " << b << "\n";
  } else {
    pass(msg);
  }
}

std::vector<LineItemCost> direct_items(const InputState& in) {
  const DerivedQuantities d = costing::calculate_derived_quantities(in);
  return costing::calculate_direct_works_costs(in, d);
}

int count_category(const std::vector<LineItemCost>& items, CostCategory c) {
  int n = 0;
  for (const auto& li : items) {
    if (li.category == c) ++n;
  }
  return n;
}

const LineItemCost* find_category(const std::vector<LineItemCost>& items, CostCategory c) {
  for (const auto& li : items) {
    if (li.category == c) return &li;
  }
  return nullptr;
}

void test_units() {
  const double samples[] = {0.0, 0.5, 1.0, 123.456, 100000.0};
  bool ok = true;
  for (double x : samples) {
    if (!near(units::m2_to_ha(units::ha_to_m2(x)), x)) ok = false;
  }
  expect_true(ok, "m2_to_ha(ha_to_m2(x)) == x");
  expect_near(units::ha_to_m2(1.0), 10000.0, "1 ha = 10000 m2");
  expect_near(units::daily_to_total(2.0, 10.0), 7300.0, "2 ML/day for 10 years = 7300 ML");
  expect_near(units::pct_to_frac(12.5), 0.125, "12.5% = 0.125");
}

void test_risk_score() {
  RiskFactors f;  // 30/25/35/20/25
  expect_near(costing::calculate_risk_score(f), 28.0, "reference risk score = 28.0");

  RiskFactors only_contamination{};
  only_contamination.contamination_uncertainty = 31.0;
  only_contamination.geotech_uncertainty = 0.0;
  only_contamination.water_quality_uncertainty = 0.0;
  only_contamination.regulatory_uncertainty = 0.0;
  only_contamination.logistics_complexity = 0.0;
  expect_near(costing::calculate_risk_score(only_contamination), 7.8,
              "score rounds 7.75 up to one decimal");

  RiskFactors all80;
  all80.contamination_uncertainty = 80.0;
  all80.geotech_uncertainty = 80.0;
  all80.water_quality_uncertainty = 80.0;
  all80.regulatory_uncertainty = 80.0;
  all80.logistics_complexity = 80.0;
  expect_near(costing::calculate_risk_score(all80), 80.0, "weights sum to 1");

  const auto& w = costing::kRiskWeights;
  expect_near(w.contamination + w.geotech + w.water_quality + w.regulatory + w.logistics, 1.0,
              "risk weights sum");
}

void test_uplift_curve() {
  expect_near(costing::risk_score_to_uplift(0.0), 0.0, "uplift(0) = 0");
  expect_near(costing::risk_score_to_uplift(20.0), 5.0, "uplift(20) = 5");
  expect_near(costing::risk_score_to_uplift(40.0), 10.0, "uplift(40) = 10");
  expect_near(costing::risk_score_to_uplift(60.0), 20.0, "uplift(60) = 20");
  expect_near(costing::risk_score_to_uplift(80.0), 35.0, "uplift(80) = 35");
  expect_near(costing::risk_score_to_uplift(100.0), 50.0, "uplift(100) = 50");
  expect_near(costing::risk_score_to_uplift(28.0), 7.0, "uplift(28) = 7");
  expect_near(costing::risk_score_to_uplift(70.0), 27.5, "uplift(70) = 27.5");

  bool monotone = true;
  double prev = costing::risk_score_to_uplift(0.0);
  for (int i = 1; i <= 1000; ++i) {
    const double u = costing::risk_score_to_uplift(i * 0.1);
    if (u < prev) monotone = false;
    prev = u;
  }
  expect_true(monotone, "uplift is non-decreasing over [0,100]");
}

void test_derived_quantities() {
  const InputState in = default_input_state();
  const DerivedQuantities d = costing::calculate_derived_quantities(in);
  expect_near(d.tsf_area_m2, 1000000.0, "tsf area m2");
  expect_near(d.wrd_area_m2, 2000000.0, "wrd area m2");
  expect_near(d.tsf_capping_volume_m3, 500000.0, "tsf capping volume");
  expect_near(d.wrd_earthworks_volume_m3, 2400000.0, "wrd volume includes bulking");
  expect_near(d.total_earthworks_volume_m3, 2900000.0, "parametric earthworks volume");
  expect_near(d.topsoil_volume_m3, 750000.0, "topsoil volume");
  expect_near(d.disturbed_area_m2, 5000000.0, "disturbed area m2");
  expect_near(d.recontouring_area_m2, 3000000.0, "recontouring area m2");
  expect_near(d.total_water_treatment_ml, 7300.0, "total water treated");
  expect_near(d.risk_score, 28.0, "derived risk score");
  expect_near(d.risk_uplift_percent, 7.0, "derived risk uplift");

  InputState with_override = in;
  with_override.quantities.earthworks_volume_m3_override = 1234567.0;
  const DerivedQuantities o = costing::calculate_derived_quantities(with_override);
  expect_near(o.total_earthworks_volume_m3, 1234567.0, "override replaces earthworks volume");
  expect_near(o.tsf_capping_volume_m3, 500000.0, "override leaves components untouched");

  with_override.quantities.earthworks_volume_m3_override = 0.0;
  const auto items = direct_items(with_override);
  bool has_general_earthworks = false;
  for (const auto& li : items) {
    if (li.description.find("General earthworks") != std::string::npos) has_general_earthworks = true;
  }
  expect_true(!has_general_earthworks, "zero override drops the general earthworks item");
}

void test_direct_works_reference() {
  const InputState in = default_input_state();
  const auto items = direct_items(in);

  expect_true(items.size() == 13, "reference scenario has 13 direct items (no hazardous)");
  expect_near(costing::sum_subtotals(items), 118100000.0, "reference direct works total");

  bool subtotals_ok = true;
  for (const auto& li : items) {
    if (!near(li.subtotal, li.quantity * li.unit_rate)) subtotals_ok = false;
  }
  expect_true(subtotals_ok, "subtotal = quantity * unit_rate");

  const LineItemCost* tsf = find_category(items, CostCategory::TSFClosure);
  expect_true(tsf && near(tsf->unit_rate, 18.75), "TSF rate = base * thickness * factor");
  const LineItemCost* wrd = find_category(items, CostCategory::WRDRehabilitation);
  expect_true(wrd && near(wrd->unit_rate, 18.75), "WRD rate uses half capping intensity");
  const LineItemCost* opex = find_category(items, CostCategory::WaterTreatmentOpex);
  expect_true(opex && near(opex->unit_rate, 365000.0) && near(opex->quantity, 10.0),
              "water opex = annual cost x years");
  const LineItemCost* mon = find_category(items, CostCategory::Monitoring);
  expect_true(mon && mon->description == "Environmental monitoring (medium intensity)",
              "monitoring description names the intensity");
  expect_true(mon && mon->phase == ClosurePhase::MonitoringMaintenance, "monitoring phase");
  expect_true(count_category(items, CostCategory::Earthworks) == 2,
              "earthworks + topsoil share the earthworks category");
}

void test_direct_works_gating() {
  {
    InputState in = default_input_state();
    in.quantities.number_of_buildings = 0;
    expect_true(count_category(direct_items(in), CostCategory::Demolition) == 0,
                "no buildings -> no demolition");
  }
  {
    InputState in = default_input_state();
    in.quantities.tsf_area_ha = 0.0;
    in.quantities.tsf_cover_thickness_m = 0.0;
    const auto items = direct_items(in);
    expect_true(count_category(items, CostCategory::TSFClosure) == 0, "no TSF -> no TSF closure");
    expect_true(count_category(items, CostCategory::WRDRehabilitation) == 1,
                "no TSF leaves WRD rehabilitation");
    expect_true(costing::sum_subtotals(items) > 0.0, "no TSF still costs something");
  }
  {
    InputState in = default_input_state();
    in.quantities.wrd_footprint_ha = 0.0;
    expect_true(count_category(direct_items(in), CostCategory::WRDRehabilitation) == 0,
                "no WRD -> no WRD rehabilitation");
  }
  {
    InputState in = default_input_state();
    in.quantities.water_treatment_flow_ml_per_day = 0.0;
    const auto items = direct_items(in);
    expect_true(count_category(items, CostCategory::WaterTreatmentCapex) == 0 &&
                    count_category(items, CostCategory::WaterTreatmentOpex) == 0,
                "zero flow -> no water treatment");
  }
  {
    InputState in = default_input_state();
    in.quantities.water_treatment_duration_years = 0.0;
    const auto items = direct_items(in);
    expect_true(count_category(items, CostCategory::WaterTreatmentCapex) == 0 &&
                    count_category(items, CostCategory::WaterTreatmentOpex) == 0,
                "zero duration -> no water treatment");
  }
  {
    InputState in = default_input_state();
    in.quantities.disturbed_area_ha = 0.0;
    const auto items = direct_items(in);
    expect_true(count_category(items, CostCategory::Revegetation) == 0 &&
                    count_category(items, CostCategory::ErosionControls) == 0,
                "no disturbed area -> no revegetation or erosion controls");
  }
  {
    InputState in = default_input_state();
    in.quantities.road_length_km = 0.0;
    expect_true(count_category(direct_items(in), CostCategory::RoadRehabilitation) == 0,
                "no roads -> no road rehabilitation");
  }
  {
    InputState in = default_input_state();
    in.quantities.hazardous_materials_area_ha = 10.0;
    expect_true(count_category(direct_items(in), CostCategory::HazardousMaterials) == 0,
                "hazardous area without flag -> excluded");
    in.quantities.hazardous_materials_enabled = true;
    const auto items = direct_items(in);
    const LineItemCost* hz = find_category(items, CostCategory::HazardousMaterials);
    expect_true(hz && near(hz->subtotal, 1000000.0), "hazardous flag + area -> included");
    in.quantities.hazardous_materials_area_ha = 0.0;
    expect_true(count_category(direct_items(in), CostCategory::HazardousMaterials) == 0,
                "hazardous flag without area -> excluded");
  }
  {
    InputState in = default_input_state();
    in.quantities.community_heritage_enabled = false;
    expect_true(count_category(direct_items(in), CostCategory::CommunityHeritage) == 0,
                "community flag off -> excluded");
  }
  {
    InputState in = default_input_state();
    in.quantities.monitoring_intensity = MonitoringIntensity::High;
    const auto items = direct_items(in);
    const LineItemCost* mon = find_category(items, CostCategory::Monitoring);
    expect_true(mon && near(mon->subtotal, 15.0 * 1000000.0), "high intensity monitoring rate");
    expect_true(mon && mon->description == "Environmental monitoring (high intensity)",
                "high intensity description");
  }
}

void test_indirect_waterfall() {
  const InputState in = default_input_state();
  const DerivedQuantities d = costing::calculate_derived_quantities(in);
  const auto items = costing::calculate_indirect_costs(118100000.0, in, d);

  expect_true(items.size() == 5, "five indirect items");
  if (items.size() != 5) return;

  expect_true(items[0].category == CostCategory::SiteEstablishment &&
                  items[1].category == CostCategory::ContractorMargin &&
                  items[2].category == CostCategory::Contingency &&
                  items[3].category == CostCategory::RiskUplift &&
                  items[4].category == CostCategory::OwnersCosts,
              "waterfall order");
  expect_near(items[0].subtotal, 14172000.0, "site establishment = 12% of direct");
  expect_near(items[1].subtotal, 13227200.0, "margin = 10% of direct + site est.");
  expect_near(items[2].subtotal, 21824880.0, "contingency = 15% of subtotal");
  expect_near(items[3].subtotal, 10184944.0, "risk uplift shares the contingency base");
  expect_near(items[4].subtotal, 8875451.2, "owner's costs = 5% of everything before");
  expect_near(costing::sum_subtotals(items), 68284475.2, "indirect total");

  expect_true(items[3].description == "Risk-based uplift (score: 28)", "risk uplift description");

  InputState fractional = in;
  fractional.risk_factors.geotech_uncertainty = 28.0;  // +0.6
  const DerivedQuantities fd = costing::calculate_derived_quantities(fractional);
  const auto fitems = costing::calculate_indirect_costs(118100000.0, fractional, fd);
  expect_true(fitems.size() == 5 && fitems[3].description == "Risk-based uplift (score: 28.6)",
              "fractional risk score keeps its decimal");
  expect_true(items[0].phase == ClosurePhase::PlanningApprovals &&
                  items[1].phase == ClosurePhase::DecommissioningDemolition,
              "indirect phases");
  expect_near(items[2].quantity, 15.0, "indirect quantity carries the percentage");

  const auto zero = costing::calculate_indirect_costs(0.0, in, d);
  expect_near(costing::sum_subtotals(zero), 0.0, "zero direct -> zero indirect");
}

}  // namespace
}  // namespace mcc

int main() {
  using namespace mcc;

  test_units();
  test_risk_score();
  test_uplift_curve();
  test_derived_quantities();
  test_direct_works_reference();
  test_direct_works_gating();
  test_indirect_waterfall();

  if (g_fail_count != 0) {
    std::cerr << "\nFAILED: " << g_fail_count << " check(s) failed.\n";
    return 1;
  }
  std::cerr << "\nPASS: costing selftest\n";
  return 0;
}
