/*
  Fragment 5.9 — Exports Selftest

  Objective
  ---------
  Framework-free checks for the exporters:
    1) JSON writer never emits NaN/Inf (null instead), escapes strings, and
       produces identical text for identical results.
    2) Scenario JSON: write -> parse preserves values (including the earthworks
       override and enums); missing keys keep defaults; unknown keys ignored;
       malformed or mistyped documents are rejected with a location.
    3) CSV escaping and empty cells for non-finite numbers; section layout of
       the combined report.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

#include "engine/analysis/closure_engine.hpp"
#include "engine/core/inputs.hpp"
#include "engine/core/presets.hpp"
#include "engine/exports/json_writer.hpp"
#include "engine/exports/results_csv.hpp"
#include "engine/exports/results_json.hpp"
#include "engine/exports/scenario_json.hpp"
#include "engine/exports/summary_report.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

bool contains(const std::string& hay, std::string_view needle) {
  return hay.find(needle) != std::string::npos;
}

// Value positions only; words such as "maintenance" contain "nan".
bool contains_non_finite_token(const std::string& s) {
  for (const char* tok : {": nan", ": -nan", ": inf", ": -inf", ": NaN", ": Inf", ": -Inf"}) {
    if (contains(s, tok)) return true;
  }
  return false;
}

void test_json_writer() {
  std::ostringstream os;
  JsonWriteOptions opt;
  opt.pretty = false;
  JsonWriter w(os, opt);
  w.begin_object();
  w.key("a");     w.number(std::numeric_limits<double>::quiet_NaN());
  w.key("b");     w.number(std::numeric_limits<double>::infinity());
  w.key("c");     w.number(1.5);
  w.key("quote"); w.string("say \"hi\"\n");
  w.key("list");
  w.begin_array();
  w.integer(1);
  w.boolean(true);
  w.null_value();
  w.end_array();
  w.key("empty");
  w.begin_object();
  w.end_object();
  w.end_object();

  expect_eq_str(os.str(),
                "{\"a\":null,\"b\":null,\"c\":1.5,\"quote\":\"say \\\"hi\\\"\\n\","
                "\"list\":[1,true,null],\"empty\":{}}",
                "compact writer output");
  expect_eq_str(escape_json(std::string("\x01")), "\\u0001", "control characters escaped");
}

void test_results_json() {
  const InputState in = default_input_state();
  const Results r = analysis::calculate_closure_costs(in);

  const std::string a = results_to_json(in.scenario_name, r);
  const std::string b = results_to_json(in.scenario_name, analysis::calculate_closure_costs(in));
  expect_eq_str(a, b, "results JSON is deterministic");
  expect_true(!contains_non_finite_token(a), "results JSON has no NaN/Inf");
  expect_true(contains(a, "\"total_nominal_cost\": ") && contains(a, "\"phase_costs\": {"),
              "results JSON carries headline and phase columns");
  expect_true(contains(a, "\"category\": \"tsf_closure\""), "categories written by id");

  Results broken = r;
  broken.total_discounted_cost = std::numeric_limits<double>::quiet_NaN();
  const std::string c = results_to_json(in.scenario_name, broken);
  expect_true(contains(c, "\"total_discounted_cost\": null"), "non-finite result written as null");
}

void test_scenario_round_trip() {
  InputState in = *preset_inputs("tsf-dominant");
  in.scenario_name = "Round \"trip\" site";
  in.quantities.earthworks_volume_m3_override = 2500000.0;
  in.quantities.monitoring_intensity = MonitoringIntensity::High;
  in.quantities.hazardous_materials_enabled = true;
  in.quantities.hazardous_materials_area_ha = 12.5;
  in.financial.discount_rate_mode = DiscountRateMode::Nominal;
  in.phase_durations[ClosurePhase::WaterManagement] = 17;

  const std::string json = scenario_to_json(in);
  InputState back;
  JsonParseError err;
  const bool ok = parse_scenario_json(json, &back, &err);
  expect_true(ok, "scenario JSON parses");
  if (!ok) {
    std::cerr << "  " << err.message << " @" << err.line << ":" << err.col << "\n";
    return;
  }
  expect_true(back == in, "scenario round trip preserves values");
  expect_true(back.quantities.earthworks_volume_m3_override.has_value() &&
                  *back.quantities.earthworks_volume_m3_override == 2500000.0,
              "override survives");
  expect_true(back.quantities.monitoring_intensity == MonitoringIntensity::High, "intensity survives");
  expect_true(back.financial.discount_rate_mode == DiscountRateMode::Nominal, "discount mode survives");
  expect_true(back.phase_durations[ClosurePhase::WaterManagement] == 17, "durations survive");
  expect_true(back.scenario_name == in.scenario_name, "escaped name survives");

  const Results r1 = analysis::calculate_closure_costs(in);
  const Results r2 = analysis::calculate_closure_costs(back);
  expect_true(std::fabs(r1.total_nominal_cost - r2.total_nominal_cost) < 1e-6,
              "round-tripped scenario costs the same");
}

void test_scenario_partial_and_unknown() {
  const std::string json = R"({
    "scenario_name": "Partial",
    "quantities": { "tsf_area_ha": 42, "earthworks_volume_m3_override": null, "future_field": [1, 2] },
    "financial": { "discount_rate_mode": "nominal" },
    "extra": { "ignored": true }
  })";
  InputState in;
  JsonParseError err;
  const bool ok = parse_scenario_json(json, &in, &err);
  expect_true(ok, "partial scenario parses");
  if (!ok) return;

  const InputState def = default_input_state();
  expect_true(in.quantities.tsf_area_ha == 42.0, "present key applied");
  expect_true(in.quantities.disturbed_area_ha == def.quantities.disturbed_area_ha, "missing key keeps default");
  expect_true(!in.quantities.earthworks_volume_m3_override, "null override means none");
  expect_true(in.unit_rates == def.unit_rates, "missing group keeps defaults");
  expect_true(in.financial.discount_rate_mode == DiscountRateMode::Nominal, "enum parsed by id");
  expect_true(in.scenario_name == "Partial", "scenario name parsed");
}

void test_scenario_rejects() {
  struct Case {
    const char* name;
    const char* json;
  };
  const Case cases[] = {
      {"trailing characters", "{} x"},
      {"NaN literal", "{\"quantities\": {\"tsf_area_ha\": NaN}}"},
      {"leading plus", "{\"quantities\": {\"tsf_area_ha\": +1}}"},
      {"unterminated object", "{\"scenario_name\": \"a\""},
      {"root not an object", "[1, 2]"},
      {"string for number", "{\"quantities\": {\"tsf_area_ha\": \"100\"}}"},
      {"fractional integer", "{\"quantities\": {\"number_of_buildings\": 2.5}}"},
      {"unknown enum id", "{\"quantities\": {\"monitoring_intensity\": \"extreme\"}}"},
      {"group not an object", "{\"financial\": 5}"},
      {"bool for number", "{\"risk_factors\": {\"geotech_uncertainty\": true}}"},
  };
  for (const auto& c : cases) {
    InputState in;
    JsonParseError err;
    const bool ok = parse_scenario_json(c.json, &in, &err);
    expect_true(!ok && !err.message.empty(), std::string("rejects ") + c.name);
  }

  {
    InputState deep;
    JsonParseError derr;
    const bool ok = parse_scenario_json(std::string(1000000, '['), &deep, &derr);
    expect_true(!ok && derr.message == "Nesting too deep", "rejects runaway array nesting");

    std::string objs;
    for (int i = 0; i < 100000; ++i) objs += "{\"a\":";
    const bool ok2 = parse_scenario_json(objs, &deep, &derr);
    expect_true(!ok2 && derr.message == "Nesting too deep", "rejects runaway object nesting");

    std::string shallow = "{\"extra\": ";
    for (int i = 0; i < 10; ++i) shallow += "[";
    for (int i = 0; i < 10; ++i) shallow += "]";
    shallow += "}";
    expect_true(parse_scenario_json(shallow, &deep, &derr), "moderate nesting in unknown keys accepted");
  }

  InputState in;
  JsonParseError err;
  const bool ok = parse_scenario_json("{\n  \"quantities\": {\n    \"tsf_area_ha\": \"x\"\n  }\n}", &in, &err);
  expect_true(!ok && err.line == 3 && err.col == 20, "schema error reports the value location");
}

void test_csv() {
  expect_eq_str(csv_escape("plain"), "plain", "plain cell untouched");
  expect_eq_str(csv_escape("a,b"), "\"a,b\"", "comma quoted");
  expect_eq_str(csv_escape("say \"x\""), "\"say \"\"x\"\"\"", "quotes doubled");
  expect_eq_str(csv_escape("line\nbreak"), "\"line\nbreak\"", "newline quoted");
  expect_eq_str(csv_double(std::numeric_limits<double>::quiet_NaN()), "", "NaN -> empty cell");
  expect_eq_str(csv_double(1234.5), "1234.50", "money to two decimals");

  const InputState in = default_input_state();
  const Results r = analysis::calculate_closure_costs(in);

  std::ostringstream items;
  write_line_items_csv(items, r.line_items);
  const std::string li = items.str();
  expect_true(li.rfind("Category,Description,Quantity,Unit,Unit Rate,Subtotal,Phase\n", 0) == 0,
              "line item header");
  expect_true(contains(li, "\"Site establishment, HSE, and project management\""),
              "description with commas is quoted");

  std::size_t rows = 0;
  for (char ch : li) rows += (ch == '\n');
  expect_true(rows == r.line_items.size() + 1, "one row per line item plus header");

  std::ostringstream report;
  write_results_report_csv(report, in.scenario_name, r);
  const std::string rep = report.str();
  expect_true(contains(rep, "=== SUMMARY ===") && contains(rep, "=== LINE ITEMS ===") &&
                  contains(rep, "=== ANNUAL CASHFLOWS ==="),
              "combined report sections");
  expect_true(contains(rep, "Peak Year,"), "summary carries peak year");

  std::ostringstream cfs;
  CsvExportOptions no_phases;
  no_phases.include_phase_columns = false;
  write_cashflows_csv(cfs, r.annual_cashflows, no_phases);
  expect_true(cfs.str().rfind(
                  "Year,Nominal Cost,Escalated Cost,Discounted Cost,Cumulative Nominal,"
                  "Cumulative Discounted\n", 0) == 0,
              "cashflow header without phase columns");
}

void test_summary() {
  expect_eq_str(format_currency(1234567.4), "$1,234,567", "currency grouping");
  expect_eq_str(format_currency(-999.6), "-$1,000", "negative currency");
  expect_eq_str(format_currency(0.0), "$0", "zero currency");

  const InputState in = default_input_state();
  std::ostringstream os;
  write_summary_report(os, in.scenario_name, analysis::calculate_closure_costs(in));
  expect_true(contains(os.str(), "Total nominal cost") && contains(os.str(), "Sensitivity"),
              "summary report sections");
}

}  // namespace
}  // namespace mcc

int main() {
  using namespace mcc;

  test_json_writer();
  test_results_json();
  test_scenario_round_trip();
  test_scenario_partial_and_unknown();
  test_scenario_rejects();
  test_csv();
  test_summary();

  if (g_fail_count != 0) {
    std::cerr << "\nFAILED: " << g_fail_count << " check(s) failed.\n";
    return 1;
  }
  std::cerr << "\nPASS: exports selftest\n";
  return 0;
}
