#include "engine/exports/results_json.hpp"

#include <ostream>
#include <sstream>

namespace mcc {
namespace {

void write_derived(JsonWriter& w, const DerivedQuantities& d) {
  w.begin_object();
  w.key("tsf_area_m2");                w.number(d.tsf_area_m2);
  w.key("wrd_area_m2");                w.number(d.wrd_area_m2);
  w.key("tsf_capping_volume_m3");      w.number(d.tsf_capping_volume_m3);
  w.key("wrd_earthworks_volume_m3");   w.number(d.wrd_earthworks_volume_m3);
  w.key("total_earthworks_volume_m3"); w.number(d.total_earthworks_volume_m3);
  w.key("topsoil_volume_m3");          w.number(d.topsoil_volume_m3);
  w.key("disturbed_area_m2");          w.number(d.disturbed_area_m2);
  w.key("recontouring_area_m2");       w.number(d.recontouring_area_m2);
  w.key("total_water_treatment_ml");   w.number(d.total_water_treatment_ml);
  w.key("risk_score");                 w.number(d.risk_score);
  w.key("risk_uplift_percent");        w.number(d.risk_uplift_percent);
  w.end_object();
}

void write_line_items(JsonWriter& w, const std::vector<LineItemCost>& items) {
  w.begin_array();
  for (const auto& it : items) {
    w.begin_object();
    w.key("category");    w.string(category_id(it.category));
    w.key("description"); w.string(it.description);
    w.key("quantity");    w.number(it.quantity);
    w.key("unit");        w.string(it.unit);
    w.key("unit_rate");   w.number(it.unit_rate);
    w.key("subtotal");    w.number(it.subtotal);
    w.key("phase");       w.string(phase_id(it.phase));
    w.end_object();
  }
  w.end_array();
}

void write_cashflows(JsonWriter& w, const std::vector<AnnualCashflow>& cfs) {
  w.begin_array();
  for (const auto& cf : cfs) {
    w.begin_object();
    w.key("year");                  w.integer(cf.year);
    w.key("nominal_cost");          w.number(cf.nominal_cost);
    w.key("escalated_cost");        w.number(cf.escalated_cost);
    w.key("discounted_cost");       w.number(cf.discounted_cost);
    w.key("cumulative_nominal");    w.number(cf.cumulative_nominal);
    w.key("cumulative_discounted"); w.number(cf.cumulative_discounted);
    w.key("phase_costs");
    w.begin_object();
    for (ClosurePhase p : kAllPhases) {
      w.key(phase_id(p));
      w.number(cf.phase_costs[p]);
    }
    w.end_object();
    w.end_object();
  }
  w.end_array();
}

void write_sensitivity(JsonWriter& w, const std::vector<SensitivityResult>& rows) {
  w.begin_array();
  for (const auto& s : rows) {
    w.begin_object();
    w.key("driver_name");     w.string(s.driver_name);
    w.key("driver_key");      w.string(s.driver_key);
    w.key("unit");            w.string(s.unit);
    w.key("base_value");      w.number(s.base_value);
    w.key("low_value");       w.number(s.low_value);
    w.key("high_value");      w.number(s.high_value);
    w.key("low_total_cost");  w.number(s.low_total_cost);
    w.key("high_total_cost"); w.number(s.high_total_cost);
    w.key("low_npv");         w.number(s.low_npv);
    w.key("high_npv");        w.number(s.high_npv);
    w.key("delta_cost");      w.number(s.delta_cost);
    w.key("delta_npv");       w.number(s.delta_npv);
    w.end_object();
  }
  w.end_array();
}

}  // namespace

void write_results_json(std::ostream& os,
                        const std::string& scenario_name,
                        const Results& r,
                        const JsonWriteOptions& opt) {
  JsonWriter w(os, opt);

  w.begin_object();
  w.key("scenario_name"); w.string(scenario_name);

  w.key("summary");
  w.begin_object();
  w.key("direct_works_cost");     w.number(r.direct_works_cost);
  w.key("indirect_costs");        w.number(r.indirect_costs);
  w.key("total_nominal_cost");    w.number(r.total_nominal_cost);
  w.key("total_discounted_cost"); w.number(r.total_discounted_cost);
  w.key("peak_annual_cashflow");  w.number(r.peak_annual_cashflow);
  w.key("peak_cashflow_year");    w.integer(r.peak_cashflow_year);
  w.key("monitoring_cost_share"); w.number(r.monitoring_cost_share);
  w.key("total_duration_years");  w.integer(r.total_duration_years);
  w.end_object();

  w.key("derived");
  write_derived(w, r.derived);

  w.key("line_items");
  write_line_items(w, r.line_items);

  w.key("annual_cashflows");
  write_cashflows(w, r.annual_cashflows);

  w.key("phase_breakdown");
  w.begin_array();
  for (const auto& p : r.phase_breakdown) {
    w.begin_object();
    w.key("phase");            w.string(phase_id(p.phase));
    w.key("total_cost");       w.number(p.total_cost);
    w.key("percent_of_total"); w.number(p.percent_of_total);
    w.end_object();
  }
  w.end_array();

  w.key("category_breakdown");
  w.begin_array();
  for (const auto& c : r.category_breakdown) {
    w.begin_object();
    w.key("category");         w.string(category_id(c.category));
    w.key("total_cost");       w.number(c.total_cost);
    w.key("percent_of_total"); w.number(c.percent_of_total);
    w.end_object();
  }
  w.end_array();

  w.key("sensitivity");
  write_sensitivity(w, r.sensitivity);

  w.end_object();

  if (opt.pretty) os << "\n";
}

std::string results_to_json(const std::string& scenario_name,
                            const Results& r,
                            const JsonWriteOptions& opt) {
  std::ostringstream ss;
  write_results_json(ss, scenario_name, r, opt);
  return ss.str();
}

} // namespace mcc
