/*
================================================================================
Fragment 5.4 — Exports: CSV Report Exporter Implementation
FILE: cpp/engine/exports/results_csv.cpp
================================================================================
*/

#include "engine/exports/results_csv.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>

#include "engine/core/errors.hpp"

namespace mcc {

std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }

  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

namespace {

// Writes cells joined by the delimiter, escaping each one.
class CsvRow {
 public:
  CsvRow(std::ostream& os, char delim) : os_(os), d_(delim) {}

  CsvRow& cell(const std::string& s) {
    if (!first_) os_ << d_;
    first_ = false;
    os_ << csv_escape(s, d_);
    return *this;
  }

  CsvRow& num(double x, int precision = 2) { return cell(csv_double(x, precision)); }

  void end() { os_ << "\n"; }

 private:
  std::ostream& os_;
  char d_;
  bool first_ = true;
};

}  // namespace

void write_line_items_csv(std::ostream& os,
                          const std::vector<LineItemCost>& items,
                          const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) {
    CsvRow(os, d).cell("Category").cell("Description").cell("Quantity").cell("Unit")
        .cell("Unit Rate").cell("Subtotal").cell("Phase").end();
  }
  for (const auto& it : items) {
    CsvRow(os, d)
        .cell(category_name(it.category))
        .cell(it.description)
        .num(it.quantity, 4)
        .cell(it.unit)
        .num(it.unit_rate)
        .num(it.subtotal)
        .cell(phase_name(it.phase))
        .end();
  }
}

void write_cashflows_csv(std::ostream& os,
                         const std::vector<AnnualCashflow>& cashflows,
                         const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) {
    CsvRow h(os, d);
    h.cell("Year").cell("Nominal Cost").cell("Escalated Cost").cell("Discounted Cost")
        .cell("Cumulative Nominal").cell("Cumulative Discounted");
    if (opt.include_phase_columns) {
      for (ClosurePhase p : kAllPhases) h.cell(phase_name(p));
    }
    h.end();
  }
  for (const auto& cf : cashflows) {
    CsvRow row(os, d);
    row.cell(std::to_string(cf.year))
        .num(cf.nominal_cost)
        .num(cf.escalated_cost)
        .num(cf.discounted_cost)
        .num(cf.cumulative_nominal)
        .num(cf.cumulative_discounted);
    if (opt.include_phase_columns) {
      for (ClosurePhase p : kAllPhases) row.num(cf.phase_costs[p]);
    }
    row.end();
  }
}

void write_sensitivity_csv(std::ostream& os,
                           const std::vector<SensitivityResult>& rows,
                           const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) {
    CsvRow(os, d).cell("Driver").cell("Key").cell("Unit").cell("Base").cell("Low").cell("High")
        .cell("Low Total Cost").cell("High Total Cost").cell("Low NPV").cell("High NPV")
        .cell("Delta Cost").cell("Delta NPV").end();
  }
  for (const auto& s : rows) {
    CsvRow(os, d)
        .cell(s.driver_name)
        .cell(s.driver_key)
        .cell(s.unit)
        .num(s.base_value, 4)
        .num(s.low_value, 4)
        .num(s.high_value, 4)
        .num(s.low_total_cost)
        .num(s.high_total_cost)
        .num(s.low_npv)
        .num(s.high_npv)
        .num(s.delta_cost)
        .num(s.delta_npv)
        .end();
  }
}

void write_results_report_csv(std::ostream& os,
                              const std::string& scenario_name,
                              const Results& r,
                              const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  CsvExportOptions section = opt;
  section.include_header = true;

  os << "=== MINE CLOSURE COST ESTIMATE ===\n\n";
  CsvRow(os, d).cell("Scenario").cell(scenario_name).end();
  os << "\n";

  os << "=== SUMMARY ===\n";
  CsvRow(os, d).cell("Direct Works Cost").num(r.direct_works_cost).end();
  CsvRow(os, d).cell("Indirect Costs").num(r.indirect_costs).end();
  CsvRow(os, d).cell("Total Nominal Cost").num(r.total_nominal_cost).end();
  CsvRow(os, d).cell("Total Discounted (NPV)").num(r.total_discounted_cost).end();
  CsvRow(os, d).cell("Peak Annual Cashflow").num(r.peak_annual_cashflow).end();
  CsvRow(os, d).cell("Peak Year").cell(std::to_string(r.peak_cashflow_year)).end();
  CsvRow(os, d).cell("Monitoring Cost Share (%)").num(r.monitoring_cost_share).end();
  CsvRow(os, d).cell("Total Duration (years)").cell(std::to_string(r.total_duration_years)).end();
  os << "\n";

  os << "=== LINE ITEMS ===\n";
  write_line_items_csv(os, r.line_items, section);
  os << "\n";

  os << "=== ANNUAL CASHFLOWS ===\n";
  write_cashflows_csv(os, r.annual_cashflows, section);
}

void write_results_report_csv_file(const std::string& file_path,
                                   const std::string& scenario_name,
                                   const Results& r,
                                   const CsvExportOptions& opt) {
  std::ofstream f(file_path);
  if (!f) throw IOError("Cannot open CSV output: " + file_path);
  write_results_report_csv(f, scenario_name, r, opt);
  f.flush();
  if (!f) throw IOError("Failed writing CSV output: " + file_path);
}

} // namespace mcc
