#include "engine/exports/summary_report.hpp"

#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace mcc {

std::string format_currency(double value) {
  if (!std::isfinite(value)) return "n/a";
  const bool negative = value < 0.0;
  std::ostringstream digits;
  digits << std::fixed << std::setprecision(0) << std::fabs(value);
  const std::string raw = digits.str();

  std::string grouped;
  const std::size_t n = raw.size();
  for (std::size_t i = 0; i < n; ++i) {
    if (i > 0 && (n - i) % 3 == 0) grouped += ',';
    grouped += raw[i];
  }
  return std::string(negative ? "-$" : "$") + grouped;
}

void write_summary_report(std::ostream& os, const std::string& scenario_name, const Results& r) {
  os << "=== Mine Closure Cost Estimate ===\n";
  os << "Scenario: " << scenario_name << "\n\n";

  os << std::left;
  os << std::setw(28) << "Direct works" << format_currency(r.direct_works_cost) << "\n";
  os << std::setw(28) << "Indirect costs" << format_currency(r.indirect_costs) << "\n";
  os << std::setw(28) << "Total nominal cost" << format_currency(r.total_nominal_cost) << "\n";
  os << std::setw(28) << "Total discounted (NPV)" << format_currency(r.total_discounted_cost) << "\n";
  os << std::setw(28) << "Peak annual cashflow" << format_currency(r.peak_annual_cashflow)
     << " (" << r.peak_cashflow_year << ")\n";
  os << std::setw(28) << "Total duration" << r.total_duration_years << " years\n";
  os << std::setw(28) << "Risk score" << std::fixed << std::setprecision(1) << r.derived.risk_score
     << " (uplift " << r.derived.risk_uplift_percent << "%)\n";
  os << std::setw(28) << "Monitoring share" << r.monitoring_cost_share << "%\n";

  os << "\nBy phase:\n";
  for (const auto& p : r.phase_breakdown) {
    os << "  " << std::setw(32) << phase_name(p.phase) << std::setw(18) << format_currency(p.total_cost)
       << std::right << std::setw(6) << p.percent_of_total << "%\n" << std::left;
  }

  os << "\nBy category:\n";
  for (const auto& c : r.category_breakdown) {
    os << "  " << std::setw(32) << category_name(c.category) << std::setw(18)
       << format_currency(c.total_cost) << std::right << std::setw(6) << c.percent_of_total << "%\n"
       << std::left;
  }

  if (!r.sensitivity.empty()) {
    os << "\nSensitivity (total cost swing, low -> high):\n";
    for (const auto& s : r.sensitivity) {
      os << "  " << std::setw(28) << s.driver_name << format_currency(s.low_total_cost) << " -> "
         << format_currency(s.high_total_cost) << "  (delta " << format_currency(s.delta_cost) << ")\n";
    }
  }
}

} // namespace mcc
