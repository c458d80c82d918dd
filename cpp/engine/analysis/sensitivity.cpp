#include "engine/analysis/sensitivity.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "engine/analysis/cost_pipeline.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/safe_math.hpp"

namespace mcc::analysis {

namespace {

struct PipelineTotals {
  double total = 0.0;
  double npv = 0.0;
};

PipelineTotals evaluate(const InputState& in) {
  const CostPipeline p = run_cost_pipeline(in);
  return PipelineTotals{p.total_nominal_cost, p.npv()};
}

}  // namespace

const std::vector<SensitivityDriver>& sensitivity_drivers() {
  static const std::vector<SensitivityDriver> kDrivers = {
      {"Disturbed Area", "disturbedArea", "ha",
       [](const InputState& s) { return s.quantities.disturbed_area_ha; },
       [](InputState& s, double v) { s.quantities.disturbed_area_ha = v; }},
      {"Earthworks Rate", "earthworksRate", "$/m3",
       [](const InputState& s) { return s.unit_rates.earthworks_per_m3; },
       [](InputState& s, double v) { s.unit_rates.earthworks_per_m3 = v; }},
      {"TSF Area", "tsfArea", "ha",
       [](const InputState& s) { return s.quantities.tsf_area_ha; },
       [](InputState& s, double v) { s.quantities.tsf_area_ha = v; }},
      {"TSF Cover Thickness", "tsfThickness", "m",
       [](const InputState& s) { return s.quantities.tsf_cover_thickness_m; },
       [](InputState& s, double v) { s.quantities.tsf_cover_thickness_m = v; }},
      {"Water Treatment Duration", "waterDuration", "years",
       [](const InputState& s) { return s.quantities.water_treatment_duration_years; },
       [](InputState& s, double v) { s.quantities.water_treatment_duration_years = v; }},
      {"Contingency %", "contingency", "%",
       [](const InputState& s) { return s.indirect_rates.contingency_percent; },
       [](InputState& s, double v) { s.indirect_rates.contingency_percent = v; }},
      {"Discount Rate", "discountRate", "%",
       [](const InputState& s) { return s.financial.discount_rate_percent; },
       [](InputState& s, double v) { s.financial.discount_rate_percent = v; }},
      {"Revegetation Rate", "revegRate", "$/ha",
       [](const InputState& s) { return s.unit_rates.revegetation_per_ha; },
       [](InputState& s, double v) { s.unit_rates.revegetation_per_ha = v; }},
  };
  return kDrivers;
}

void SensitivityConfig::validate() const {
  if (!is_finite(variation_percent) || variation_percent < 0.0 || variation_percent > 100.0) {
    throw ArgumentError("SensitivityConfig: variation_percent must be in [0, 100]");
  }
}

std::vector<SensitivityResult> calculate_sensitivity(const InputState& in,
                                                     const SensitivityConfig& cfg) {
  cfg.validate();
  const double v = cfg.variation_percent / 100.0;

  std::vector<SensitivityResult> out;
  for (const auto& driver : sensitivity_drivers()) {
    const double base = driver.get(in);
    if (base == 0.0) continue;

    SensitivityResult r;
    r.driver_name = driver.name;
    r.driver_key = driver.key;
    r.unit = driver.unit;
    r.base_value = base;
    r.low_value = base * (1.0 - v);
    r.high_value = base * (1.0 + v);

    InputState low_in = in;
    driver.set(low_in, r.low_value);
    InputState high_in = in;
    driver.set(high_in, r.high_value);

    const PipelineTotals lo = evaluate(low_in);
    const PipelineTotals hi = evaluate(high_in);

    r.low_total_cost = lo.total;
    r.high_total_cost = hi.total;
    r.low_npv = lo.npv;
    r.high_npv = hi.npv;
    r.delta_cost = hi.total - lo.total;
    r.delta_npv = hi.npv - lo.npv;
    out.push_back(std::move(r));
  }

  std::stable_sort(out.begin(), out.end(), [](const SensitivityResult& a, const SensitivityResult& b) {
    return std::fabs(a.delta_cost) > std::fabs(b.delta_cost);
  });
  return out;
}

} // namespace mcc::analysis
