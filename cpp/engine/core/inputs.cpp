/*
================================================================================
Fragment 1.4 — Core: Closure Scenario Inputs (Validation)
FILE: cpp/engine/core/inputs.cpp
================================================================================
*/

#include "engine/core/inputs.hpp"

#include <cmath>
#include <string>

#include "engine/core/errors.hpp"

namespace mcc {

namespace {

void require_range(const char* group, const char* field, double v, double lo, double hi) {
  if (!std::isfinite(v)) {
    throw ValidationError(std::string(group) + ": " + field + " must be finite");
  }
  if (v < lo || v > hi) {
    throw ValidationError(std::string(group) + ": " + field + " outside [" +
                          std::to_string(lo) + ", " + std::to_string(hi) + "]");
  }
}

void require_int_range(const char* group, const char* field, int v, int lo, int hi) {
  if (v < lo || v > hi) {
    throw ValidationError(std::string(group) + ": " + field + " outside [" +
                          std::to_string(lo) + ", " + std::to_string(hi) + "]");
  }
}

}  // namespace

void Quantities::validate_or_throw() const {
  const char* g = "Quantities";
  require_range(g, "disturbed_area_ha", disturbed_area_ha, 0.0, 100000.0);
  require_range(g, "tsf_area_ha", tsf_area_ha, 0.0, 10000.0);
  require_range(g, "tsf_cover_thickness_m", tsf_cover_thickness_m, 0.0, 5.0);
  require_range(g, "wrd_footprint_ha", wrd_footprint_ha, 0.0, 50000.0);
  require_range(g, "wrd_reshaping_depth_m", wrd_reshaping_depth_m, 0.0, 20.0);
  if (earthworks_volume_m3_override && !std::isfinite(*earthworks_volume_m3_override)) {
    throw ValidationError("Quantities: earthworks_volume_m3_override must be finite");
  }
  require_range(g, "topsoil_thickness_m", topsoil_thickness_m, 0.0, 2.0);
  require_range(g, "recontouring_area_ha", recontouring_area_ha, 0.0, 100000.0);
  require_range(g, "road_length_km", road_length_km, 0.0, 500.0);
  require_int_range(g, "number_of_buildings", number_of_buildings, 0, 500);
  require_range(g, "water_treatment_flow_ml_per_day", water_treatment_flow_ml_per_day, 0.0, 100.0);
  require_range(g, "water_treatment_duration_years", water_treatment_duration_years, 0.0, 100.0);
  require_range(g, "water_treatment_intensity_factor", water_treatment_intensity_factor, 0.5, 3.0);
  require_int_range(g, "monitoring_duration_years", monitoring_duration_years, 1, 100);
  require_range(g, "hazardous_materials_area_ha", hazardous_materials_area_ha, 0.0, 1000.0);
}

void UnitRates::validate_or_throw() const {
  const char* g = "UnitRates";
  require_range(g, "earthworks_per_m3", earthworks_per_m3, 0.0, 100.0);
  require_range(g, "capping_base_per_m2", capping_base_per_m2, 0.0, 500.0);
  require_range(g, "capping_thickness_factor", capping_thickness_factor, 0.5, 3.0);
  require_range(g, "topsoil_per_m3", topsoil_per_m3, 0.0, 100.0);
  require_range(g, "revegetation_per_ha", revegetation_per_ha, 0.0, 100000.0);
  require_range(g, "revegetation_complexity_factor", revegetation_complexity_factor, 0.5, 3.0);
  require_range(g, "demolition_per_building", demolition_per_building, 0.0, 5000000.0);
  require_range(g, "road_rehab_per_km", road_rehab_per_km, 0.0, 1000000.0);
  require_range(g, "water_treatment_capex", water_treatment_capex, 0.0, 500000000.0);
  require_range(g, "water_treatment_opex_per_ml", water_treatment_opex_per_ml, 0.0, 10000.0);
  require_range(g, "monitoring_per_year_low", monitoring_per_year_low, 0.0, 5000000.0);
  require_range(g, "monitoring_per_year_medium", monitoring_per_year_medium, 0.0, 10000000.0);
  require_range(g, "monitoring_per_year_high", monitoring_per_year_high, 0.0, 20000000.0);
  require_range(g, "hazardous_materials_per_ha", hazardous_materials_per_ha, 0.0, 1000000.0);
  require_range(g, "community_heritage_lump_sum", community_heritage_lump_sum, 0.0, 50000000.0);
  require_range(g, "bulking_factor", bulking_factor, 1.0, 2.0);
  require_range(g, "erosion_controls_per_ha", erosion_controls_per_ha, 0.0, 50000.0);
  require_range(g, "mobilisation_lump_sum", mobilisation_lump_sum, 0.0, 50000000.0);
}

void IndirectRates::validate_or_throw() const {
  const char* g = "IndirectRates";
  require_range(g, "site_establishment_percent", site_establishment_percent, 0.0, 100.0);
  require_range(g, "contractor_margin_percent", contractor_margin_percent, 0.0, 100.0);
  require_range(g, "contingency_percent", contingency_percent, 0.0, 100.0);
  require_range(g, "owners_costs_percent", owners_costs_percent, 0.0, 100.0);
}

void RiskFactors::validate_or_throw() const {
  const char* g = "RiskFactors";
  require_range(g, "contamination_uncertainty", contamination_uncertainty, 0.0, 100.0);
  require_range(g, "geotech_uncertainty", geotech_uncertainty, 0.0, 100.0);
  require_range(g, "water_quality_uncertainty", water_quality_uncertainty, 0.0, 100.0);
  require_range(g, "regulatory_uncertainty", regulatory_uncertainty, 0.0, 100.0);
  require_range(g, "logistics_complexity", logistics_complexity, 0.0, 100.0);
}

void FinancialParams::validate_or_throw() const {
  const char* g = "FinancialParams";
  require_int_range(g, "closure_start_year", closure_start_year, 2020, 2100);
  require_range(g, "escalation_rate_percent", escalation_rate_percent, 0.0, 20.0);
  require_range(g, "discount_rate_percent", discount_rate_percent, 0.0, 30.0);
}

void PhaseDurations::validate_or_throw() const {
  static constexpr PhaseTable<int> kMaxYears{{10, 10, 20, 20, 50, 20, 100, 10}};
  for (ClosurePhase p : kAllPhases) {
    require_int_range("PhaseDurations", phase_id(p), years[p], 0, kMaxYears[p]);
  }
}

void InputState::validate_or_throw() const {
  quantities.validate_or_throw();
  unit_rates.validate_or_throw();
  indirect_rates.validate_or_throw();
  risk_factors.validate_or_throw();
  financial.validate_or_throw();
  phase_durations.validate_or_throw();
  if (scenario_name.empty() || scenario_name.size() > 100) {
    throw ValidationError("InputState: scenario_name must be 1..100 characters");
  }
}

} // namespace mcc
