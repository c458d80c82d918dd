#pragma once
/*
================================================================================
Fragment 1.4 — Core: Closure Scenario Inputs (InputState)
FILE: cpp/engine/core/inputs.hpp

Purpose:
  - Single canonical input record for the closure cost engine.
  - Member initializers ARE the reference ("Default Scenario") values, so a
    value-initialized InputState is a complete, valid scenario.

Contract:
  - The engine assumes a validated InputState and never re-validates.
  - validate_or_throw() is the collaborator-side check (CLI, scenario loader).
    It throws ValidationError naming the group and field.

Units:
  - Areas in ha, thicknesses/depths in m, roads in km, flows in ML/day,
    rates in $ per stated unit, percentages as 0..100.
================================================================================
*/

#include <optional>
#include <string>

#include "engine/core/closure_types.hpp"

namespace mcc {

// ----------------------------- Quantities ------------------------------------
// Physical site dimensions, counts and flags that gate optional cost items.
struct Quantities {
  double disturbed_area_ha = 500.0;
  double tsf_area_ha = 100.0;
  double tsf_cover_thickness_m = 0.5;
  double wrd_footprint_ha = 200.0;
  double wrd_reshaping_depth_m = 1.0;

  // Survey-derived earthworks volume (m^3). When set, it replaces the
  // parametric TSF capping + WRD reshaping volume.
  std::optional<double> earthworks_volume_m3_override;

  double topsoil_thickness_m = 0.15;
  double recontouring_area_ha = 300.0;
  double road_length_km = 20.0;
  int number_of_buildings = 15;

  double water_treatment_flow_ml_per_day = 2.0;
  double water_treatment_duration_years = 10.0;
  // 0.5 = simple, 1.0 = standard, 2.0 = complex
  double water_treatment_intensity_factor = 1.0;

  int monitoring_duration_years = 15;
  MonitoringIntensity monitoring_intensity = MonitoringIntensity::Medium;

  bool hazardous_materials_enabled = false;
  double hazardous_materials_area_ha = 0.0;

  bool community_heritage_enabled = true;

  void validate_or_throw() const;

  bool operator==(const Quantities&) const = default;
};

// ----------------------------- Unit rates ------------------------------------
// AUD, 2024 basis.
struct UnitRates {
  double earthworks_per_m3 = 8.0;
  double capping_base_per_m2 = 25.0;
  double capping_thickness_factor = 1.5;   // multiplier per metre of cover
  double topsoil_per_m3 = 15.0;

  double revegetation_per_ha = 8000.0;
  double revegetation_complexity_factor = 1.0;

  double demolition_per_building = 150000.0;
  double road_rehab_per_km = 50000.0;

  double water_treatment_capex = 5000000.0;
  double water_treatment_opex_per_ml = 500.0;

  double monitoring_per_year_low = 200000.0;
  double monitoring_per_year_medium = 500000.0;
  double monitoring_per_year_high = 1000000.0;

  double hazardous_materials_per_ha = 100000.0;
  double community_heritage_lump_sum = 500000.0;

  double bulking_factor = 1.2;
  double erosion_controls_per_ha = 3000.0;
  double mobilisation_lump_sum = 2000000.0;

  double monitoring_rate(MonitoringIntensity m) const noexcept {
    switch (m) {
      case MonitoringIntensity::Low:  return monitoring_per_year_low;
      case MonitoringIntensity::High: return monitoring_per_year_high;
      case MonitoringIntensity::Medium:
      default:                        return monitoring_per_year_medium;
    }
  }

  void validate_or_throw() const;

  bool operator==(const UnitRates&) const = default;
};

// ----------------------------- Indirect rates --------------------------------
struct IndirectRates {
  double site_establishment_percent = 12.0;  // of direct works
  double contractor_margin_percent = 10.0;   // of direct + site establishment
  double contingency_percent = 15.0;         // of direct + site est. + margin
  double owners_costs_percent = 5.0;         // of everything before owner's costs

  void validate_or_throw() const;

  bool operator==(const IndirectRates&) const = default;
};

// ----------------------------- Risk factors ----------------------------------
// Each 0..100.
struct RiskFactors {
  double contamination_uncertainty = 30.0;
  double geotech_uncertainty = 25.0;
  double water_quality_uncertainty = 35.0;
  double regulatory_uncertainty = 20.0;
  double logistics_complexity = 25.0;

  void validate_or_throw() const;

  bool operator==(const RiskFactors&) const = default;
};

// ----------------------------- Financial -------------------------------------
struct FinancialParams {
  int closure_start_year = 2026;
  double escalation_rate_percent = 3.0;
  double discount_rate_percent = 7.0;
  DiscountRateMode discount_rate_mode = DiscountRateMode::Real;

  void validate_or_throw() const;

  bool operator==(const FinancialParams&) const = default;
};

// ----------------------------- Phase durations -------------------------------
// Whole years per phase.
struct PhaseDurations {
  PhaseTable<int> years{{2, 2, 3, 3, 10, 3, 15, 2}};

  int operator[](ClosurePhase p) const noexcept { return years[p]; }
  int& operator[](ClosurePhase p) noexcept { return years[p]; }

  void validate_or_throw() const;

  bool operator==(const PhaseDurations&) const = default;
};

// ----------------------------- InputState ------------------------------------
struct InputState {
  Quantities quantities;
  UnitRates unit_rates;
  IndirectRates indirect_rates;
  RiskFactors risk_factors;
  FinancialParams financial;
  PhaseDurations phase_durations;
  std::string scenario_name = "Default Scenario";

  void validate_or_throw() const;

  bool operator==(const InputState&) const = default;
};

// Fresh copy of the reference scenario.
inline InputState default_input_state() { return InputState{}; }

} // namespace mcc
