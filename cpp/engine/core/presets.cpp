#include "engine/core/presets.hpp"

namespace mcc {

namespace {

void set_durations(InputState& s, PhaseTable<int> years) {
  s.phase_durations.years = years;
}

// Smaller operation, limited tailings, short monitoring period.
ScenarioPreset small_open_pit() {
  ScenarioPreset p;
  p.id = "small-open-pit";
  p.name = "Small Open Pit, Low Water Risk";
  p.description =
      "A smaller open pit operation with limited tailings and minimal water treatment "
      "requirements. Suitable for sites with benign geology and low environmental risk.";

  InputState& s = p.inputs;
  s.scenario_name = p.name;
  Quantities& q = s.quantities;
  q.disturbed_area_ha = 150.0;
  q.tsf_area_ha = 30.0;
  q.tsf_cover_thickness_m = 0.3;
  q.wrd_footprint_ha = 50.0;
  q.wrd_reshaping_depth_m = 0.5;
  q.topsoil_thickness_m = 0.15;
  q.recontouring_area_ha = 80.0;
  q.road_length_km = 8.0;
  q.number_of_buildings = 8;
  q.water_treatment_flow_ml_per_day = 0.5;
  q.water_treatment_duration_years = 5.0;
  q.water_treatment_intensity_factor = 0.8;
  q.monitoring_duration_years = 10;
  q.monitoring_intensity = MonitoringIntensity::Low;
  q.hazardous_materials_enabled = false;
  q.hazardous_materials_area_ha = 0.0;
  q.community_heritage_enabled = false;

  s.risk_factors = RiskFactors{15.0, 20.0, 15.0, 15.0, 20.0};
  set_durations(s, PhaseTable<int>{{1, 1, 2, 2, 5, 2, 10, 1}});
  return p;
}

// Major operation, large waste rock dump, moderate water issues.
ScenarioPreset large_open_pit_wrd() {
  ScenarioPreset p;
  p.id = "large-open-pit-wrd";
  p.name = "Large Open Pit + WRD";
  p.description =
      "A large-scale open pit operation with significant waste rock dump requiring extensive "
      "reshaping. Moderate water treatment needs and standard monitoring.";

  InputState& s = p.inputs;
  s.scenario_name = p.name;
  Quantities& q = s.quantities;
  q.disturbed_area_ha = 800.0;
  q.tsf_area_ha = 150.0;
  q.tsf_cover_thickness_m = 0.5;
  q.wrd_footprint_ha = 400.0;
  q.wrd_reshaping_depth_m = 1.5;
  q.topsoil_thickness_m = 0.2;
  q.recontouring_area_ha = 500.0;
  q.road_length_km = 35.0;
  q.number_of_buildings = 25;
  q.water_treatment_flow_ml_per_day = 3.0;
  q.water_treatment_duration_years = 12.0;
  q.water_treatment_intensity_factor = 1.0;
  q.monitoring_duration_years = 20;
  q.monitoring_intensity = MonitoringIntensity::Medium;
  q.hazardous_materials_enabled = true;
  q.hazardous_materials_area_ha = 5.0;
  q.community_heritage_enabled = true;

  s.unit_rates.mobilisation_lump_sum = 3500000.0;
  s.unit_rates.demolition_per_building = 180000.0;

  s.risk_factors = RiskFactors{30.0, 35.0, 30.0, 25.0, 30.0};
  set_durations(s, PhaseTable<int>{{2, 3, 4, 4, 12, 4, 20, 2}});
  return p;
}

// Tailings facility is the primary rehabilitation challenge.
ScenarioPreset tsf_dominant() {
  ScenarioPreset p;
  p.id = "tsf-dominant";
  p.name = "TSF-Dominant Site";
  p.description =
      "A site where the Tailings Storage Facility is the primary closure challenge. Large TSF "
      "requiring extensive capping and long-term seepage management.";

  InputState& s = p.inputs;
  s.scenario_name = p.name;
  Quantities& q = s.quantities;
  q.disturbed_area_ha = 600.0;
  q.tsf_area_ha = 350.0;
  q.tsf_cover_thickness_m = 0.8;
  q.wrd_footprint_ha = 100.0;
  q.wrd_reshaping_depth_m = 0.8;
  q.topsoil_thickness_m = 0.15;
  q.recontouring_area_ha = 400.0;
  q.road_length_km = 25.0;
  q.number_of_buildings = 18;
  q.water_treatment_flow_ml_per_day = 2.0;
  q.water_treatment_duration_years = 15.0;
  q.water_treatment_intensity_factor = 1.2;
  q.monitoring_duration_years = 25;
  q.monitoring_intensity = MonitoringIntensity::Medium;
  q.hazardous_materials_enabled = true;
  q.hazardous_materials_area_ha = 10.0;
  q.community_heritage_enabled = true;

  s.unit_rates.capping_base_per_m2 = 30.0;
  s.unit_rates.capping_thickness_factor = 1.6;
  s.unit_rates.water_treatment_capex = 8000000.0;

  s.risk_factors = RiskFactors{40.0, 45.0, 50.0, 35.0, 25.0};
  set_durations(s, PhaseTable<int>{{2, 2, 3, 5, 15, 4, 25, 2}});
  return p;
}

// AMD or other water quality issues requiring extended treatment.
ScenarioPreset high_water() {
  ScenarioPreset p;
  p.id = "high-water";
  p.name = "High Water Treatment, Long Monitoring";
  p.description =
      "A site with significant water quality challenges requiring intensive, long-term "
      "treatment (e.g., AMD). Extended monitoring period before relinquishment.";

  InputState& s = p.inputs;
  s.scenario_name = p.name;
  Quantities& q = s.quantities;
  q.disturbed_area_ha = 450.0;
  q.tsf_area_ha = 120.0;
  q.tsf_cover_thickness_m = 0.6;
  q.wrd_footprint_ha = 180.0;
  q.wrd_reshaping_depth_m = 1.0;
  q.topsoil_thickness_m = 0.2;
  q.recontouring_area_ha = 300.0;
  q.road_length_km = 20.0;
  q.number_of_buildings = 15;
  q.water_treatment_flow_ml_per_day = 8.0;
  q.water_treatment_duration_years = 30.0;
  q.water_treatment_intensity_factor = 1.8;
  q.monitoring_duration_years = 40;
  q.monitoring_intensity = MonitoringIntensity::High;
  q.hazardous_materials_enabled = true;
  q.hazardous_materials_area_ha = 8.0;
  q.community_heritage_enabled = true;

  s.unit_rates.water_treatment_capex = 15000000.0;
  s.unit_rates.water_treatment_opex_per_ml = 800.0;
  s.unit_rates.monitoring_per_year_high = 1500000.0;

  s.risk_factors = RiskFactors{50.0, 30.0, 70.0, 45.0, 30.0};
  set_durations(s, PhaseTable<int>{{2, 2, 3, 3, 30, 3, 40, 3}});
  return p;
}

}  // namespace

const std::vector<ScenarioPreset>& scenario_presets() {
  static const std::vector<ScenarioPreset> kPresets = {
      small_open_pit(),
      large_open_pit_wrd(),
      tsf_dominant(),
      high_water(),
  };
  return kPresets;
}

std::optional<InputState> preset_inputs(std::string_view id) {
  for (const auto& p : scenario_presets()) {
    if (p.id == id) return p.inputs;
  }
  return std::nullopt;
}

} // namespace mcc
