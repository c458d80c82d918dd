#include "engine/costing/direct_works.hpp"

#include <string>

#include "engine/core/units.hpp"
#include "engine/costing/line_items.hpp"

namespace mcc::costing {

namespace {

using Q = const InputState&;
using D = const DerivedQuantities&;

bool always(Q, D) { return true; }

LineItemCost mobilisation(Q in, D) {
  return make_line_item(CostCategory::Mobilisation, "Site mobilisation and demobilisation",
                        1.0, "lump sum", in.unit_rates.mobilisation_lump_sum,
                        ClosurePhase::DecommissioningDemolition);
}

bool has_buildings(Q in, D) { return in.quantities.number_of_buildings > 0; }

LineItemCost demolition(Q in, D) {
  return make_line_item(CostCategory::Demolition, "Building and structure demolition",
                        static_cast<double>(in.quantities.number_of_buildings), "buildings",
                        in.unit_rates.demolition_per_building,
                        ClosurePhase::DecommissioningDemolition);
}

bool has_earthworks(Q, D d) { return d.total_earthworks_volume_m3 > 0.0; }

LineItemCost earthworks(Q in, D d) {
  return make_line_item(CostCategory::Earthworks, "General earthworks (recontouring, reshaping)",
                        d.total_earthworks_volume_m3, "m3", in.unit_rates.earthworks_per_m3,
                        ClosurePhase::EarthworksLandform);
}

bool has_topsoil(Q, D d) { return d.topsoil_volume_m3 > 0.0; }

LineItemCost topsoil(Q in, D d) {
  return make_line_item(CostCategory::Earthworks, "Topsoil placement", d.topsoil_volume_m3, "m3",
                        in.unit_rates.topsoil_per_m3, ClosurePhase::EarthworksLandform);
}

bool has_tsf(Q in, D) { return in.quantities.tsf_area_ha > 0.0; }

LineItemCost tsf_closure(Q in, D d) {
  const UnitRates& r = in.unit_rates;
  const double per_m2 =
      r.capping_base_per_m2 * (in.quantities.tsf_cover_thickness_m * r.capping_thickness_factor);
  return make_line_item(CostCategory::TSFClosure, "TSF capping and closure", d.tsf_area_m2, "m2",
                        per_m2, ClosurePhase::TailingsWRDRehabilitation);
}

bool has_wrd(Q in, D) { return in.quantities.wrd_footprint_ha > 0.0; }

LineItemCost wrd_rehabilitation(Q in, D d) {
  const UnitRates& r = in.unit_rates;
  const double per_m2 = r.capping_base_per_m2 * (in.quantities.wrd_reshaping_depth_m *
                                                 r.capping_thickness_factor * kWrdCappingIntensity);
  return make_line_item(CostCategory::WRDRehabilitation, "WRD reshaping and cover", d.wrd_area_m2,
                        "m2", per_m2, ClosurePhase::TailingsWRDRehabilitation);
}

bool has_water_treatment(Q in, D) {
  return in.quantities.water_treatment_duration_years > 0.0 &&
         in.quantities.water_treatment_flow_ml_per_day > 0.0;
}

LineItemCost water_capex(Q in, D) {
  const double capex =
      in.unit_rates.water_treatment_capex * in.quantities.water_treatment_intensity_factor;
  return make_line_item(CostCategory::WaterTreatmentCapex, "Water treatment plant (capex)", 1.0,
                        "plant", capex, ClosurePhase::WaterManagement);
}

LineItemCost water_opex(Q in, D) {
  const Quantities& q = in.quantities;
  const double annual_opex = units::daily_to_total(q.water_treatment_flow_ml_per_day, 1.0) *
                             in.unit_rates.water_treatment_opex_per_ml *
                             q.water_treatment_intensity_factor;
  return make_line_item(CostCategory::WaterTreatmentOpex, "Water treatment operations (opex)",
                        q.water_treatment_duration_years, "years", annual_opex,
                        ClosurePhase::WaterManagement);
}

bool has_disturbed_area(Q in, D) { return in.quantities.disturbed_area_ha > 0.0; }

LineItemCost revegetation(Q in, D) {
  const double rate =
      in.unit_rates.revegetation_per_ha * in.unit_rates.revegetation_complexity_factor;
  return make_line_item(CostCategory::Revegetation, "Revegetation and ecosystem establishment",
                        in.quantities.disturbed_area_ha, "ha", rate,
                        ClosurePhase::RevegetationEcosystem);
}

LineItemCost erosion_controls(Q in, D) {
  return make_line_item(CostCategory::ErosionControls, "Erosion and sediment controls",
                        in.quantities.disturbed_area_ha, "ha",
                        in.unit_rates.erosion_controls_per_ha, ClosurePhase::EarthworksLandform);
}

bool has_roads(Q in, D) { return in.quantities.road_length_km > 0.0; }

LineItemCost road_rehabilitation(Q in, D) {
  return make_line_item(CostCategory::RoadRehabilitation, "Road and access rehabilitation",
                        in.quantities.road_length_km, "km", in.unit_rates.road_rehab_per_km,
                        ClosurePhase::EarthworksLandform);
}

bool has_hazardous(Q in, D) {
  return in.quantities.hazardous_materials_enabled &&
         in.quantities.hazardous_materials_area_ha > 0.0;
}

LineItemCost hazardous_materials(Q in, D) {
  return make_line_item(CostCategory::HazardousMaterials,
                        "Hazardous materials handling and disposal",
                        in.quantities.hazardous_materials_area_ha, "ha",
                        in.unit_rates.hazardous_materials_per_ha,
                        ClosurePhase::DecommissioningDemolition);
}

LineItemCost monitoring(Q in, D) {
  const Quantities& q = in.quantities;
  return make_line_item(
      CostCategory::Monitoring,
      std::string("Environmental monitoring (") + intensity_id(q.monitoring_intensity) +
          " intensity)",
      static_cast<double>(q.monitoring_duration_years), "years",
      in.unit_rates.monitoring_rate(q.monitoring_intensity), ClosurePhase::MonitoringMaintenance);
}

bool has_community_heritage(Q in, D) { return in.quantities.community_heritage_enabled; }

LineItemCost community_heritage(Q in, D) {
  return make_line_item(CostCategory::CommunityHeritage, "Community and heritage management", 1.0,
                        "lump sum", in.unit_rates.community_heritage_lump_sum,
                        ClosurePhase::PlanningApprovals);
}

}  // namespace

const std::vector<DirectWorksRule>& direct_works_rules() {
  static const std::vector<DirectWorksRule> kRules = {
      {"mobilisation", &always, &mobilisation},
      {"demolition", &has_buildings, &demolition},
      {"earthworks", &has_earthworks, &earthworks},
      {"topsoil", &has_topsoil, &topsoil},
      {"tsf_closure", &has_tsf, &tsf_closure},
      {"wrd_rehabilitation", &has_wrd, &wrd_rehabilitation},
      {"water_capex", &has_water_treatment, &water_capex},
      {"water_opex", &has_water_treatment, &water_opex},
      {"revegetation", &has_disturbed_area, &revegetation},
      {"erosion_controls", &has_disturbed_area, &erosion_controls},
      {"road_rehabilitation", &has_roads, &road_rehabilitation},
      {"hazardous_materials", &has_hazardous, &hazardous_materials},
      {"monitoring", &always, &monitoring},
      {"community_heritage", &has_community_heritage, &community_heritage},
  };
  return kRules;
}

std::vector<LineItemCost> calculate_direct_works_costs(const InputState& in,
                                                       const DerivedQuantities& d) {
  std::vector<LineItemCost> items;
  const auto& rules = direct_works_rules();
  items.reserve(rules.size());
  for (const auto& rule : rules) {
    if (rule.applies(in, d)) items.push_back(rule.build(in, d));
  }
  return items;
}

} // namespace mcc::costing
