#include "engine/core/closure_types.hpp"

namespace mcc {

const char* phase_id(ClosurePhase p) noexcept {
  switch (p) {
    case ClosurePhase::PlanningApprovals:         return "planning_approvals";
    case ClosurePhase::DecommissioningDemolition: return "decommissioning_demolition";
    case ClosurePhase::EarthworksLandform:        return "earthworks_landform";
    case ClosurePhase::TailingsWRDRehabilitation: return "tailings_wrd_rehabilitation";
    case ClosurePhase::WaterManagement:           return "water_management";
    case ClosurePhase::RevegetationEcosystem:     return "revegetation_ecosystem";
    case ClosurePhase::MonitoringMaintenance:     return "monitoring_maintenance";
    case ClosurePhase::RelinquishmentPostClosure: return "relinquishment_postclosure";
    default:                                      return "unknown";
  }
}

const char* phase_name(ClosurePhase p) noexcept {
  switch (p) {
    case ClosurePhase::PlanningApprovals:         return "Planning & Approvals";
    case ClosurePhase::DecommissioningDemolition: return "Decommissioning & Demolition";
    case ClosurePhase::EarthworksLandform:        return "Earthworks & Landform";
    case ClosurePhase::TailingsWRDRehabilitation: return "Tailings/WRD Rehabilitation";
    case ClosurePhase::WaterManagement:           return "Water Management & Treatment";
    case ClosurePhase::RevegetationEcosystem:     return "Revegetation & Ecosystem";
    case ClosurePhase::MonitoringMaintenance:     return "Monitoring & Maintenance";
    case ClosurePhase::RelinquishmentPostClosure: return "Relinquishment & Post-closure";
    default:                                      return "Unknown";
  }
}

std::optional<ClosurePhase> parse_phase_id(std::string_view id) noexcept {
  for (ClosurePhase p : kAllPhases) {
    if (id == phase_id(p)) return p;
  }
  return std::nullopt;
}

const char* category_id(CostCategory c) noexcept {
  switch (c) {
    case CostCategory::Mobilisation:        return "mobilisation";
    case CostCategory::SiteEstablishment:   return "site_establishment";
    case CostCategory::Demolition:          return "demolition";
    case CostCategory::Earthworks:          return "earthworks";
    case CostCategory::TSFClosure:          return "tsf_closure";
    case CostCategory::WRDRehabilitation:   return "wrd_rehabilitation";
    case CostCategory::WaterTreatmentCapex: return "water_treatment_capex";
    case CostCategory::WaterTreatmentOpex:  return "water_treatment_opex";
    case CostCategory::Revegetation:        return "revegetation";
    case CostCategory::ErosionControls:     return "erosion_controls";
    case CostCategory::RoadRehabilitation:  return "road_rehabilitation";
    case CostCategory::HazardousMaterials:  return "hazardous_materials";
    case CostCategory::Monitoring:          return "monitoring";
    case CostCategory::CommunityHeritage:   return "community_heritage";
    case CostCategory::Contingency:         return "contingency";
    case CostCategory::RiskUplift:          return "risk_uplift";
    case CostCategory::OwnersCosts:         return "owners_costs";
    case CostCategory::ContractorMargin:    return "contractor_margin";
    default:                                return "unknown";
  }
}

const char* category_name(CostCategory c) noexcept {
  switch (c) {
    case CostCategory::Mobilisation:        return "Mobilisation/Demobilisation";
    case CostCategory::SiteEstablishment:   return "Site Establishment & HSE";
    case CostCategory::Demolition:          return "Demolition & Removal";
    case CostCategory::Earthworks:          return "Earthworks & Landform";
    case CostCategory::TSFClosure:          return "TSF Closure";
    case CostCategory::WRDRehabilitation:   return "WRD Rehabilitation";
    case CostCategory::WaterTreatmentCapex: return "Water Treatment (Capex)";
    case CostCategory::WaterTreatmentOpex:  return "Water Treatment (Opex)";
    case CostCategory::Revegetation:        return "Revegetation";
    case CostCategory::ErosionControls:     return "Erosion & Sediment Controls";
    case CostCategory::RoadRehabilitation:  return "Road Rehabilitation";
    case CostCategory::HazardousMaterials:  return "Hazardous Materials";
    case CostCategory::Monitoring:          return "Monitoring";
    case CostCategory::CommunityHeritage:   return "Community & Heritage";
    case CostCategory::Contingency:         return "Contingency";
    case CostCategory::RiskUplift:          return "Risk Uplift";
    case CostCategory::OwnersCosts:         return "Owner's Costs";
    case CostCategory::ContractorMargin:    return "Contractor Margin";
    default:                                return "Unknown";
  }
}

std::optional<CostCategory> parse_category_id(std::string_view id) noexcept {
  for (std::size_t i = 0; i < kCategoryCount; ++i) {
    const auto c = static_cast<CostCategory>(i);
    if (id == category_id(c)) return c;
  }
  return std::nullopt;
}

const char* intensity_id(MonitoringIntensity m) noexcept {
  switch (m) {
    case MonitoringIntensity::Low:    return "low";
    case MonitoringIntensity::Medium: return "medium";
    case MonitoringIntensity::High:   return "high";
    default:                          return "medium";
  }
}

std::optional<MonitoringIntensity> parse_intensity_id(std::string_view id) noexcept {
  if (id == "low") return MonitoringIntensity::Low;
  if (id == "medium") return MonitoringIntensity::Medium;
  if (id == "high") return MonitoringIntensity::High;
  return std::nullopt;
}

const char* discount_mode_id(DiscountRateMode m) noexcept {
  return m == DiscountRateMode::Nominal ? "nominal" : "real";
}

std::optional<DiscountRateMode> parse_discount_mode_id(std::string_view id) noexcept {
  if (id == "real") return DiscountRateMode::Real;
  if (id == "nominal") return DiscountRateMode::Nominal;
  return std::nullopt;
}

} // namespace mcc
