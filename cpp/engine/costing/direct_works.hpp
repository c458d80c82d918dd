#pragma once
/*
================================================================================
Fragment 2.3 — Costing: Direct Works Cost Builder
FILE: cpp/engine/costing/direct_works.hpp

Purpose:
  Itemized cost lines for the physical closure works. Each item is a row in a
  declarative rule table: (id, applies, build). A rule contributes a line only
  when its condition holds, so the table is the single place to audit which
  items appear for which inputs.

Rule table (condition -> phase):
  mobilisation        always                         -> DecommissioningDemolition
  demolition          buildings > 0                  -> DecommissioningDemolition
  earthworks          total earthworks volume > 0    -> EarthworksLandform
  topsoil             topsoil volume > 0             -> EarthworksLandform
  tsf_closure         tsf area > 0                   -> TailingsWRDRehabilitation
  wrd_rehabilitation  wrd footprint > 0              -> TailingsWRDRehabilitation
  water_capex         duration > 0 AND flow > 0      -> WaterManagement
  water_opex          duration > 0 AND flow > 0      -> WaterManagement
  revegetation        disturbed area > 0             -> RevegetationEcosystem
  erosion_controls    disturbed area > 0             -> EarthworksLandform
  road_rehabilitation road length > 0                -> EarthworksLandform
  hazardous_materials enabled AND area > 0           -> DecommissioningDemolition
  monitoring          always                         -> MonitoringMaintenance
  community_heritage  enabled                        -> PlanningApprovals

Notes:
  - WRD cover is costed at half the TSF capping intensity per metre of
    reshaping depth. This is a deliberate simplification.
  - Pure: no side effects, no errors for validated input.
================================================================================
*/

#include <vector>

#include "engine/core/inputs.hpp"
#include "engine/core/results.hpp"

namespace mcc::costing {

// WRD capping intensity relative to TSF capping.
inline constexpr double kWrdCappingIntensity = 0.5;

struct DirectWorksRule {
  const char* id;
  bool (*applies)(const InputState&, const DerivedQuantities&);
  LineItemCost (*build)(const InputState&, const DerivedQuantities&);
};

// Rule table in presentation order.
const std::vector<DirectWorksRule>& direct_works_rules();

// Line items for every rule whose condition holds, in table order.
std::vector<LineItemCost> calculate_direct_works_costs(const InputState& in,
                                                       const DerivedQuantities& d);

} // namespace mcc::costing
