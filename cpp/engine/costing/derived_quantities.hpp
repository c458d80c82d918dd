#pragma once
/*
================================================================================
Fragment 2.2 — Costing: Derived Quantity Calculator
FILE: cpp/engine/costing/derived_quantities.hpp

Converts raw scenario inputs into the physical quantities the cost builders
consume:
  tsf_area_m2             = ha_to_m2(tsf_area_ha)
  wrd_area_m2             = ha_to_m2(wrd_footprint_ha)
  tsf_capping_volume_m3   = tsf_area_m2 * tsf_cover_thickness_m
  wrd_earthworks_volume_m3= wrd_area_m2 * wrd_reshaping_depth_m * bulking_factor
  total_earthworks_volume = override if set, else capping + WRD volume
  topsoil_volume_m3       = disturbed_area_m2 * topsoil_thickness_m
  total_water_treatment_ml= flow_ml_per_day * 365 * duration_years
  risk score / uplift     (risk_score.hpp)

The earthworks override is intentional: it lets survey-derived volumes
bypass the parametric model entirely.
================================================================================
*/

#include "engine/core/inputs.hpp"
#include "engine/core/results.hpp"

namespace mcc::costing {

DerivedQuantities calculate_derived_quantities(const InputState& in) noexcept;

} // namespace mcc::costing
