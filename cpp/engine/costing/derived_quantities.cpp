#include "engine/costing/derived_quantities.hpp"

#include "engine/core/units.hpp"
#include "engine/costing/risk_score.hpp"

namespace mcc::costing {

DerivedQuantities calculate_derived_quantities(const InputState& in) noexcept {
  const Quantities& q = in.quantities;
  DerivedQuantities d{};

  d.tsf_area_m2 = units::ha_to_m2(q.tsf_area_ha);
  d.wrd_area_m2 = units::ha_to_m2(q.wrd_footprint_ha);
  d.disturbed_area_m2 = units::ha_to_m2(q.disturbed_area_ha);
  d.recontouring_area_m2 = units::ha_to_m2(q.recontouring_area_ha);

  d.tsf_capping_volume_m3 = d.tsf_area_m2 * q.tsf_cover_thickness_m;
  d.wrd_earthworks_volume_m3 =
      d.wrd_area_m2 * q.wrd_reshaping_depth_m * in.unit_rates.bulking_factor;

  d.total_earthworks_volume_m3 = q.earthworks_volume_m3_override
                                     ? *q.earthworks_volume_m3_override
                                     : d.tsf_capping_volume_m3 + d.wrd_earthworks_volume_m3;

  d.topsoil_volume_m3 = d.disturbed_area_m2 * q.topsoil_thickness_m;

  d.total_water_treatment_ml =
      units::daily_to_total(q.water_treatment_flow_ml_per_day, q.water_treatment_duration_years);

  d.risk_score = calculate_risk_score(in.risk_factors);
  d.risk_uplift_percent = risk_score_to_uplift(d.risk_score);
  return d;
}

} // namespace mcc::costing
