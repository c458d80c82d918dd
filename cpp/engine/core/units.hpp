#pragma once
/*
================================================================================
Fragment 1.10 — Core: Units + Conversions
FILE: cpp/engine/core/units.hpp

Purpose:
  - Explicit area/volume conversion helpers so costing code stays readable and
    avoids silent unit bugs (ha vs m^2, ML/day vs ML/year).
  - Centralize constants used repeatedly across the costing modules.
================================================================================
*/

namespace mcc::units {

// Area
inline constexpr double m2_per_ha = 10000.0;

// Time
inline constexpr double days_per_year = 365.0;

// Percent
inline constexpr double percent = 100.0;

// Hectares -> square metres.
constexpr double ha_to_m2(double ha) noexcept { return ha * m2_per_ha; }

// Square metres -> hectares. Exact inverse of ha_to_m2 within rounding.
constexpr double m2_to_ha(double m2) noexcept { return m2 / m2_per_ha; }

// Daily flow sustained for a number of years -> total volume (same volume unit).
constexpr double daily_to_total(double per_day, double years) noexcept {
  return per_day * days_per_year * years;
}

// Percentage value (e.g. 12.5) -> fraction (0.125).
constexpr double pct_to_frac(double pct) noexcept { return pct / percent; }

} // namespace mcc::units
