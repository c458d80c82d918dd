#pragma once
/*
================================================================================
Fragment 1.2 — Core: Closure Enumerations (Phases, Cost Categories, Modes)
FILE: cpp/engine/core/closure_types.hpp

Purpose:
  - Closed enumerations shared by every costing module.
  - Stable machine ids (exports / scenario JSON) and human-readable names
    (reports / CLI summary).
  - PhaseTable<T>: fixed-size table keyed by ClosurePhase so every phase is
    always present (defaulting to T{}), keeping percentage math total.

Notes:
  - ClosurePhase order is the default sequencing order (see phase_schedule).
  - CostCategory is presentation grouping only. No calculation branches on it
    except the monitoring cost share.
================================================================================
*/

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace mcc {

enum class ClosurePhase : int {
  PlanningApprovals = 0,
  DecommissioningDemolition = 1,
  EarthworksLandform = 2,
  TailingsWRDRehabilitation = 3,
  WaterManagement = 4,
  RevegetationEcosystem = 5,
  MonitoringMaintenance = 6,
  RelinquishmentPostClosure = 7
};

inline constexpr std::size_t kPhaseCount = 8;

inline constexpr std::array<ClosurePhase, kPhaseCount> kAllPhases = {
    ClosurePhase::PlanningApprovals,
    ClosurePhase::DecommissioningDemolition,
    ClosurePhase::EarthworksLandform,
    ClosurePhase::TailingsWRDRehabilitation,
    ClosurePhase::WaterManagement,
    ClosurePhase::RevegetationEcosystem,
    ClosurePhase::MonitoringMaintenance,
    ClosurePhase::RelinquishmentPostClosure,
};

constexpr std::size_t phase_index(ClosurePhase p) noexcept {
  return static_cast<std::size_t>(p);
}

enum class CostCategory : int {
  Mobilisation = 0,
  SiteEstablishment,
  Demolition,
  Earthworks,
  TSFClosure,
  WRDRehabilitation,
  WaterTreatmentCapex,
  WaterTreatmentOpex,
  Revegetation,
  ErosionControls,
  RoadRehabilitation,
  HazardousMaterials,
  Monitoring,
  CommunityHeritage,
  Contingency,
  RiskUplift,
  OwnersCosts,
  ContractorMargin
};

inline constexpr std::size_t kCategoryCount = 18;

constexpr std::size_t category_index(CostCategory c) noexcept {
  return static_cast<std::size_t>(c);
}

enum class MonitoringIntensity : int { Low = 0, Medium = 1, High = 2 };

// Accepted as input. Has no numeric effect on discounting (see DESIGN.md).
enum class DiscountRateMode : int { Real = 0, Nominal = 1 };

// Fixed-size table keyed by phase. Every phase always has an entry.
template <typename T>
struct PhaseTable final {
  std::array<T, kPhaseCount> values{};

  T& operator[](ClosurePhase p) noexcept { return values[phase_index(p)]; }
  const T& operator[](ClosurePhase p) const noexcept { return values[phase_index(p)]; }

  bool operator==(const PhaseTable&) const = default;
};

// ----------------------------- Names / ids -----------------------------------
const char* phase_id(ClosurePhase p) noexcept;
const char* phase_name(ClosurePhase p) noexcept;
std::optional<ClosurePhase> parse_phase_id(std::string_view id) noexcept;

const char* category_id(CostCategory c) noexcept;
const char* category_name(CostCategory c) noexcept;
std::optional<CostCategory> parse_category_id(std::string_view id) noexcept;

const char* intensity_id(MonitoringIntensity m) noexcept;
std::optional<MonitoringIntensity> parse_intensity_id(std::string_view id) noexcept;

const char* discount_mode_id(DiscountRateMode m) noexcept;
std::optional<DiscountRateMode> parse_discount_mode_id(std::string_view id) noexcept;

} // namespace mcc
