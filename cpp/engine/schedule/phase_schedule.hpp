#pragma once
/*
================================================================================
Fragment 3.1 — Schedule: Phase Scheduler (Overlap Model)
FILE: cpp/engine/schedule/phase_schedule.hpp

Start year of each phase, relative to closure start (year 0). Not purely
sequential:

  PlanningApprovals          0
  DecommissioningDemolition  P
  EarthworksLandform         P + Dm                       (parallel with TSF/WRD)
  TailingsWRDRehabilitation  P + Dm                       (parallel with earthworks)
  WaterManagement            P + Dm                       (long-running track)
  RevegetationEcosystem      P + Dm + max(E, T)
  MonitoringMaintenance      P + Dm + max(E, T) + R
  RelinquishmentPostClosure  P + Dm + max(E, T) + R + max(W, M)

  total = P + Dm + max(E, T) + R + max(W, M) + Rel

The max(W, M) term reconciles the water track (started early, alongside the
earthworks) with the monitoring track before relinquishment.
================================================================================
*/

#include "engine/core/closure_types.hpp"
#include "engine/core/inputs.hpp"

namespace mcc::schedule {

struct PhaseSchedule {
  PhaseTable<int> start_year;  // relative to closure start
  int total_duration_years = 0;
};

int phase_start_year(ClosurePhase phase, const PhaseDurations& d) noexcept;

int total_duration_years(const PhaseDurations& d) noexcept;

PhaseSchedule build_phase_schedule(const PhaseDurations& d) noexcept;

} // namespace mcc::schedule
