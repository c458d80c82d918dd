#include "engine/schedule/phase_schedule.hpp"

#include <algorithm>

namespace mcc::schedule {

namespace {

// Years until the decommissioning phase is complete.
int decommissioning_end(const PhaseDurations& d) noexcept {
  return d[ClosurePhase::PlanningApprovals] + d[ClosurePhase::DecommissioningDemolition];
}

// Earthworks and TSF/WRD rehabilitation run in parallel.
int landform_end(const PhaseDurations& d) noexcept {
  return decommissioning_end(d) +
         std::max(d[ClosurePhase::EarthworksLandform], d[ClosurePhase::TailingsWRDRehabilitation]);
}

int revegetation_end(const PhaseDurations& d) noexcept {
  return landform_end(d) + d[ClosurePhase::RevegetationEcosystem];
}

int long_term_end(const PhaseDurations& d) noexcept {
  return revegetation_end(d) +
         std::max(d[ClosurePhase::WaterManagement], d[ClosurePhase::MonitoringMaintenance]);
}

}  // namespace

int phase_start_year(ClosurePhase phase, const PhaseDurations& d) noexcept {
  switch (phase) {
    case ClosurePhase::PlanningApprovals:
      return 0;
    case ClosurePhase::DecommissioningDemolition:
      return d[ClosurePhase::PlanningApprovals];
    case ClosurePhase::EarthworksLandform:
    case ClosurePhase::TailingsWRDRehabilitation:
    case ClosurePhase::WaterManagement:
      return decommissioning_end(d);
    case ClosurePhase::RevegetationEcosystem:
      return landform_end(d);
    case ClosurePhase::MonitoringMaintenance:
      return revegetation_end(d);
    case ClosurePhase::RelinquishmentPostClosure:
      return long_term_end(d);
    default:
      return 0;
  }
}

int total_duration_years(const PhaseDurations& d) noexcept {
  return long_term_end(d) + d[ClosurePhase::RelinquishmentPostClosure];
}

PhaseSchedule build_phase_schedule(const PhaseDurations& d) noexcept {
  PhaseSchedule s;
  for (ClosurePhase p : kAllPhases) s.start_year[p] = phase_start_year(p, d);
  s.total_duration_years = total_duration_years(d);
  return s;
}

} // namespace mcc::schedule
