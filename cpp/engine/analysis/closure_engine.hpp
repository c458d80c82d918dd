#pragma once
/*
================================================================================
Fragment 4.3 — Analysis: Closure Cost Engine (Top-Level Orchestrator)
FILE: cpp/engine/analysis/closure_engine.hpp

Purpose:
  Single entry point: InputState -> Results. Pure function of its input.

Order:
  derived quantities -> direct works -> indirect waterfall -> cashflows ->
  peak year -> phase/category breakdowns -> sensitivity (+/-10% unless
  configured) ->
  monitoring share.

Contract:
  - Input is assumed validated (InputState::validate_or_throw()).
  - Peak annual cashflow is the first year with the strictly largest nominal
    cost. With all-zero cashflows the peak is 0 at closure_start_year.
================================================================================
*/

#include "engine/analysis/sensitivity.hpp"
#include "engine/core/inputs.hpp"
#include "engine/core/results.hpp"

namespace mcc::analysis {

Results calculate_closure_costs(const InputState& in, const SensitivityConfig& sensitivity = {});

} // namespace mcc::analysis
