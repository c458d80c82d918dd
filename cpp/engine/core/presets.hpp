#pragma once
/*
================================================================================
Fragment 1.5 — Core: Scenario Presets
FILE: cpp/engine/core/presets.hpp

Pre-configured scenarios for common closure situations. Illustrative values,
to be adjusted for a specific site.
================================================================================
*/

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/inputs.hpp"

namespace mcc {

struct ScenarioPreset {
  std::string id;
  std::string name;
  std::string description;
  InputState inputs;
};

// All presets, in display order.
const std::vector<ScenarioPreset>& scenario_presets();

// Copy of the preset inputs, or nullopt if the id is unknown.
std::optional<InputState> preset_inputs(std::string_view id);

} // namespace mcc
