#pragma once
/*
================================================================================
Fragment 5.3 — Exports: Scenario JSON (Write + Parse)
FILE: cpp/engine/exports/scenario_json.hpp

Writer:
  InputState -> JSON, grouped exactly like the record (quantities, unit_rates,
  indirect_rates, risk_factors, financial, phase_durations). Enums by id.
  An absent earthworks override is written as `null`.

Parser:
  - Strict JSON: rejects NaN/Inf literals, leading '+', trailing characters.
  - Missing keys keep the reference default; unknown keys are ignored.
  - `null` for earthworks_volume_m3_override means "no override".
  - Integer fields reject fractional values.
  - Does NOT range-check; call InputState::validate_or_throw() afterwards.
================================================================================
*/

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

#include "engine/core/inputs.hpp"
#include "engine/exports/json_writer.hpp"

namespace mcc {

struct JsonParseError {
  std::string message;
  size_t offset = 0;  // byte offset in input
  int line = 1;       // 1-based
  int col = 1;        // 1-based
};

void write_scenario_json(std::ostream& os, const InputState& in, const JsonWriteOptions& opt = {});

std::string scenario_to_json(const InputState& in, const JsonWriteOptions& opt = {});

bool parse_scenario_json(std::string_view json, InputState* out, JsonParseError* err = nullptr);

// Stream convenience (reads full stream into memory).
bool parse_scenario_json(std::istream& is, InputState* out, JsonParseError* err = nullptr);

} // namespace mcc
