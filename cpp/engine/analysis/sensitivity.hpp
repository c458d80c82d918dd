#pragma once
/*
===============================================================================
Fragment 4.2 — Sensitivity Analyzer (One-at-a-time, +/- X% Drivers) (C++)
File: cpp/engine/analysis/sensitivity.hpp
===============================================================================

For each driver in a fixed table:
  low  = base * (1 - v/100)
  high = base * (1 + v/100)           (v defaults to 10)
A driver whose base value is exactly 0 is skipped. Otherwise the full cost
pipeline runs on a modified copy of the input at both ends, recording total
cost and NPV plus high-low deltas. Results are sorted by |delta_cost|,
descending.

Branches share nothing; each works on its own InputState copy.
*/

#include <vector>

#include "engine/core/inputs.hpp"
#include "engine/core/results.hpp"

namespace mcc::analysis {

inline constexpr double kDefaultVariationPercent = 10.0;

struct SensitivityDriver {
  const char* name;
  const char* key;
  const char* unit;
  double (*get)(const InputState&);
  void (*set)(InputState&, double);
};

// The eight wired drivers: disturbed area, earthworks rate, TSF area, TSF
// cover thickness, water treatment duration, contingency %, discount rate,
// revegetation rate.
const std::vector<SensitivityDriver>& sensitivity_drivers();

struct SensitivityConfig {
  double variation_percent = kDefaultVariationPercent;

  // Throws ArgumentError unless variation_percent is finite and in [0, 100].
  void validate() const;
};

std::vector<SensitivityResult> calculate_sensitivity(const InputState& in,
                                                     const SensitivityConfig& cfg = {});

inline std::vector<SensitivityResult> calculate_sensitivity(const InputState& in,
                                                            double variation_percent) {
  return calculate_sensitivity(in, SensitivityConfig{variation_percent});
}

} // namespace mcc::analysis
