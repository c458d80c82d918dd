#pragma once
/*
================================================================================
Fragment 2.1 — Costing: Risk Scorer
FILE: cpp/engine/costing/risk_score.hpp

Composite risk score = weighted sum of the five risk factors, rounded to one
decimal. Weights: contamination 0.25, geotech 0.20, water quality 0.25,
regulatory 0.15, logistics 0.15 (sum 1.0).

Risk uplift is a 5-segment piecewise-linear, continuous, non-decreasing map:
    score   0-20  ->  0-5 %
           20-40  ->  5-10 %
           40-60  -> 10-20 %
           60-80  -> 20-35 %
          80-100  -> 35-50 %
================================================================================
*/

#include "engine/core/inputs.hpp"

namespace mcc::costing {

struct RiskWeights {
  double contamination = 0.25;
  double geotech = 0.20;
  double water_quality = 0.25;
  double regulatory = 0.15;
  double logistics = 0.15;
};

inline constexpr RiskWeights kRiskWeights{};

// Weighted composite score (0..100), rounded to one decimal.
double calculate_risk_score(const RiskFactors& f) noexcept;

// Piecewise-linear uplift percentage (0..50) for a score in [0,100].
double risk_score_to_uplift(double score) noexcept;

} // namespace mcc::costing
