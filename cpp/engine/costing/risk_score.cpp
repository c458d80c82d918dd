#include "engine/costing/risk_score.hpp"

#include <array>
#include <cmath>

namespace mcc::costing {

namespace {

struct UpliftBreakpoint {
  double score;
  double uplift;
};

// Segment end points. Interpolation is linear between neighbours.
constexpr std::array<UpliftBreakpoint, 6> kUpliftCurve = {{
    {0.0, 0.0},
    {20.0, 5.0},
    {40.0, 10.0},
    {60.0, 20.0},
    {80.0, 35.0},
    {100.0, 50.0},
}};

}  // namespace

double calculate_risk_score(const RiskFactors& f) noexcept {
  const RiskWeights& w = kRiskWeights;
  const double score = f.contamination_uncertainty * w.contamination +
                       f.geotech_uncertainty * w.geotech +
                       f.water_quality_uncertainty * w.water_quality +
                       f.regulatory_uncertainty * w.regulatory +
                       f.logistics_complexity * w.logistics;
  return std::round(score * 10.0) / 10.0;
}

double risk_score_to_uplift(double score) noexcept {
  // Scores past the last breakpoint extend the final segment.
  std::size_t i = 1;
  while (i + 1 < kUpliftCurve.size() && score > kUpliftCurve[i].score) ++i;

  const UpliftBreakpoint& a = kUpliftCurve[i - 1];
  const UpliftBreakpoint& b = kUpliftCurve[i];
  return a.uplift + ((score - a.score) / (b.score - a.score)) * (b.uplift - a.uplift);
}

} // namespace mcc::costing
