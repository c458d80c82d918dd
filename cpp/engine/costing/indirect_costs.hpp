#pragma once
/*
================================================================================
Fragment 2.4 — Costing: Indirect Cost Builder (Markup Waterfall)
FILE: cpp/engine/costing/indirect_costs.hpp

Five ordered, dependent items. Each percentage applies to a running subtotal
that includes every prior indirect item:

  1. SiteEstablishment = D * site%                         (D = direct total)
  2. ContractorMargin  = (D + SE) * margin%
  3. Contingency       = (D + SE + CM) * contingency%
  4. RiskUplift        = (D + SE + CM) * riskUplift%       (same base as 3)
  5. OwnersCosts       = (D + SE + CM + C + RU) * owners%

The order is the commercial stacking order and must not change.
Line item encoding: quantity = percentage, unit_rate = base / 100, so
subtotal = quantity * unit_rate.
================================================================================
*/

#include <vector>

#include "engine/core/inputs.hpp"
#include "engine/core/results.hpp"

namespace mcc::costing {

std::vector<LineItemCost> calculate_indirect_costs(double direct_works_total,
                                                   const InputState& in,
                                                   const DerivedQuantities& d);

} // namespace mcc::costing
