#include "engine/costing/indirect_costs.hpp"

#include <iomanip>
#include <sstream>
#include <string>

#include "engine/costing/line_items.hpp"

namespace mcc::costing {

namespace {

std::string risk_uplift_description(double score) {
  std::ostringstream oss;
  // Shortest form: 28 prints as "28", 28.6 as "28.6".
  oss << "Risk-based uplift (score: " << std::setprecision(15) << score << ")";
  return oss.str();
}

}  // namespace

std::vector<LineItemCost> calculate_indirect_costs(double direct_works_total,
                                                   const InputState& in,
                                                   const DerivedQuantities& d) {
  const IndirectRates& r = in.indirect_rates;
  std::vector<LineItemCost> items;
  items.reserve(5);

  const double base_site = direct_works_total;
  items.push_back(make_line_item(CostCategory::SiteEstablishment,
                                 "Site establishment, HSE, and project management",
                                 r.site_establishment_percent, "% of direct", base_site / 100.0,
                                 ClosurePhase::PlanningApprovals));
  const double site_est = items.back().subtotal;

  const double base_margin = base_site + site_est;
  items.push_back(make_line_item(CostCategory::ContractorMargin, "Contractor margin",
                                 r.contractor_margin_percent, "% of subtotal",
                                 base_margin / 100.0, ClosurePhase::DecommissioningDemolition));
  const double margin = items.back().subtotal;

  const double base_contingency = base_margin + margin;
  items.push_back(make_line_item(CostCategory::Contingency, "Base contingency",
                                 r.contingency_percent, "% of subtotal",
                                 base_contingency / 100.0, ClosurePhase::PlanningApprovals));
  const double contingency = items.back().subtotal;

  // Independent of contingency: both use the same base.
  items.push_back(make_line_item(CostCategory::RiskUplift, risk_uplift_description(d.risk_score),
                                 d.risk_uplift_percent, "% of subtotal",
                                 base_contingency / 100.0, ClosurePhase::PlanningApprovals));
  const double risk_uplift = items.back().subtotal;

  const double base_owners = base_contingency + contingency + risk_uplift;
  items.push_back(make_line_item(CostCategory::OwnersCosts, "Owner's costs and overheads",
                                 r.owners_costs_percent, "% of total", base_owners / 100.0,
                                 ClosurePhase::PlanningApprovals));
  return items;
}

} // namespace mcc::costing
