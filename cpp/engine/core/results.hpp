#pragma once
/*
================================================================================
Fragment 1.6 — Core: Closure Cost Results (Output Data Model)
FILE: cpp/engine/core/results.hpp

Purpose:
  Plain, behaviour-free output records produced by one engine run. Handed
  read-only to the exporters and the CLI.

Rules:
  - Every record is created fresh per calculate_closure_costs() call.
  - LineItemCost::subtotal == quantity * unit_rate (lump sums: quantity = 1).
  - Monetary values in $, areas in m^2, volumes in m^3, water in ML.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/closure_types.hpp"

namespace mcc {

struct DerivedQuantities {
  double tsf_area_m2 = 0.0;
  double wrd_area_m2 = 0.0;
  double tsf_capping_volume_m3 = 0.0;
  double wrd_earthworks_volume_m3 = 0.0;
  double total_earthworks_volume_m3 = 0.0;
  double topsoil_volume_m3 = 0.0;
  double disturbed_area_m2 = 0.0;
  double recontouring_area_m2 = 0.0;
  double total_water_treatment_ml = 0.0;
  double risk_score = 0.0;           // 0..100
  double risk_uplift_percent = 0.0;  // 0..50

  bool operator==(const DerivedQuantities&) const = default;
};

struct LineItemCost {
  CostCategory category = CostCategory::Mobilisation;
  std::string description;
  double quantity = 0.0;
  std::string unit;
  double unit_rate = 0.0;
  double subtotal = 0.0;
  ClosurePhase phase = ClosurePhase::PlanningApprovals;

  bool operator==(const LineItemCost&) const = default;
};

struct AnnualCashflow {
  int year = 0;  // absolute calendar year
  double nominal_cost = 0.0;
  double escalated_cost = 0.0;
  double discounted_cost = 0.0;
  double cumulative_nominal = 0.0;
  double cumulative_discounted = 0.0;
  PhaseTable<double> phase_costs;

  bool operator==(const AnnualCashflow&) const = default;
};

struct SensitivityResult {
  std::string driver_name;
  std::string driver_key;
  double base_value = 0.0;
  std::string unit;
  double low_value = 0.0;
  double high_value = 0.0;
  double low_total_cost = 0.0;
  double high_total_cost = 0.0;
  double low_npv = 0.0;
  double high_npv = 0.0;
  double delta_cost = 0.0;  // high - low
  double delta_npv = 0.0;   // high - low

  bool operator==(const SensitivityResult&) const = default;
};

struct PhaseCostSummary {
  ClosurePhase phase = ClosurePhase::PlanningApprovals;
  double total_cost = 0.0;
  double percent_of_total = 0.0;

  bool operator==(const PhaseCostSummary&) const = default;
};

struct CategoryCostSummary {
  CostCategory category = CostCategory::Mobilisation;
  double total_cost = 0.0;
  double percent_of_total = 0.0;

  bool operator==(const CategoryCostSummary&) const = default;
};

struct Results {
  DerivedQuantities derived;
  std::vector<LineItemCost> line_items;

  double direct_works_cost = 0.0;
  double indirect_costs = 0.0;
  double total_nominal_cost = 0.0;
  double total_discounted_cost = 0.0;  // NPV

  double peak_annual_cashflow = 0.0;
  int peak_cashflow_year = 0;

  std::vector<AnnualCashflow> annual_cashflows;
  std::vector<PhaseCostSummary> phase_breakdown;
  std::vector<CategoryCostSummary> category_breakdown;
  std::vector<SensitivityResult> sensitivity;

  double monitoring_cost_share = 0.0;  // % of total nominal
  int total_duration_years = 0;

  bool operator==(const Results&) const = default;
};

} // namespace mcc
