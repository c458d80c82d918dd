#pragma once
/*
================================================================================
Fragment 5.4 — Exports: CSV Report Exporter (Line Items, Cashflows, Sensitivity)
FILE: cpp/engine/exports/results_csv.hpp

Purpose:
  - Tabular views of one Results record for spreadsheets and CI artifacts.
  - Combined report with SUMMARY / LINE ITEMS / ANNUAL CASHFLOWS sections.

Hardening:
  - Fields containing the delimiter, a quote, CR or LF are quoted, with
    embedded quotes doubled.
  - NaN/Inf export as empty cells (never "nan").
  - Stable column ordering; money to 2 decimals.
================================================================================
*/

#include <iosfwd>
#include <string>
#include <vector>

#include "engine/core/results.hpp"

namespace mcc {

struct CsvExportOptions {
  bool include_header = true;
  bool include_phase_columns = true;  // per-phase cost columns on cashflow rows
  char delimiter = ',';
};

std::string csv_escape(const std::string& s, char delim = ',');

// Fixed-point text, or "" for NaN/Inf.
std::string csv_double(double x, int precision = 2);

void write_line_items_csv(std::ostream& os,
                          const std::vector<LineItemCost>& items,
                          const CsvExportOptions& opt = CsvExportOptions());

void write_cashflows_csv(std::ostream& os,
                         const std::vector<AnnualCashflow>& cashflows,
                         const CsvExportOptions& opt = CsvExportOptions());

void write_sensitivity_csv(std::ostream& os,
                           const std::vector<SensitivityResult>& rows,
                           const CsvExportOptions& opt = CsvExportOptions());

void write_results_report_csv(std::ostream& os,
                              const std::string& scenario_name,
                              const Results& r,
                              const CsvExportOptions& opt = CsvExportOptions());

// Throws IOError when the file cannot be written.
void write_results_report_csv_file(const std::string& file_path,
                                   const std::string& scenario_name,
                                   const Results& r,
                                   const CsvExportOptions& opt = CsvExportOptions());

} // namespace mcc
