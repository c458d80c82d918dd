#pragma once
/*
================================================================================
Fragment 5.5 — Exports: Plain-Text Summary
FILE: cpp/engine/exports/summary_report.hpp

Human-readable report for the terminal: headline KPIs, phase and category
breakdowns and the sensitivity ranking.
================================================================================
*/

#include <iosfwd>
#include <string>

#include "engine/core/results.hpp"

namespace mcc {

// "$12,345,678" style, whole dollars. Negative values keep a leading '-'.
std::string format_currency(double value);

void write_summary_report(std::ostream& os, const std::string& scenario_name, const Results& r);

} // namespace mcc
