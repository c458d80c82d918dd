#pragma once
/*
================================================================================
Fragment 5.2 — Exports: Results JSON
FILE: cpp/engine/exports/results_json.hpp

Serializes a Results record (plus the scenario name) with a stable key order.
Enums are written by machine id. Deterministic for identical inputs.
================================================================================
*/

#include <iosfwd>
#include <string>

#include "engine/core/results.hpp"
#include "engine/exports/json_writer.hpp"

namespace mcc {

void write_results_json(std::ostream& os,
                        const std::string& scenario_name,
                        const Results& r,
                        const JsonWriteOptions& opt = {});

std::string results_to_json(const std::string& scenario_name,
                            const Results& r,
                            const JsonWriteOptions& opt = {});

} // namespace mcc
