/*
================================================================================
Fragment 6.0 — CLI: Main Entry Point (mcc_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end for the mine closure cost engine.
  - Loads a scenario (preset or JSON file), validates it, runs the engine and
    renders the results.

Usage:
  mcc_cli [command] [options]

Commands:
  presets    - List built-in scenario presets
  run        - Estimate closure costs for a scenario
  scenario   - Write a scenario JSON (preset or defaults)
  help       - Show help message

Hardening:
  - Explicit error codes for CI integration
  - No silent failures
  - Deterministic output format
================================================================================
*/

#include "engine/analysis/closure_engine.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/inputs.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/presets.hpp"
#include "engine/core/safe_math.hpp"
#include "engine/exports/results_csv.hpp"
#include "engine/exports/results_json.hpp"
#include "engine/exports/scenario_json.hpp"
#include "engine/exports/summary_report.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>

using namespace mcc;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

namespace {

void print_help() {
  std::cout << R"(
mcc_cli - Mine Closure Cost Engine

Usage:
  mcc_cli [command] [options]

Commands:
  presets       List built-in scenario presets
  run           Estimate closure costs for a scenario
  scenario      Write a scenario JSON file
  help          Show this help message

Options (run):
  --preset <id>          Start from a built-in preset
  --in <path|->          Load scenario JSON ("-" = stdin)
  --format <fmt>         summary (default), json or csv
  --out <path|->         Output path ("-" = stdout, default)
  --variation <pct>      Sensitivity variation in percent (default 10)
  --compact              Compact JSON output
  --log-level <lvl>      debug, info, warn or error

Options (scenario):
  --preset <id>          Preset to export (default: reference scenario)
  --out <path|->         Output path ("-" = stdout, default)

Examples:
  mcc_cli presets
  mcc_cli run --preset tsf-dominant
  mcc_cli run --in site.json --format csv --out site_costs.csv
  mcc_cli scenario --preset high-water --out high_water.json

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
  4 - I/O error
)";
}

enum class OutputFormat { Summary, Json, Csv };

struct Args {
  std::string preset;
  std::string in_path;
  std::string out_path = "-";
  OutputFormat format = OutputFormat::Summary;
  double variation_percent = 10.0;
  bool pretty = true;
};

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!is_finite(v)) return false;
  *out = v;
  return true;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool takes_value(const char* k) {
  for (const char* opt : {"--preset", "--in", "--out", "--format", "--variation", "--log-level"}) {
    if (std::strcmp(k, opt) == 0) return true;
  }
  return false;
}

// Options start at argv[2] (argv[1] is the command).
bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    if (std::strcmp(k, "--compact") == 0) {
      a->pretty = false;
      continue;
    }
    if (!takes_value(k)) {
      *err = std::string("unknown option: ") + k;
      return false;
    }
    if (!get_next(i, argc, argv, &v)) {
      *err = std::string(k) + " requires a value";
      return false;
    }

    if (std::strcmp(k, "--preset") == 0) {
      a->preset = v;
    } else if (std::strcmp(k, "--in") == 0) {
      a->in_path = v;
    } else if (std::strcmp(k, "--out") == 0) {
      a->out_path = v;
    } else if (std::strcmp(k, "--format") == 0) {
      if (std::strcmp(v, "summary") == 0) a->format = OutputFormat::Summary;
      else if (std::strcmp(v, "json") == 0) a->format = OutputFormat::Json;
      else if (std::strcmp(v, "csv") == 0) a->format = OutputFormat::Csv;
      else { *err = std::string("unknown format: ") + v; return false; }
    } else if (std::strcmp(k, "--variation") == 0) {
      if (!parse_double(v, &a->variation_percent)) {
        *err = std::string("--variation expects a number, got: ") + v;
        return false;
      }
    } else if (std::strcmp(k, "--log-level") == 0) {
      LogLevel lvl = LogLevel::INFO;
      if (!parse_log_level(v, &lvl)) {
        *err = std::string("unknown log level: ") + v;
        return false;
      }
      set_log_level(lvl);
    }
  }

  if (!a->preset.empty() && !a->in_path.empty()) {
    *err = "--preset and --in are mutually exclusive";
    return false;
  }
  return true;
}

// Throws IOError / ValidationError; the caller maps them to exit codes.
InputState load_inputs(const Args& a) {
  if (!a.preset.empty()) {
    auto in = preset_inputs(a.preset);
    if (!in) throw ValidationError("unknown preset: " + a.preset);
    return *in;
  }
  if (a.in_path.empty()) return default_input_state();

  InputState in;
  JsonParseError perr;
  bool ok = false;
  if (a.in_path == "-") {
    ok = parse_scenario_json(std::cin, &in, &perr);
  } else {
    std::ifstream f(a.in_path);
    if (!f) throw IOError("cannot open scenario: " + a.in_path);
    ok = parse_scenario_json(f, &in, &perr);
  }
  if (!ok) {
    std::ostringstream oss;
    oss << "scenario JSON " << a.in_path << ":" << perr.line << ":" << perr.col << ": "
        << perr.message;
    throw ValidationError(oss.str());
  }
  return in;
}

// Runs `emit` against stdout or the named file.
template <typename Emit>
void write_output(const std::string& path, Emit emit) {
  if (path == "-") {
    emit(std::cout);
    std::cout.flush();
    return;
  }
  std::ofstream f(path);
  if (!f) throw IOError("cannot open output: " + path);
  emit(f);
  f.flush();
  if (!f) throw IOError("failed writing output: " + path);
  log(LogLevel::INFO, "wrote " + path);
}

int cmd_presets() {
  for (const auto& p : scenario_presets()) {
    std::cout << p.id << "\t" << p.name << "\n    " << p.description << "\n";
  }
  return ExitCode::SUCCESS;
}

int cmd_run(const Args& a) {
  try {
    InputState in = load_inputs(a);
    in.validate_or_throw();

    analysis::SensitivityConfig sens;
    sens.variation_percent = a.variation_percent;
    sens.validate();

    log(LogLevel::INFO, "running scenario '" + in.scenario_name + "'");
    const Results r = analysis::calculate_closure_costs(in, sens);
    if (!is_finite(r.total_nominal_cost) || !is_finite(r.total_discounted_cost)) {
      throw NumericalError("non-finite totals for scenario '" + in.scenario_name + "'");
    }

    write_output(a.out_path, [&](std::ostream& os) {
      switch (a.format) {
        case OutputFormat::Json: {
          JsonWriteOptions opt;
          opt.pretty = a.pretty;
          write_results_json(os, in.scenario_name, r, opt);
          break;
        }
        case OutputFormat::Csv:
          write_results_report_csv(os, in.scenario_name, r);
          break;
        case OutputFormat::Summary:
        default:
          write_summary_report(os, in.scenario_name, r);
          break;
      }
    });
    return ExitCode::SUCCESS;

  } catch (const ValidationError& e) {
    log(LogLevel::ERROR, std::string("Validation FAILED: ") + e.what());
    return ExitCode::VALIDATION_FAILED;
  } catch (const IOError& e) {
    log(LogLevel::ERROR, std::string("I/O error: ") + e.what());
    return ExitCode::IO_ERROR;
  } catch (const ArgumentError& e) {
    log(LogLevel::ERROR, std::string("Invalid argument: ") + e.what());
    return ExitCode::INVALID_ARGS;
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, std::string("Error: ") + e.what());
    return ExitCode::COMPUTATION_FAILED;
  }
}

int cmd_scenario(const Args& a) {
  try {
    const InputState in = load_inputs(a);
    in.validate_or_throw();

    JsonWriteOptions opt;
    opt.pretty = a.pretty;
    write_output(a.out_path, [&](std::ostream& os) { write_scenario_json(os, in, opt); });
    return ExitCode::SUCCESS;

  } catch (const ValidationError& e) {
    log(LogLevel::ERROR, std::string("Validation FAILED: ") + e.what());
    return ExitCode::VALIDATION_FAILED;
  } catch (const IOError& e) {
    log(LogLevel::ERROR, std::string("I/O error: ") + e.what());
    return ExitCode::IO_ERROR;
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, std::string("Error: ") + e.what());
    return ExitCode::COMPUTATION_FAILED;
  }
}

}  // namespace

int main(int argc, char** argv) {
  // Parse command
  std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  if (cmd == "presets") {
    return cmd_presets();
  }

  if (cmd != "run" && cmd != "scenario") {
    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'mcc_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }

  Args args;
  std::string err;
  if (!parse_args(argc, argv, &args, &err)) {
    std::cerr << "mcc_cli " << cmd << ": " << err << "\n";
    return ExitCode::INVALID_ARGS;
  }

  // Keep stdout clean for the report itself.
  if (args.out_path == "-") set_log_to_stderr(true);

  return cmd == "run" ? cmd_run(args) : cmd_scenario(args);
}
