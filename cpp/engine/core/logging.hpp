#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by the engine and CLI.
  - Centralizes stdout/stderr policy.

Rules:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - WARN/ERROR go to stderr, DEBUG/INFO to stdout unless redirected with
    set_log_to_stderr(true) (the CLI does so when stdout carries a report).
===========================================================
*/

#include <string>

namespace mcc {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Send every level to stderr.
void set_log_to_stderr(bool on) noexcept;

// Parse "debug|info|warn|error". Returns false on unknown names.
bool parse_log_level(const std::string& s, LogLevel* out) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace mcc
