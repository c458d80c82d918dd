#pragma once
/*
================================================================================
Fragment 1.9 — Core: Error Types (Engine-Wide)
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Uniform exception types so validation, I/O and runtime failures are:
      * searchable
      * catchable by category
      * reportable to the CLI with a stable exit code

Notes:
  - The cost engine itself never throws for validated input. These types are
    raised by the validator, option checks, the scenario loader and the
    exporters.
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace mcc {

// Base error for the engine.
class MccError : public std::runtime_error {
 public:
  explicit MccError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when a scenario fails input validation.
class ValidationError : public MccError {
 public:
  explicit ValidationError(std::string msg) : MccError(std::move(msg)) {}
};

// Thrown when a computation produces a non-finite result.
class NumericalError : public MccError {
 public:
  explicit NumericalError(std::string msg) : MccError(std::move(msg)) {}
};

// Thrown when a caller-supplied option (not scenario data) is out of range.
class ArgumentError : public MccError {
 public:
  explicit ArgumentError(std::string msg) : MccError(std::move(msg)) {}
};

// Thrown for I/O or filesystem related issues.
class IOError : public MccError {
 public:
  explicit IOError(std::string msg) : MccError(std::move(msg)) {}
};

} // namespace mcc
