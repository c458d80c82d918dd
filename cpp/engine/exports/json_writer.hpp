#pragma once
/*
================================================================================
Fragment 5.1 — Exports: Streaming JSON Writer
FILE: cpp/engine/exports/json_writer.hpp

Minimal, deterministic JSON emitter shared by the results and scenario
exporters. Keys are written in call order (stable diffs). JSON cannot carry
NaN/Inf; number_or_null() maps them to `null`.
================================================================================
*/

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace mcc {

struct JsonWriteOptions {
  // Pretty output = newlines + indentation
  bool pretty = true;
  int indent_spaces = 2;
};

std::string escape_json(std::string_view s);

class JsonWriter {
 public:
  JsonWriter(std::ostream& os, const JsonWriteOptions& opt);

  void begin_object();
  void end_object();
  void begin_array();
  void end_array();

  void key(std::string_view k);

  void string(std::string_view v);
  void boolean(bool v);
  void null_value();
  void number(double v);  // non-finite values are written as null
  void integer(long long v);
  void number_or_null(double v) { number(v); }

 private:
  enum class Scope { kObject, kArray };

  void before_value();
  void newline_and_indent();

  std::ostream& os_;
  JsonWriteOptions opt_;
  std::vector<Scope> scopes_;
  std::vector<bool> empty_;
  bool after_key_ = false;
};

} // namespace mcc
