#include "engine/exports/scenario_json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <istream>
#include <map>
#include <ostream>
#include <sstream>
#include <utility>
#include <vector>

namespace mcc {
namespace {

// ---------------------------------------------------------------------------
// Field tables (shared by writer and parser so the schema cannot drift)
// ---------------------------------------------------------------------------
template <typename G>
struct RealField {
  const char* key;
  double G::*member;
};

template <typename G>
struct IntField {
  const char* key;
  int G::*member;
};

const RealField<Quantities> kQuantityReals[] = {
    {"disturbed_area_ha", &Quantities::disturbed_area_ha},
    {"tsf_area_ha", &Quantities::tsf_area_ha},
    {"tsf_cover_thickness_m", &Quantities::tsf_cover_thickness_m},
    {"wrd_footprint_ha", &Quantities::wrd_footprint_ha},
    {"wrd_reshaping_depth_m", &Quantities::wrd_reshaping_depth_m},
    {"topsoil_thickness_m", &Quantities::topsoil_thickness_m},
    {"recontouring_area_ha", &Quantities::recontouring_area_ha},
    {"road_length_km", &Quantities::road_length_km},
    {"water_treatment_flow_ml_per_day", &Quantities::water_treatment_flow_ml_per_day},
    {"water_treatment_duration_years", &Quantities::water_treatment_duration_years},
    {"water_treatment_intensity_factor", &Quantities::water_treatment_intensity_factor},
    {"hazardous_materials_area_ha", &Quantities::hazardous_materials_area_ha},
};

const IntField<Quantities> kQuantityInts[] = {
    {"number_of_buildings", &Quantities::number_of_buildings},
    {"monitoring_duration_years", &Quantities::monitoring_duration_years},
};

const RealField<UnitRates> kUnitRateReals[] = {
    {"earthworks_per_m3", &UnitRates::earthworks_per_m3},
    {"capping_base_per_m2", &UnitRates::capping_base_per_m2},
    {"capping_thickness_factor", &UnitRates::capping_thickness_factor},
    {"topsoil_per_m3", &UnitRates::topsoil_per_m3},
    {"revegetation_per_ha", &UnitRates::revegetation_per_ha},
    {"revegetation_complexity_factor", &UnitRates::revegetation_complexity_factor},
    {"demolition_per_building", &UnitRates::demolition_per_building},
    {"road_rehab_per_km", &UnitRates::road_rehab_per_km},
    {"water_treatment_capex", &UnitRates::water_treatment_capex},
    {"water_treatment_opex_per_ml", &UnitRates::water_treatment_opex_per_ml},
    {"monitoring_per_year_low", &UnitRates::monitoring_per_year_low},
    {"monitoring_per_year_medium", &UnitRates::monitoring_per_year_medium},
    {"monitoring_per_year_high", &UnitRates::monitoring_per_year_high},
    {"hazardous_materials_per_ha", &UnitRates::hazardous_materials_per_ha},
    {"community_heritage_lump_sum", &UnitRates::community_heritage_lump_sum},
    {"bulking_factor", &UnitRates::bulking_factor},
    {"erosion_controls_per_ha", &UnitRates::erosion_controls_per_ha},
    {"mobilisation_lump_sum", &UnitRates::mobilisation_lump_sum},
};

const RealField<IndirectRates> kIndirectReals[] = {
    {"site_establishment_percent", &IndirectRates::site_establishment_percent},
    {"contractor_margin_percent", &IndirectRates::contractor_margin_percent},
    {"contingency_percent", &IndirectRates::contingency_percent},
    {"owners_costs_percent", &IndirectRates::owners_costs_percent},
};

const RealField<RiskFactors> kRiskReals[] = {
    {"contamination_uncertainty", &RiskFactors::contamination_uncertainty},
    {"geotech_uncertainty", &RiskFactors::geotech_uncertainty},
    {"water_quality_uncertainty", &RiskFactors::water_quality_uncertainty},
    {"regulatory_uncertainty", &RiskFactors::regulatory_uncertainty},
    {"logistics_complexity", &RiskFactors::logistics_complexity},
};

const RealField<FinancialParams> kFinancialReals[] = {
    {"escalation_rate_percent", &FinancialParams::escalation_rate_percent},
    {"discount_rate_percent", &FinancialParams::discount_rate_percent},
};

template <typename G, std::size_t N>
void write_reals(JsonWriter& w, const G& g, const RealField<G> (&fields)[N]) {
  for (const auto& f : fields) {
    w.key(f.key);
    w.number(g.*(f.member));
  }
}

template <typename G, std::size_t N>
void write_ints(JsonWriter& w, const G& g, const IntField<G> (&fields)[N]) {
  for (const auto& f : fields) {
    w.key(f.key);
    w.integer(g.*(f.member));
  }
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------
enum class JType { kNull, kBool, kNum, kStr, kObj, kArr };

struct JVal {
  JType t = JType::kNull;
  bool b = false;
  double num = 0.0;
  std::string str;
  std::map<std::string, JVal> obj;
  std::vector<JVal> arr;

  // Where the value starts, for schema errors.
  size_t offset = 0;
  int line = 1;
  int col = 1;
};

class Parser {
 public:
  Parser(std::string_view text, JsonParseError* err)
      : b_(text.data()), p_(text.data()), e_(text.data() + text.size()), err_(err) {}

  bool parse_document(JVal& root) {
    if (!parse_value(root)) return false;
    skip_ws();
    if (!eof()) return fail("Trailing characters after JSON");
    return true;
  }

 private:
  bool eof() const { return p_ >= e_; }

  void advance() {
    if (*p_ == '\n') { ++line_; col_ = 1; }
    else { ++col_; }
    ++p_;
  }

  bool fail(std::string msg) {
    if (err_) {
      err_->message = std::move(msg);
      err_->offset = static_cast<size_t>(p_ - b_);
      err_->line = line_;
      err_->col = col_;
    }
    return false;
  }

  void skip_ws() {
    while (!eof() && (*p_ == ' ' || *p_ == '\t' || *p_ == '\r' || *p_ == '\n')) advance();
  }

  bool consume(char ch) {
    skip_ws();
    if (eof() || *p_ != ch) return fail(std::string("Expected '") + ch + "'");
    advance();
    return true;
  }

  bool literal(const char* lit) {
    const char* q = p_;
    for (const char* s = lit; *s; ++s, ++q) {
      if (q >= e_ || *q != *s) return fail("Invalid literal");
    }
    while (p_ < q) advance();
    return true;
  }

  bool digits() {
    if (eof() || !std::isdigit(static_cast<unsigned char>(*p_))) return false;
    while (!eof() && std::isdigit(static_cast<unsigned char>(*p_))) advance();
    return true;
  }

  bool hex4(unsigned& out) {
    out = 0;
    for (int i = 0; i < 4; ++i) {
      if (eof()) return fail("Unexpected EOF in \\uXXXX escape");
      const char ch = *p_;
      unsigned v = 0;
      if (ch >= '0' && ch <= '9') v = static_cast<unsigned>(ch - '0');
      else if (ch >= 'a' && ch <= 'f') v = 10u + static_cast<unsigned>(ch - 'a');
      else if (ch >= 'A' && ch <= 'F') v = 10u + static_cast<unsigned>(ch - 'A');
      else return fail("Invalid hex digit in \\uXXXX escape");
      out = (out << 4) | v;
      advance();
    }
    return true;
  }

  static void append_utf8(std::string& s, unsigned cp) {
    if (cp <= 0x7F) {
      s.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      s.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      s.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      s.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool parse_unicode_escape(std::string& out) {
    unsigned u = 0;
    if (!hex4(u)) return false;
    if (u >= 0xDC00 && u <= 0xDFFF) return fail("Unexpected low surrogate");
    if (u < 0xD800 || u > 0xDBFF) {
      append_utf8(out, u);
      return true;
    }
    if (eof() || *p_ != '\\') return fail("High surrogate not followed by low surrogate");
    advance();
    if (eof() || *p_ != 'u') return fail("High surrogate not followed by \\u");
    advance();
    unsigned u2 = 0;
    if (!hex4(u2)) return false;
    if (u2 < 0xDC00 || u2 > 0xDFFF) return fail("Invalid low surrogate");
    append_utf8(out, 0x10000u + (((u - 0xD800u) << 10) | (u2 - 0xDC00u)));
    return true;
  }

  bool parse_string(std::string& out) {
    skip_ws();
    if (eof() || *p_ != '"') return fail("Expected string");
    advance();
    out.clear();

    while (!eof()) {
      const char ch = *p_;
      if (ch == '"') {
        advance();
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) return fail("Unescaped control character in string");
      if (ch != '\\') {
        out.push_back(ch);
        advance();
        continue;
      }
      advance();
      if (eof()) return fail("Unexpected EOF in string escape");
      const char esc = *p_;
      advance();
      switch (esc) {
        case '"':  out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/':  out.push_back('/'); break;
        case 'b':  out.push_back('\b'); break;
        case 'f':  out.push_back('\f'); break;
        case 'n':  out.push_back('\n'); break;
        case 'r':  out.push_back('\r'); break;
        case 't':  out.push_back('\t'); break;
        case 'u':
          if (!parse_unicode_escape(out)) return false;
          break;
        default:
          return fail("Invalid escape sequence");
      }
    }
    return fail("Unterminated string");
  }

  // JSON number grammar: no leading '+', no NaN/Inf, no leading zeros.
  bool parse_number(double& out) {
    const char* start = p_;
    if (*p_ == '-') advance();
    if (eof()) return fail("Expected digits after '-'");
    if (*p_ == '0') {
      advance();
    } else if (!digits()) {
      return fail("Invalid number");
    }
    if (!eof() && *p_ == '.') {
      advance();
      if (!digits()) return fail("Expected digits after '.'");
    }
    if (!eof() && (*p_ == 'e' || *p_ == 'E')) {
      advance();
      if (!eof() && (*p_ == '+' || *p_ == '-')) advance();
      if (!digits()) return fail("Expected digits in exponent");
    }

    const std::string tmp(start, p_);
    errno = 0;
    char* endptr = nullptr;
    const double v = std::strtod(tmp.c_str(), &endptr);
    if (endptr == tmp.c_str() || *endptr != '\0') return fail("Failed to parse number");
    if (errno == ERANGE || !std::isfinite(v)) return fail("Number out of range");
    out = v;
    return true;
  }

  bool parse_array(JVal& out) {
    if (!consume('[')) return false;
    out.t = JType::kArr;
    skip_ws();
    if (!eof() && *p_ == ']') {
      advance();
      return true;
    }
    while (true) {
      JVal v;
      if (!parse_value(v)) return false;
      out.arr.push_back(std::move(v));
      skip_ws();
      if (eof()) return fail("Unexpected EOF in array");
      if (*p_ == ',') { advance(); continue; }
      if (*p_ == ']') { advance(); return true; }
      return fail("Expected ',' or ']'");
    }
  }

  bool parse_object(JVal& out) {
    if (!consume('{')) return false;
    out.t = JType::kObj;
    skip_ws();
    if (!eof() && *p_ == '}') {
      advance();
      return true;
    }
    while (true) {
      std::string key;
      if (!parse_string(key)) return false;
      if (!consume(':')) return false;
      JVal val;
      if (!parse_value(val)) return false;
      out.obj[std::move(key)] = std::move(val);
      skip_ws();
      if (eof()) return fail("Unexpected EOF in object");
      if (*p_ == ',') { advance(); continue; }
      if (*p_ == '}') { advance(); return true; }
      return fail("Expected ',' or '}'");
    }
  }

  bool parse_value(JVal& out) {
    skip_ws();
    if (eof()) return fail("Unexpected EOF");

    out.offset = static_cast<size_t>(p_ - b_);
    out.line = line_;
    out.col = col_;

    const char ch = *p_;
    if (ch == '{' || ch == '[') {
      if (depth_ >= kMaxDepth) return fail("Nesting too deep");
      ++depth_;
      const bool ok = (ch == '{') ? parse_object(out) : parse_array(out);
      --depth_;
      return ok;
    }
    if (ch == '"') {
      out.t = JType::kStr;
      return parse_string(out.str);
    }
    if (ch == 't' || ch == 'f') {
      out.t = JType::kBool;
      out.b = (ch == 't');
      return literal(out.b ? "true" : "false");
    }
    if (ch == 'n') {
      out.t = JType::kNull;
      return literal("null");
    }
    if (ch == '-' || (ch >= '0' && ch <= '9')) {
      out.t = JType::kNum;
      return parse_number(out.num);
    }
    return fail("Unexpected token");
  }

  // Scenario documents nest two levels; anything far deeper is rejected.
  static constexpr int kMaxDepth = 64;

  const char* b_;
  const char* p_;
  const char* e_;
  int line_ = 1;
  int col_ = 1;
  int depth_ = 0;
  JsonParseError* err_;
};

// ---------------------------------------------------------------------------
// Schema binding
// ---------------------------------------------------------------------------
bool schema_fail(JsonParseError* err, const JVal& at, std::string msg) {
  if (err) {
    err->message = std::move(msg);
    err->offset = at.offset;
    err->line = at.line;
    err->col = at.col;
  }
  return false;
}

const JVal* find(const JVal& o, const char* k) {
  auto it = o.obj.find(k);
  return it == o.obj.end() ? nullptr : &it->second;
}

// Missing group: keep defaults. Present but not an object: error.
bool group(const JVal& root, const char* k, const JVal*& out, JsonParseError* err) {
  out = find(root, k);
  if (out && out->t != JType::kObj) return schema_fail(err, *out, std::string(k) + " must be an object");
  return true;
}

bool read_real(const JVal& o, const char* k, double& tgt, JsonParseError* err) {
  const JVal* v = find(o, k);
  if (!v) return true;
  if (v->t != JType::kNum) return schema_fail(err, *v, std::string("Expected number for ") + k);
  tgt = v->num;
  return true;
}

bool read_int(const JVal& o, const char* k, int& tgt, JsonParseError* err) {
  const JVal* v = find(o, k);
  if (!v) return true;
  if (v->t != JType::kNum || v->num != std::floor(v->num) || std::fabs(v->num) > 2147483647.0) {
    return schema_fail(err, *v, std::string("Expected integer for ") + k);
  }
  tgt = static_cast<int>(v->num);
  return true;
}

bool read_bool(const JVal& o, const char* k, bool& tgt, JsonParseError* err) {
  const JVal* v = find(o, k);
  if (!v) return true;
  if (v->t != JType::kBool) return schema_fail(err, *v, std::string("Expected boolean for ") + k);
  tgt = v->b;
  return true;
}

template <typename G, std::size_t N>
bool read_reals(const JVal& o, G& g, const RealField<G> (&fields)[N], JsonParseError* err) {
  for (const auto& f : fields) {
    if (!read_real(o, f.key, g.*(f.member), err)) return false;
  }
  return true;
}

template <typename G, std::size_t N>
bool read_ints(const JVal& o, G& g, const IntField<G> (&fields)[N], JsonParseError* err) {
  for (const auto& f : fields) {
    if (!read_int(o, f.key, g.*(f.member), err)) return false;
  }
  return true;
}

template <typename E>
bool read_enum(const JVal& o, const char* k, E& tgt, std::optional<E> (*parse)(std::string_view),
               JsonParseError* err) {
  const JVal* v = find(o, k);
  if (!v) return true;
  if (v->t != JType::kStr) return schema_fail(err, *v, std::string("Expected string id for ") + k);
  const auto e = parse(v->str);
  if (!e) return schema_fail(err, *v, std::string("Unknown id '") + v->str + "' for " + k);
  tgt = *e;
  return true;
}

bool read_quantities(const JVal& o, Quantities& q, JsonParseError* err) {
  if (!read_reals(o, q, kQuantityReals, err)) return false;
  if (!read_ints(o, q, kQuantityInts, err)) return false;

  if (const JVal* v = find(o, "earthworks_volume_m3_override")) {
    if (v->t == JType::kNull) q.earthworks_volume_m3_override.reset();
    else if (v->t == JType::kNum) q.earthworks_volume_m3_override = v->num;
    else return schema_fail(err, *v, "Expected number or null for earthworks_volume_m3_override");
  }

  if (!read_enum<MonitoringIntensity>(o, "monitoring_intensity", q.monitoring_intensity,
                                      &parse_intensity_id, err)) {
    return false;
  }
  if (!read_bool(o, "hazardous_materials_enabled", q.hazardous_materials_enabled, err)) return false;
  return read_bool(o, "community_heritage_enabled", q.community_heritage_enabled, err);
}

bool fill_inputs(const JVal& root, InputState& in, JsonParseError* err) {
  if (root.t != JType::kObj) return schema_fail(err, root, "Root must be an object");

  if (const JVal* v = find(root, "scenario_name")) {
    if (v->t != JType::kStr) return schema_fail(err, *v, "Expected string for scenario_name");
    in.scenario_name = v->str;
  }

  const JVal* g = nullptr;
  if (!group(root, "quantities", g, err)) return false;
  if (g && !read_quantities(*g, in.quantities, err)) return false;

  if (!group(root, "unit_rates", g, err)) return false;
  if (g && !read_reals(*g, in.unit_rates, kUnitRateReals, err)) return false;

  if (!group(root, "indirect_rates", g, err)) return false;
  if (g && !read_reals(*g, in.indirect_rates, kIndirectReals, err)) return false;

  if (!group(root, "risk_factors", g, err)) return false;
  if (g && !read_reals(*g, in.risk_factors, kRiskReals, err)) return false;

  if (!group(root, "financial", g, err)) return false;
  if (g) {
    if (!read_int(*g, "closure_start_year", in.financial.closure_start_year, err)) return false;
    if (!read_reals(*g, in.financial, kFinancialReals, err)) return false;
    if (!read_enum<DiscountRateMode>(*g, "discount_rate_mode", in.financial.discount_rate_mode,
                                     &parse_discount_mode_id, err)) {
      return false;
    }
  }

  if (!group(root, "phase_durations", g, err)) return false;
  if (g) {
    for (ClosurePhase p : kAllPhases) {
      if (!read_int(*g, phase_id(p), in.phase_durations[p], err)) return false;
    }
  }
  return true;
}

}  // namespace

void write_scenario_json(std::ostream& os, const InputState& in, const JsonWriteOptions& opt) {
  JsonWriter w(os, opt);
  const Quantities& q = in.quantities;

  w.begin_object();
  w.key("scenario_name");
  w.string(in.scenario_name);

  w.key("quantities");
  w.begin_object();
  write_reals(w, q, kQuantityReals);
  write_ints(w, q, kQuantityInts);
  w.key("earthworks_volume_m3_override");
  if (q.earthworks_volume_m3_override) w.number(*q.earthworks_volume_m3_override);
  else w.null_value();
  w.key("monitoring_intensity");        w.string(intensity_id(q.monitoring_intensity));
  w.key("hazardous_materials_enabled"); w.boolean(q.hazardous_materials_enabled);
  w.key("community_heritage_enabled");  w.boolean(q.community_heritage_enabled);
  w.end_object();

  w.key("unit_rates");
  w.begin_object();
  write_reals(w, in.unit_rates, kUnitRateReals);
  w.end_object();

  w.key("indirect_rates");
  w.begin_object();
  write_reals(w, in.indirect_rates, kIndirectReals);
  w.end_object();

  w.key("risk_factors");
  w.begin_object();
  write_reals(w, in.risk_factors, kRiskReals);
  w.end_object();

  w.key("financial");
  w.begin_object();
  w.key("closure_start_year");
  w.integer(in.financial.closure_start_year);
  write_reals(w, in.financial, kFinancialReals);
  w.key("discount_rate_mode");
  w.string(discount_mode_id(in.financial.discount_rate_mode));
  w.end_object();

  w.key("phase_durations");
  w.begin_object();
  for (ClosurePhase p : kAllPhases) {
    w.key(phase_id(p));
    w.integer(in.phase_durations[p]);
  }
  w.end_object();

  w.end_object();
  if (opt.pretty) os << "\n";
}

std::string scenario_to_json(const InputState& in, const JsonWriteOptions& opt) {
  std::ostringstream ss;
  write_scenario_json(ss, in, opt);
  return ss.str();
}

bool parse_scenario_json(std::string_view json, InputState* out, JsonParseError* err) {
  if (!out) return false;

  JVal root;
  Parser parser(json, err);
  if (!parser.parse_document(root)) return false;

  InputState in = default_input_state();
  if (!fill_inputs(root, in, err)) return false;

  *out = std::move(in);
  return true;
}

bool parse_scenario_json(std::istream& is, InputState* out, JsonParseError* err) {
  std::ostringstream ss;
  ss << is.rdbuf();
  if (is.bad()) {
    if (err) err->message = "Failed to read scenario stream";
    return false;
  }
  const std::string buf = ss.str();
  return parse_scenario_json(std::string_view(buf), out, err);
}

} // namespace mcc
