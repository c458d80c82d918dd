#pragma once
/*
===============================================================================
Fragment 1.12 — Core: Hardened Math Utilities
File: cpp/engine/core/safe_math.hpp
===============================================================================
*/

#include <cmath>

namespace mcc {

// -----------------------------
// Finite checks
// -----------------------------
inline bool is_finite(double x) noexcept {
    return std::isfinite(x) != 0;
}

// -----------------------------
// Safe division (never NaN/Inf)
// -----------------------------
inline double safe_div(double num, double den, double fallback = 0.0) noexcept {
    if (!is_finite(num) || !is_finite(den)) return fallback;
    if (den == 0.0) return fallback;
    const double q = num / den;
    return is_finite(q) ? q : fallback;
}

// Share of `part` in `total`, in percent. A zero total yields 0%.
inline double percent_of(double part, double total) noexcept {
    return (total > 0.0) ? safe_div(part, total, 0.0) * 100.0 : 0.0;
}

// Relative/absolute closeness used by selftests and invariant checks.
inline bool near(double a, double b, double rel = 1e-9, double abs = 1e-9) noexcept {
    const double da = std::fabs(a - b);
    if (da <= abs) return true;
    const double sa = std::fabs(a);
    const double sb = std::fabs(b);
    const double sc = (sa > sb) ? sa : sb;
    return da / sc <= rel;
}

} // namespace mcc
