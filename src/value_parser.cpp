#include "value_parser.h"
#include "utils.h"

#include <cmath>
#include <cstdio>
#include <regex>

// Value parsing never throws. Each parser is a fixed fallback chain over
// regex-validated text; the first form that matches decides the result and
// anything that matches no form yields std::nullopt:
//
//   1. unit letter used as decimal point    "4K7", "0R22", "4n7", "2m2"
//   2. number with optional unit suffix      "4.7k", "330R", "100nF", "10uH"
//   3. bare number                           ohms / henries; for capacitors
//                                            only in CapacitanceMode::LegacyMicrofarads
//
// Numbers are assembled as "<mantissa>e<exponent>" text and converted once
// with strtod, so "4K7", "4.7k" and "4700" produce the identical double.
// Callers comparing values fall back to normalize_value() string equality
// only for categories whose value is not a physical quantity.

namespace bommatch {

// UTF-8 byte sequences seen in schematic value fields
static const char* const OHM_SIGNS[] = {"\xCE\xA9", "\xCF\x89", "\xE2\x84\xA6"};  // Ω ω Ω
static const char* const MICRO_SIGNS[] = {"\xCE\xBC", "\xC2\xB5"};              // μ µ

static std::string strip_ohm_signs(std::string s) {
    for (auto sign : OHM_SIGNS) s = replace_all(s, sign, "");
    return s;
}

static std::string map_micro_signs(std::string s) {
    for (auto sign : MICRO_SIGNS) s = replace_all(s, sign, "u");
    return s;
}

static std::optional<double> compose(const std::string& left, const std::string& right,
                                     int exponent) {
    std::string text = (left.empty() ? "0" : left);
    if (!right.empty()) text += "." + right;
    text += "e" + std::to_string(exponent);
    return parse_number(text);
}

static std::optional<double> compose(const std::string& mantissa, int exponent) {
    return parse_number(mantissa + "e" + std::to_string(exponent));
}

static int resistance_exponent(char letter) {
    switch (letter) {
    case 'K': return 3;
    case 'M': return 6;
    case 'G': return 9;
    default:  return 0;  // 'R' or none
    }
}

static int submultiple_exponent(char letter) {
    switch (letter) {
    case 'p': return -12;
    case 'n': return -9;
    case 'u': return -6;
    case 'm': return -3;
    default:  return 0;
    }
}

std::optional<double> parse_resistance(const std::string& s) {
    std::string t = strip_ohm_signs(s);
    t = to_upper(strip_whitespace(t));
    // "OHMS" / "OHM" unit words
    if (t.size() > 4 && t.compare(t.size() - 4, 4, "OHMS") == 0) t.erase(t.size() - 4);
    else if (t.size() > 3 && t.compare(t.size() - 3, 3, "OHM") == 0) t.erase(t.size() - 3);
    if (t.empty()) return std::nullopt;

    static const std::regex re_letter(R"(^(\d*)([RKMG])(\d+)$)");
    static const std::regex re_suffix(R"(^(\d*\.?\d+)([RKMG]?)$)");
    std::smatch m;
    if (std::regex_match(t, m, re_letter)) {
        return compose(m[1].str(), m[3].str(), resistance_exponent(m[2].str()[0]));
    }
    if (std::regex_match(t, m, re_suffix)) {
        char unit = m[2].length() ? m[2].str()[0] : 'R';
        return compose(m[1].str(), resistance_exponent(unit));
    }
    return std::nullopt;
}

std::optional<double> parse_capacitance(const std::string& s, CapacitanceMode mode) {
    std::string t = to_lower(strip_whitespace(map_micro_signs(s)));
    if (t.empty()) return std::nullopt;

    static const std::regex re_letter(R"(^(\d*)([pnum])(\d+)f?$)");
    static const std::regex re_suffix(R"(^(\d*\.?\d+)([pnum]?)(f?)$)");
    std::smatch m;
    if (std::regex_match(t, m, re_letter)) {
        return compose(m[1].str(), m[3].str(), submultiple_exponent(m[2].str()[0]));
    }
    if (std::regex_match(t, m, re_suffix)) {
        if (m[2].length()) return compose(m[1].str(), submultiple_exponent(m[2].str()[0]));
        if (m[3].length()) return compose(m[1].str(), 0);  // explicit farads
        if (mode == CapacitanceMode::LegacyMicrofarads) return compose(m[1].str(), -6);
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<double> parse_inductance(const std::string& s) {
    std::string t = to_lower(strip_whitespace(map_micro_signs(s)));
    if (!t.empty() && t.back() == 'h') t.pop_back();
    if (t.empty()) return std::nullopt;

    static const std::regex re_letter(R"(^(\d*)([pnum])(\d+)$)");
    static const std::regex re_suffix(R"(^(\d*\.?\d+)([pnum]?)$)");
    std::smatch m;
    if (std::regex_match(t, m, re_letter)) {
        return compose(m[1].str(), m[3].str(), submultiple_exponent(m[2].str()[0]));
    }
    if (std::regex_match(t, m, re_suffix)) {
        int exp = m[2].length() ? submultiple_exponent(m[2].str()[0]) : 0;
        return compose(m[1].str(), exp);
    }
    return std::nullopt;
}

// ── formatting ──────────────────────────────────────────────────────

static double round_sig(double v, int digits) {
    if (v == 0.0) return 0.0;
    double mag = std::pow(10.0, digits - 1 - static_cast<int>(std::floor(std::log10(std::fabs(v)))));
    return std::round(v * mag) / mag;
}

static std::string mantissa_text(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", round_sig(v, 3));
    return buf;
}

struct UnitStep {
    double scale;
    char letter;
};

// Letter-as-decimal-point rendering shared by all quantities. Steps are in
// descending scale; the last step absorbs anything smaller.
static std::string format_eia(double value, const UnitStep* steps, size_t count,
                              const std::string& suffix, bool force) {
    double r = round_sig(value, 3);
    const UnitStep* step = &steps[count - 1];
    for (size_t i = 0; i < count; i++) {
        if (r >= steps[i].scale) {
            step = &steps[i];
            break;
        }
    }
    std::string s = mantissa_text(r / step->scale);
    auto dot = s.find('.');
    if (dot != std::string::npos) {
        s[dot] = step->letter;
        return s + suffix;
    }
    return s + step->letter + (force ? "0" : "") + suffix;
}

std::string format_resistance_eia(double ohms, bool force_precision_digit) {
    if (!std::isfinite(ohms) || ohms <= 0.0) return "0R";
    static const UnitStep multiples[] = {{1e9, 'G'}, {1e6, 'M'}, {1e3, 'K'}};
    double r = round_sig(ohms, 3);
    if (r >= 1e3) return format_eia(ohms, multiples, 3, "", force_precision_digit);

    if (r >= 1.0 && std::fabs(r - std::round(r)) < 1e-9) {
        return std::to_string(static_cast<long long>(std::llround(r))) + "R";
    }
    std::string s = mantissa_text(r);
    auto dot = s.find('.');
    if (dot == std::string::npos) return s + "R";
    s[dot] = 'R';
    return s;
}

std::string format_capacitance_eia(double farads, bool force_precision_digit) {
    if (!std::isfinite(farads) || farads <= 0.0) return "0F";
    if (farads >= 1.0) return fmt(farads) + "F";
    static const UnitStep steps[] = {{1e-6, 'u'}, {1e-9, 'n'}, {1e-12, 'p'}};
    return format_eia(farads, steps, 3, "F", force_precision_digit);
}

std::string format_inductance_eia(double henries, bool force_precision_digit) {
    if (!std::isfinite(henries) || henries <= 0.0) return "0H";
    if (henries >= 1.0) return fmt(henries) + "H";
    static const UnitStep steps[] = {{1e-3, 'm'}, {1e-6, 'u'}, {1e-9, 'n'}};
    return format_eia(henries, steps, 3, "H", force_precision_digit);
}

// ── comparison helpers ──────────────────────────────────────────────

std::optional<double> parse_quantity(Quantity q, const std::string& s, CapacitanceMode mode) {
    switch (q) {
    case Quantity::Resistance:  return parse_resistance(s);
    case Quantity::Capacitance: return parse_capacitance(s, mode);
    case Quantity::Inductance:  return parse_inductance(s);
    }
    return std::nullopt;
}

double quantity_epsilon(Quantity q) {
    switch (q) {
    case Quantity::Resistance:  return OHM_EPSILON;
    case Quantity::Capacitance: return FARAD_EPSILON;
    case Quantity::Inductance:  return HENRY_EPSILON;
    }
    return 0.0;
}

bool quantities_equal(Quantity q, double a, double b) {
    return std::fabs(a - b) <= quantity_epsilon(q);
}

std::optional<Quantity> value_quantity(Category category) {
    switch (category) {
    case Category::Resistor:  return Quantity::Resistance;
    case Category::Capacitor: return Quantity::Capacitance;
    case Category::Inductor:  return Quantity::Inductance;
    default:                  return std::nullopt;
    }
}

bool has_explicit_precision(const std::string& value) {
    static const std::regex re_precision(R"(^\s*\d+[kKmMrR]\d+)");
    return std::regex_search(value, re_precision);
}

std::string normalize_value(const std::string& value) {
    std::string v = map_micro_signs(strip_ohm_signs(value));
    v = to_lower(strip_whitespace(v));
    return replace_all(v, "ohm", "");
}

std::optional<double> parse_tolerance_percent(const std::string& s) {
    std::string t = replace_all(s, "\xC2\xB1", "");  // ±
    t = replace_all(t, "+/-", "");
    t = replace_all(t, "+-", "");
    t = replace_all(t, "%", "");
    auto v = parse_number(strip_whitespace(t));
    if (!v || !std::isfinite(*v)) return std::nullopt;
    return std::fabs(*v);
}

} // namespace bommatch
