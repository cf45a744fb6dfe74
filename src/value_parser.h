#pragma once

#include "part_model.h"
#include <optional>
#include <string>

namespace bommatch {

// Absolute equality tolerances. These absorb floating-point rounding only,
// not real component tolerance.
constexpr double OHM_EPSILON = 1e-12;
constexpr double FARAD_EPSILON = 1e-18;
constexpr double HENRY_EPSILON = 1e-18;

enum class Quantity { Resistance, Capacitance, Inductance };

// How a capacitance written as a bare number ("10") is read.
enum class CapacitanceMode {
    Strict,             // rejected: a capacitor value needs a unit letter
    LegacyMicrofarads   // read as microfarads
};

// Parse "330", "330R", "3R3", "4K7", "4.7k", "10K0", "1M5", "0R22", "10 Ω" to ohms.
std::optional<double> parse_resistance(const std::string& s);

// Parse "100n", "100nF", "0.1uF", "4n7", "1u0", "220pF" to farads.
std::optional<double> parse_capacitance(const std::string& s,
                                        CapacitanceMode mode = CapacitanceMode::Strict);

// Parse "10uH", "2m2", "4u7", "100nH", "1.5mH" to henries.
std::optional<double> parse_inductance(const std::string& s);

// Format ohms as EIA notation: 3R3, 330R, 4K7, 10K, 1M5.
// force_precision_digit keeps the trailing digit on whole K/M values (10K0, 1M0).
std::string format_resistance_eia(double ohms, bool force_precision_digit = false);

// Format farads: 100nF, 4u7F, 22pF (1u0F with force_precision_digit).
std::string format_capacitance_eia(double farads, bool force_precision_digit = false);

// Format henries: 10uH, 2m2H, 100nH.
std::string format_inductance_eia(double henries, bool force_precision_digit = false);

std::optional<double> parse_quantity(Quantity q, const std::string& s,
                                     CapacitanceMode mode = CapacitanceMode::Strict);
double quantity_epsilon(Quantity q);
bool quantities_equal(Quantity q, double a, double b);

// The physical quantity a category's Value field holds, if it is numeric.
std::optional<Quantity> value_quantity(Category category);

// True when a digit follows the unit letter ("10K0", "9K76", "4R7").
bool has_explicit_precision(const std::string& value);

// Lower-case, strip whitespace and ohm symbols, map micro signs to 'u'.
std::string normalize_value(const std::string& value);

// Parse "1%", "±5%", "+/-0.1 %" to a percentage.
std::optional<double> parse_tolerance_percent(const std::string& s);

} // namespace bommatch
