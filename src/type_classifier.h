#pragma once

#include "part_model.h"
#include <string>

namespace bommatch {

// Classify a symbol from its library id ("Device:R") and footprint.
// Pure and deterministic; returns Category::Unknown when nothing matches.
Category classify(const std::string& library_id, const std::string& footprint);

// As above, then falls back to the reference designator prefix ("R10" -> "R").
Category classify(const Component& component);

// Leading alphabetic run of a reference designator, upper-cased ("LED3" -> "LED").
std::string reference_prefix(const std::string& reference);

// Inventory category code: "RES", "CAP", "IC", ... (empty for Unknown)
const char* category_code(Category category);

// Human-readable name: "Resistor", "Capacitor", "IC", ...
const char* category_name(Category category);

} // namespace bommatch
