#pragma once

#include "part_model.h"
#include "value_parser.h"
#include <optional>
#include <string>

namespace bommatch {

// Additive score weights. Defaults are the canonical weights.
struct ScoreWeights {
    int type = 50;
    int value = 40;
    int package = 30;
    int tolerance_exact = 15;
    int tolerance_better = 12;   // inventory tolerance tighter than required
    int voltage = 10;
    int current = 10;
    int power = 10;
    int led_wavelength = 8;
    int led_intensity = 8;
    int led_angle = 5;
    int osc_frequency = 12;
    int osc_stability = 8;
    int osc_load = 5;
    int connector_pitch = 10;
    int ic_family = 8;
    int generic_property = 3;
    int keyword = 10;
};

struct ScorerOptions {
    ScoreWeights weights;
    CapacitanceMode capacitance_mode = CapacitanceMode::Strict;
    double precision_threshold = 1.0;  // percent; at or below counts as precision
    bool debug = false;
};

// A component annotated once per matching run.
struct ComponentProfile {
    Category category = Category::Unknown;
    std::string package;                       // recognized package token or empty
    std::string normalized_value;
    std::optional<double> required_tolerance;  // explicit, or implied by precision notation
    bool precision_implied = false;            // resistor asks for the precision class
};

class MatchScorer {
public:
    explicit MatchScorer(const ScorerOptions& opts = {});

    ComponentProfile profile(const Component& component) const;

    // Hard filters: category, package, value. Any failure excludes the item.
    bool passes_primary_filters(const Component& component, const ComponentProfile& profile,
                                const InventoryItem& item) const;
    bool passes_primary_filters(const Component& component, const InventoryItem& item) const;

    // Weighted suitability; only meaningful for items that pass the filters.
    // When trace is non-null it receives a human-readable breakdown.
    int score(const Component& component, const ComponentProfile& profile,
              const InventoryItem& item, std::string* trace = nullptr) const;
    int score(const Component& component, const InventoryItem& item) const;

    // Numeric comparison for R/C/L, normalized string equality otherwise.
    // A value that fails to parse never matches.
    bool values_match(const Component& component, const ComponentProfile& profile,
                      const InventoryItem& item) const;

    const ScorerOptions& options() const { return opts_; }

private:
    ScorerOptions opts_;

    int property_score(const Component& component, const ComponentProfile& profile,
                       const InventoryItem& item, std::string* trace) const;
    int tolerance_score(const Component& component, const ComponentProfile& profile,
                        const InventoryItem& item, std::string* trace) const;

    void log(const std::string& msg) const;
};

} // namespace bommatch
