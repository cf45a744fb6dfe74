#include "match_scorer.h"
#include "package_extractor.h"
#include "type_classifier.h"
#include "utils.h"

#include <cmath>
#include <iostream>
#include <variant>
#include <vector>

namespace bommatch {

// Common electrical properties that mean something for a category
enum PropertyField : unsigned {
    FIELD_TOLERANCE = 1u << 0,
    FIELD_VOLTAGE   = 1u << 1,
    FIELD_CURRENT   = 1u << 2,
    FIELD_POWER     = 1u << 3,
};

static unsigned relevant_fields(Category category) {
    switch (category) {
    case Category::Resistor:          return FIELD_VOLTAGE | FIELD_POWER | FIELD_TOLERANCE;
    case Category::Capacitor:         return FIELD_VOLTAGE | FIELD_TOLERANCE;
    case Category::Inductor:          return FIELD_CURRENT | FIELD_POWER;
    case Category::Diode:             return FIELD_VOLTAGE | FIELD_CURRENT;
    case Category::Led:               return FIELD_VOLTAGE | FIELD_CURRENT;
    case Category::Transistor:        return FIELD_VOLTAGE | FIELD_CURRENT | FIELD_POWER;
    case Category::Regulator:         return FIELD_VOLTAGE | FIELD_CURRENT | FIELD_POWER;
    case Category::IntegratedCircuit: return FIELD_VOLTAGE;
    case Category::Analog:            return FIELD_VOLTAGE;
    case Category::Microcontroller:
    case Category::Connector:
    case Category::Switch:
    case Category::Relay:
    case Category::Oscillator:        return 0;
    case Category::Unknown:           break;
    }
    return FIELD_TOLERANCE | FIELD_VOLTAGE | FIELD_CURRENT | FIELD_POWER;
}

static const char* const voltage_keys[] = {"Voltage", "V"};
static const char* const current_keys[] = {"A", "Amperage", "Current"};
static const char* const power_keys[]   = {"W", "Power", "P", "Wattage"};

// Properties handled by dedicated rules or carrying no matchable meaning
static const char* const reserved_keys[] = {
    "Tolerance", "Voltage", "V", "A", "Amperage", "Current", "W", "Power", "P", "Wattage",
    "Reference", "Value", "Footprint", "Datasheet", "Description",
};

static void note(std::string* trace, const std::string& part) {
    if (!trace) return;
    if (!trace->empty()) *trace += ", ";
    *trace += part;
}

// First of the given property names present on the component, trimmed
template <size_t N>
static std::string first_property(const Component& component, const char* const (&keys)[N]) {
    for (auto key : keys) {
        auto p = find_property(component.properties, key);
        if (p && !trim(*p).empty()) return trim(*p);
    }
    return {};
}

static bool is_reserved(const std::string& key, Category category) {
    for (auto r : reserved_keys) {
        if (iequals(key, r)) return true;
    }
    for (auto& k : category_attribute_keys(category)) {
        if (iequals(key, k)) return true;
    }
    return false;
}

static std::string item_field(const InventoryItem& item, const std::string& name) {
    if (iequals(name, "Manufacturer")) return item.manufacturer;
    auto p = find_property(item.attributes, name);
    return p ? *p : std::string();
}

// Category-specific bonuses, dispatched on the component's attribute set
struct CategoryBonus {
    const CategoryAttributes& item;
    const ScoreWeights& w;
    std::string* trace;

    int bonus(const std::string& wanted, const std::string& have, int weight,
              const char* label) const {
        if (wanted.empty() || have.empty() || !icontains(have, wanted)) return 0;
        note(trace, std::string(label) + " match: +" + std::to_string(weight));
        return weight;
    }

    int operator()(std::monostate) const { return 0; }

    int operator()(const LedAttributes& c) const {
        auto i = std::get_if<LedAttributes>(&item);
        if (!i) return 0;
        return bonus(c.wavelength, i->wavelength, w.led_wavelength, "Wavelength") +
               bonus(c.intensity, i->intensity, w.led_intensity, "Intensity") +
               bonus(c.angle, i->angle, w.led_angle, "Angle");
    }

    int operator()(const OscillatorAttributes& c) const {
        auto i = std::get_if<OscillatorAttributes>(&item);
        if (!i) return 0;
        return bonus(c.frequency, i->frequency, w.osc_frequency, "Frequency") +
               bonus(c.stability, i->stability, w.osc_stability, "Stability") +
               bonus(c.load, i->load, w.osc_load, "Load");
    }

    int operator()(const ConnectorAttributes& c) const {
        auto i = std::get_if<ConnectorAttributes>(&item);
        if (!i) return 0;
        return bonus(c.pitch, i->pitch, w.connector_pitch, "Pitch");
    }

    int operator()(const IcAttributes& c) const {
        auto i = std::get_if<IcAttributes>(&item);
        if (!i) return 0;
        return bonus(c.family, i->family, w.ic_family, "Family");
    }
};

MatchScorer::MatchScorer(const ScorerOptions& opts)
    : opts_(opts) {}

ComponentProfile MatchScorer::profile(const Component& component) const {
    ComponentProfile p;
    p.category = classify(component);
    p.package = recognized_package(component.footprint);
    p.normalized_value = normalize_value(component.value);

    auto tol_prop = find_property(component.properties, "Tolerance");
    if (tol_prop && !trim(*tol_prop).empty()) {
        p.required_tolerance = parse_tolerance_percent(*tol_prop);
        if (!p.required_tolerance) {
            log("Ignoring malformed tolerance '" + *tol_prop + "' on " + component.reference);
        }
    }

    if (p.category == Category::Resistor) {
        bool explicit_precision = has_explicit_precision(component.value);
        bool tight = p.required_tolerance && *p.required_tolerance <= opts_.precision_threshold;
        p.precision_implied = explicit_precision || tight;
        if (explicit_precision && !p.required_tolerance) {
            p.required_tolerance = opts_.precision_threshold;
        }
    }
    return p;
}

bool MatchScorer::values_match(const Component& component, const ComponentProfile& profile,
                               const InventoryItem& item) const {
    if (profile.normalized_value.empty()) return false;

    auto quantity = value_quantity(profile.category);
    if (quantity) {
        auto want = parse_quantity(*quantity, component.value, opts_.capacitance_mode);
        auto have = parse_quantity(*quantity, item.value, opts_.capacitance_mode);
        if (!want || !have) return false;
        return quantities_equal(*quantity, *want, *have);
    }

    std::string inv = normalize_value(item.value);
    return !inv.empty() && inv == profile.normalized_value;
}

bool MatchScorer::passes_primary_filters(const Component& component,
                                         const ComponentProfile& profile,
                                         const InventoryItem& item) const {
    // 1) Category must match when known
    if (profile.category != Category::Unknown &&
        !icontains(item.category, category_code(profile.category))) {
        return false;
    }
    // 2) Package must match when one is recognized
    if (!profile.package.empty() && !package_matches(profile.package, item.package)) {
        return false;
    }
    // 3) Value must match when present
    if (!profile.normalized_value.empty() && !values_match(component, profile, item)) {
        return false;
    }
    return true;
}

bool MatchScorer::passes_primary_filters(const Component& component,
                                         const InventoryItem& item) const {
    return passes_primary_filters(component, profile(component), item);
}

int MatchScorer::score(const Component& component, const ComponentProfile& profile,
                       const InventoryItem& item, std::string* trace) const {
    const ScoreWeights& w = opts_.weights;
    int total = 0;

    if (profile.category != Category::Unknown) {
        const char* code = category_code(profile.category);
        if (icontains(item.category, code)) {
            total += w.type;
            note(trace, "Type match: +" + std::to_string(w.type) + " (" + code + " in " +
                            item.category + ")");
        } else {
            note(trace, std::string("Type mismatch: ") + code + " not in " + item.category);
        }
    }

    if (!profile.normalized_value.empty()) {
        if (values_match(component, profile, item)) {
            total += w.value;
            note(trace, "Value match: +" + std::to_string(w.value) + " (" + component.value +
                            " = " + item.value + ")");
        } else {
            note(trace, "Value mismatch: " + component.value + " != " + item.value);
        }
    }

    if (!profile.package.empty() && !item.package.empty()) {
        if (package_matches(profile.package, item.package)) {
            total += w.package;
            note(trace, "Footprint match: +" + std::to_string(w.package));
        } else {
            note(trace, "Footprint mismatch: " + profile.package + " != " + item.package);
        }
    }

    int props = property_score(component, profile, item, trace);
    total += props;

    std::string value = trim(component.value);
    if (!value.empty() && icontains(item.keywords, value)) {
        total += w.keyword;
        note(trace, "Keyword match: +" + std::to_string(w.keyword));
    }

    return total;
}

int MatchScorer::score(const Component& component, const InventoryItem& item) const {
    return score(component, profile(component), item);
}

int MatchScorer::tolerance_score(const Component& component, const ComponentProfile& profile,
                                 const InventoryItem& item, std::string* trace) const {
    if (!profile.required_tolerance || trim(item.tolerance).empty()) return 0;

    auto have = parse_tolerance_percent(item.tolerance);
    if (!have) {
        log("Ignoring malformed tolerance '" + item.tolerance + "' on " +
            item.internal_part_number + " for " + component.reference);
        return 0;
    }

    double want = *profile.required_tolerance;
    if (std::fabs(*have - want) < 1e-9) {
        note(trace, "Tolerance exact: +" + std::to_string(opts_.weights.tolerance_exact));
        return opts_.weights.tolerance_exact;
    }
    if (*have < want) {
        note(trace, "Tolerance tighter: +" + std::to_string(opts_.weights.tolerance_better));
        return opts_.weights.tolerance_better;
    }
    // Looser than required earns nothing
    return 0;
}

int MatchScorer::property_score(const Component& component, const ComponentProfile& profile,
                                const InventoryItem& item, std::string* trace) const {
    const ScoreWeights& w = opts_.weights;
    unsigned fields = relevant_fields(profile.category);
    int total = 0;

    if (fields & FIELD_TOLERANCE) {
        total += tolerance_score(component, profile, item, trace);
    }

    if ((fields & FIELD_VOLTAGE) && !item.voltage.empty()) {
        std::string v = first_property(component, voltage_keys);
        if (!v.empty() && icontains(item.voltage, v)) {
            total += w.voltage;
            note(trace, "Voltage match: +" + std::to_string(w.voltage));
        }
    }

    if ((fields & FIELD_CURRENT) && !item.amperage.empty()) {
        std::string a = first_property(component, current_keys);
        if (!a.empty() && icontains(item.amperage, a)) {
            total += w.current;
            note(trace, "Current match: +" + std::to_string(w.current));
        }
    }

    if ((fields & FIELD_POWER) && !item.wattage.empty()) {
        std::string p = first_property(component, power_keys);
        if (!p.empty() && icontains(item.wattage, p)) {
            total += w.power;
            note(trace, "Power match: +" + std::to_string(w.power));
        }
    }

    CategoryAttributes wanted = category_attributes(profile.category, component.properties);
    CategoryAttributes offered = category_attributes(profile.category, item.attributes);
    total += std::visit(CategoryBonus{offered, w, trace}, wanted);

    for (auto& [key, raw] : component.properties) {
        std::string wanted_value = trim(raw);
        if (wanted_value.empty() || is_reserved(key, profile.category)) continue;
        std::string have = item_field(item, key);
        if (!have.empty() && icontains(have, wanted_value)) {
            total += w.generic_property;
            note(trace, key + " match: +" + std::to_string(w.generic_property));
        }
    }

    return total;
}

void MatchScorer::log(const std::string& msg) const {
    if (opts_.debug) {
        std::cout << "[Scorer] " << msg << std::endl;
    }
}

} // namespace bommatch
