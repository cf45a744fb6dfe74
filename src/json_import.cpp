#include "json_import.h"
#include "utils.h"

#include <nlohmann/json.hpp>
#include <cmath>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace bommatch {

// ── helpers ─────────────────────────────────────────────────────────

// Spreadsheet cells arrive as strings, numbers or booleans
static std::string cell_text(const json& j) {
    if (j.is_string())          return trim(j.get<std::string>());
    if (j.is_number_integer())  return std::to_string(j.get<long long>());
    if (j.is_number_float())    return fmt(j.get<double>());
    if (j.is_boolean())         return j.get<bool>() ? "true" : "false";
    return "";
}

static std::string field_text(const json& obj, const char* key) {
    return obj.contains(key) ? cell_text(obj[key]) : std::string();
}

// Priorities outside this range are treated as missing, matching parse_int()
static constexpr double max_priority = 1e6;

static int read_priority(const json& j) {
    if (j.is_number_unsigned()) {
        auto v = j.get<unsigned long long>();
        return v <= max_priority ? static_cast<int>(v) : DEFAULT_PRIORITY;
    }
    if (j.is_number_integer()) {
        auto v = j.get<long long>();
        return (v >= -max_priority && v <= max_priority) ? static_cast<int>(v) : DEFAULT_PRIORITY;
    }
    if (j.is_number_float()) {
        double d = j.get<double>();
        if (!std::isfinite(d) || d < -max_priority || d > max_priority) return DEFAULT_PRIORITY;
        return static_cast<int>(d);
    }
    if (j.is_string()) return parse_int(trim(j.get<std::string>()), DEFAULT_PRIORITY);
    return DEFAULT_PRIORITY;
}

// Array at the top level, or under the given key of a top-level object
static const json* row_array(const json& j, const char* key) {
    if (j.is_array()) return &j;
    if (j.is_object() && j.contains(key) && j[key].is_array()) return &j[key];
    return nullptr;
}

// Column name -> field. Aliases share a field; first non-empty wins.
struct InventoryColumn {
    const char* name;
    std::string InventoryItem::*field;
};

static const InventoryColumn inventory_columns[] = {
    {"IPN",          &InventoryItem::internal_part_number},
    {"Category",     &InventoryItem::category},
    {"Value",        &InventoryItem::value},
    {"Package",      &InventoryItem::package},
    {"Tolerance",    &InventoryItem::tolerance},
    {"V",            &InventoryItem::voltage},
    {"Voltage",      &InventoryItem::voltage},
    {"A",            &InventoryItem::amperage},
    {"Amperage",     &InventoryItem::amperage},
    {"W",            &InventoryItem::wattage},
    {"Wattage",      &InventoryItem::wattage},
    {"Power",        &InventoryItem::wattage},
    {"Manufacturer", &InventoryItem::manufacturer},
    {"MFGPN",        &InventoryItem::manufacturer_part_number},
    {"LCSC",         &InventoryItem::distributor_id},
    {"Keywords",     &InventoryItem::keywords},
    {"Description",  &InventoryItem::description},
    {"Datasheet",    &InventoryItem::datasheet},
    {"SMD",          &InventoryItem::smd},
};

static const InventoryColumn* find_column(const std::string& name) {
    std::string key = trim(name);
    for (auto& c : inventory_columns) {
        if (iequals(key, c.name)) return &c;
    }
    return nullptr;
}

// ── section readers ─────────────────────────────────────────────────

static InventoryItem read_inventory_row(const json& row) {
    InventoryItem item;
    for (auto it = row.begin(); it != row.end(); ++it) {
        const std::string& name = it.key();
        if (iequals(trim(name), "Priority")) {
            item.priority = read_priority(it.value());
            continue;
        }
        std::string text = cell_text(it.value());
        if (auto col = find_column(name)) {
            std::string& field = item.*(col->field);
            if (field.empty()) field = text;
        } else if (!text.empty()) {
            item.attributes[trim(name)] = text;
        }
    }
    return item;
}

static Component read_component(const json& cj) {
    Component c;
    c.reference  = field_text(cj, "reference");
    c.library_id = field_text(cj, "lib_id");
    if (c.library_id.empty()) c.library_id = field_text(cj, "library_id");
    c.value      = field_text(cj, "value");
    c.footprint  = field_text(cj, "footprint");
    c.in_bom     = cj.value("in_bom", true);
    c.dnp        = cj.value("dnp", false);

    if (cj.contains("properties") && cj["properties"].is_object()) {
        for (auto it = cj["properties"].begin(); it != cj["properties"].end(); ++it) {
            c.properties[it.key()] = cell_text(it.value());
        }
    }
    return c;
}

static void read_weights(const json& wj, ScoreWeights& w) {
    w.type             = wj.value("type", w.type);
    w.value            = wj.value("value", w.value);
    w.package          = wj.value("package", w.package);
    w.tolerance_exact  = wj.value("tolerance_exact", w.tolerance_exact);
    w.tolerance_better = wj.value("tolerance_better", w.tolerance_better);
    w.voltage          = wj.value("voltage", w.voltage);
    w.current          = wj.value("current", w.current);
    w.power            = wj.value("power", w.power);
    w.led_wavelength   = wj.value("led_wavelength", w.led_wavelength);
    w.led_intensity    = wj.value("led_intensity", w.led_intensity);
    w.led_angle        = wj.value("led_angle", w.led_angle);
    w.osc_frequency    = wj.value("osc_frequency", w.osc_frequency);
    w.osc_stability    = wj.value("osc_stability", w.osc_stability);
    w.osc_load         = wj.value("osc_load", w.osc_load);
    w.connector_pitch  = wj.value("connector_pitch", w.connector_pitch);
    w.ic_family        = wj.value("ic_family", w.ic_family);
    w.generic_property = wj.value("generic_property", w.generic_property);
    w.keyword          = wj.value("keyword", w.keyword);
}

// ── public API ──────────────────────────────────────────────────────

bool read_inventory(std::istream& in, std::vector<InventoryItem>& items) {
    try {
        json j = json::parse(in);
        const json* rows = row_array(j, "items");
        if (!rows) {
            std::cerr << "JSON parse error: inventory must be an array of rows\n";
            return false;
        }
        for (auto& row : *rows) {
            if (!row.is_object()) continue;
            items.push_back(read_inventory_row(row));
        }
        return true;
    } catch (const json::exception& e) {
        std::cerr << "JSON parse error: " << e.what() << "\n";
        return false;
    }
}

bool read_inventory(const std::string& json_text, std::vector<InventoryItem>& items) {
    std::istringstream iss(json_text);
    return read_inventory(iss, items);
}

bool read_components(std::istream& in, std::vector<Component>& components) {
    try {
        json j = json::parse(in);
        const json* rows = row_array(j, "components");
        if (!rows) {
            std::cerr << "JSON parse error: expected an array of components\n";
            return false;
        }
        for (auto& cj : *rows) {
            if (!cj.is_object()) continue;
            components.push_back(read_component(cj));
        }
        return true;
    } catch (const json::exception& e) {
        std::cerr << "JSON parse error: " << e.what() << "\n";
        return false;
    }
}

bool read_components(const std::string& json_text, std::vector<Component>& components) {
    std::istringstream iss(json_text);
    return read_components(iss, components);
}

bool read_matcher_config(std::istream& in, MatcherOptions& opts) {
    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            std::cerr << "JSON parse error: config must be an object\n";
            return false;
        }

        opts.verbose             = j.value("verbose", opts.verbose);
        opts.debug               = j.value("debug", opts.debug);
        opts.max_alternates      = j.value("max_alternates", opts.max_alternates);
        opts.precision_threshold = j.value("precision_threshold", opts.precision_threshold);
        if (j.contains("legacy_bare_capacitance")) {
            opts.capacitance_mode = j["legacy_bare_capacitance"].get<bool>()
                                        ? CapacitanceMode::LegacyMicrofarads
                                        : CapacitanceMode::Strict;
        }
        if (j.contains("weights") && j["weights"].is_object()) {
            read_weights(j["weights"], opts.weights);
        }
        return true;
    } catch (const json::exception& e) {
        std::cerr << "JSON parse error: " << e.what() << "\n";
        return false;
    }
}

bool read_matcher_config(const std::string& json_text, MatcherOptions& opts) {
    std::istringstream iss(json_text);
    return read_matcher_config(iss, opts);
}

} // namespace bommatch
