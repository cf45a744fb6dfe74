#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bommatch {

// Inventory items without an explicit priority rank behind every ranked item.
constexpr int DEFAULT_PRIORITY = 99;

enum class Category {
    Resistor,
    Capacitor,
    Inductor,
    Diode,
    Led,
    Transistor,
    IntegratedCircuit,
    Microcontroller,
    Connector,
    Switch,
    Relay,
    Regulator,
    Oscillator,
    Analog,
    Unknown
};

using PropertyMap = std::map<std::string, std::string>;

// A placed design element as read from the schematic/netlist.
struct Component {
    std::string reference;   // designator, e.g. "R10"
    std::string library_id;  // "Device:R"
    std::string value;       // as entered by the designer
    std::string footprint;   // "Resistor_SMD:R_0603_1608Metric"
    PropertyMap properties;  // "Tolerance" -> "1%"
    bool in_bom = true;
    bool dnp = false;
};

// One row of the parts inventory.
struct InventoryItem {
    std::string internal_part_number;   // IPN, unique key
    std::string category;               // "RES", "CAP", ...
    std::string value;
    std::string package;
    std::string tolerance;
    std::string voltage;
    std::string amperage;
    std::string wattage;
    std::string manufacturer;
    std::string manufacturer_part_number;
    std::string distributor_id;         // e.g. LCSC part number
    std::string keywords;
    std::string description;
    std::string datasheet;
    std::string smd;
    int priority = DEFAULT_PRIORITY;    // lower is more desirable
    PropertyMap attributes;             // any other inventory column
};

// Category-specific fields. Only the alternative matching the category is
// populated; everything else is std::monostate.
struct LedAttributes {
    std::string wavelength;
    std::string intensity;  // mcd
    std::string angle;
};

struct OscillatorAttributes {
    std::string frequency;
    std::string stability;
    std::string load;
};

struct ConnectorAttributes {
    std::string pitch;
};

struct IcAttributes {
    std::string family;
};

using CategoryAttributes = std::variant<std::monostate, LedAttributes, OscillatorAttributes,
                                        ConnectorAttributes, IcAttributes>;

// Build the category-specific view of a property/attribute map.
CategoryAttributes category_attributes(Category category, const PropertyMap& props);

// Names of the properties consumed by category_attributes() for a category.
std::vector<std::string> category_attribute_keys(Category category);

struct MatchResult {
    const InventoryItem* item = nullptr;  // points into the caller's inventory
    int score = 0;
    int priority = DEFAULT_PRIORITY;
    std::size_t inventory_index = 0;      // position in the inventory, final tiebreaker
    std::optional<std::string> debug_trace;
};

// Total order used for every candidate list: priority ascending, score
// descending, then original inventory order.
inline bool ranks_before(const MatchResult& a, const MatchResult& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    if (a.score != b.score) return a.score > b.score;
    return a.inventory_index < b.inventory_index;
}

// Case-insensitive lookup in a property map. Returns nullptr when absent.
const std::string* find_property(const PropertyMap& props, const std::string& name);

} // namespace bommatch
