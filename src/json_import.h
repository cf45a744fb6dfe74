#pragma once

#include "match_engine.h"
#include "part_model.h"
#include <istream>
#include <string>
#include <vector>

namespace bommatch {

// Read an inventory: a JSON array of row objects keyed by spreadsheet column
// (IPN, Category, Value, Package, Tolerance, V, A, W, Manufacturer, MFGPN,
// LCSC, Priority, Keywords, Description, Datasheet, SMD). Other columns land
// in InventoryItem::attributes. An object with an "items" array is accepted too.
// Returns true on success, false on parse error.
bool read_inventory(std::istream& in, std::vector<InventoryItem>& items);
bool read_inventory(const std::string& json_text, std::vector<InventoryItem>& items);

// Read components: an array (or {"components": [...]}) of
// {reference, lib_id, value, footprint, properties, in_bom, dnp}.
bool read_components(std::istream& in, std::vector<Component>& components);
bool read_components(const std::string& json_text, std::vector<Component>& components);

// Overlay a JSON config onto opts. Keys that are absent keep their value.
bool read_matcher_config(std::istream& in, MatcherOptions& opts);
bool read_matcher_config(const std::string& json_text, MatcherOptions& opts);

} // namespace bommatch
