#pragma once

#include <string>

namespace bommatch {

// Normalized package token for a footprint: "0603", "SOIC-8", "SOT-23-5".
// When no known package is recognized, returns the footprint name with the
// library prefix and dimension annotations ("_3x3mm_P0.5mm") removed.
// Empty only for an empty footprint.
std::string extract_package(const std::string& footprint);

// Like extract_package() but returns only recognized tokens (chip codes and
// named package families), empty otherwise.
std::string recognized_package(const std::string& footprint);

// True when an inventory package field names the token. Case-insensitive;
// "SOT23" also names "SOT-23".
bool package_matches(const std::string& token, const std::string& inventory_package);

enum class MountType { SMD, THT, Unknown };

// Mount style from the inventory SMD column, falling back to package families
// recognized in the footprint.
MountType mount_type(const std::string& smd_field, const std::string& footprint);

} // namespace bommatch
