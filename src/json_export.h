#pragma once

#include "match_engine.h"
#include <ostream>
#include <vector>

namespace bommatch {

// Serialize matched groups, in the given order, as a JSON BOM document.
void write_json(std::ostream& out, const std::vector<const MatchGroup*>& groups);

// Same, in bom_order().
void write_json(std::ostream& out, const GroupedResults& groups);

} // namespace bommatch
