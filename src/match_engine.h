#pragma once

#include "diagnostic_analyzer.h"
#include "match_scorer.h"
#include "part_model.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bommatch {

struct MatcherOptions {
    bool verbose = false;          // expose tied alternates and notes
    bool debug = false;            // per-candidate score traces
    int max_alternates = 2;
    double precision_threshold = 1.0;  // percent
    CapacitanceMode capacitance_mode = CapacitanceMode::Strict;
    ScoreWeights weights;
};

// Everything the engine knows about one component (or group representative).
struct ComponentMatch {
    std::vector<MatchResult> candidates;  // ranked; empty when unmatched
    std::vector<MatchResult> alternates;  // verbose only: same priority as best
    std::vector<std::string> notes;       // "Tied priority 1: 3 options"
    std::vector<std::string> warnings;    // precision warning
    std::optional<Diagnostic> diagnostic; // set iff candidates is empty
    std::string display_value;

    bool matched() const { return !candidates.empty(); }
    const MatchResult* best() const { return candidates.empty() ? nullptr : &candidates.front(); }
};

// Matched components group by (IPN, footprint); unmatched ones by raw value
// and footprint.
struct GroupKey {
    bool matched = false;
    std::string internal_part_number;
    std::string value;
    std::string footprint;

    // "IPN_footprint" or "NO_MATCH_value_footprint"
    std::string str() const;

    bool operator<(const GroupKey& other) const;
    bool operator==(const GroupKey& other) const;
};

struct MatchGroup {
    GroupKey key;
    std::vector<const Component*> members;  // points into the caller's component list
    ComponentMatch match;

    std::vector<std::string> references() const;
};

using GroupedResults = std::map<GroupKey, MatchGroup>;

class MatchEngine {
public:
    // The inventory must outlive the engine; it is never modified.
    explicit MatchEngine(const std::vector<InventoryItem>& inventory,
                         const MatcherOptions& opts = {});
    MatchEngine(std::vector<InventoryItem>&&, const MatcherOptions& = {}) = delete;

    // Items passing the primary filters with a positive score, best first.
    std::vector<MatchResult> find_matches(const Component& component) const;

    // Ranked candidates plus alternates, notes, warnings and, when nothing
    // matched, a diagnostic.
    ComponentMatch match(const Component& component) const;

    // Match every component once per distinct part and group them.
    GroupedResults group_and_match(const std::vector<Component>& components) const;

    // EIA rendering of R/C/L values ("10K0", "100nF"), raw value otherwise.
    std::string format_display_value(const Component& component) const;

    const MatchScorer& scorer() const { return scorer_; }
    const std::vector<InventoryItem>& inventory() const { return inventory_; }
    const MatcherOptions& options() const { return opts_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    const std::vector<InventoryItem>& inventory_;
    MatcherOptions opts_;
    MatchScorer scorer_;
    std::vector<std::string> warnings_;

    void validate_inventory();

    std::vector<MatchResult> rank(const Component& component, const ComponentProfile& profile,
                                  std::vector<const InventoryItem*>* filtered) const;
    std::optional<std::string> precision_warning(
        const ComponentProfile& profile, const MatchResult& best,
        const std::vector<const InventoryItem*>& filtered) const;

    void log(const std::string& msg) const;
    void warn(const std::string& msg);
};

// Groups in BOM order: designator prefix, lowest designator number, references.
std::vector<const MatchGroup*> bom_order(const GroupedResults& groups);

// Order for designators within a group: "R2" before "R10".
bool designator_less(const std::string& a, const std::string& b);

} // namespace bommatch
