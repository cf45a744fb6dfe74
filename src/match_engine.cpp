#include "match_engine.h"
#include "type_classifier.h"
#include "utils.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <iostream>
#include <set>
#include <tuple>

namespace bommatch {

static ScorerOptions scorer_options(const MatcherOptions& opts) {
    ScorerOptions s;
    s.weights = opts.weights;
    s.capacitance_mode = opts.capacitance_mode;
    s.precision_threshold = opts.precision_threshold;
    s.debug = opts.debug;
    return s;
}

MatchEngine::MatchEngine(const std::vector<InventoryItem>& inventory, const MatcherOptions& opts)
    : inventory_(inventory), opts_(opts), scorer_(scorer_options(opts)) {
    validate_inventory();
}

void MatchEngine::validate_inventory() {
    std::set<std::string> seen;
    for (size_t i = 0; i < inventory_.size(); i++) {
        const std::string ipn = trim(inventory_[i].internal_part_number);
        if (ipn.empty()) {
            warn("Inventory row " + std::to_string(i + 1) + " has no IPN");
            continue;
        }
        if (!seen.insert(ipn).second) {
            warn("Duplicate IPN in inventory: " + ipn);
        }
    }
    log("Inventory: " + std::to_string(inventory_.size()) + " items");
}

// ── candidate ranking ───────────────────────────────────────────────

std::vector<MatchResult> MatchEngine::rank(const Component& component,
                                           const ComponentProfile& profile,
                                           std::vector<const InventoryItem*>* filtered) const {
    std::vector<MatchResult> results;

    for (size_t i = 0; i < inventory_.size(); i++) {
        const InventoryItem& item = inventory_[i];
        if (!scorer_.passes_primary_filters(component, profile, item)) continue;
        if (filtered) filtered->push_back(&item);

        std::string trace;
        int score = scorer_.score(component, profile, item, opts_.debug ? &trace : nullptr);
        if (score <= 0) continue;

        MatchResult r;
        r.item = &item;
        r.score = score;
        r.priority = item.priority;
        r.inventory_index = i;
        if (opts_.debug) {
            r.debug_trace = "IPN: " + item.internal_part_number +
                            ", Score: " + std::to_string(score) +
                            ", Priority: " + std::to_string(item.priority) +
                            (trace.empty() ? "" : ", " + trace);
        }
        results.push_back(std::move(r));
    }

    std::sort(results.begin(), results.end(), ranks_before);
    return results;
}

std::vector<MatchResult> MatchEngine::find_matches(const Component& component) const {
    return rank(component, scorer_.profile(component), nullptr);
}

std::optional<std::string> MatchEngine::precision_warning(
    const ComponentProfile& profile, const MatchResult& best,
    const std::vector<const InventoryItem*>& filtered) const {
    if (profile.category != Category::Resistor || !profile.precision_implied) return std::nullopt;

    for (auto item : filtered) {
        auto tol = parse_tolerance_percent(item->tolerance);
        if (tol && *tol <= opts_.precision_threshold) return std::nullopt;
    }

    std::string best_tol = trim(best.item->tolerance);
    if (best_tol.empty()) best_tol = "unknown";
    std::string pct = fmt(opts_.precision_threshold) + "%";
    return "Warning: schematic implies " + pct + " resistor but no " + pct +
           " inventory item found (best tolerance " + best_tol + ").";
}

ComponentMatch MatchEngine::match(const Component& component) const {
    ComponentMatch m;
    ComponentProfile profile = scorer_.profile(component);
    std::vector<const InventoryItem*> filtered;

    m.candidates = rank(component, profile, &filtered);
    m.display_value = format_display_value(component);

    if (m.candidates.empty()) {
        m.diagnostic = analyze(component, inventory_, scorer_);
        log(component.reference + ": no match (" + issue_code(m.diagnostic->issue) + ")");
        return m;
    }

    const MatchResult& best = m.candidates.front();
    log(component.reference + ": " + best.item->internal_part_number +
        " (score " + std::to_string(best.score) + ", priority " +
        std::to_string(best.priority) + ", " + std::to_string(m.candidates.size()) +
        " candidates)");

    // Ties are only surfaced in verbose mode; otherwise the ranking's first
    // entry stands alone.
    if (opts_.verbose) {
        int tied = 0;
        for (size_t i = 1; i < m.candidates.size(); i++) {
            if (m.candidates[i].priority != best.priority) continue;
            tied++;
            if ((int)m.alternates.size() < opts_.max_alternates) {
                m.alternates.push_back(m.candidates[i]);
            }
        }
        if (tied > 0) {
            m.notes.push_back("Tied priority " + std::to_string(best.priority) + ": " +
                              std::to_string(tied + 1) + " options");
        }
    }

    auto warning = precision_warning(profile, best, filtered);
    if (warning) m.warnings.push_back(*warning);

    return m;
}

// ── grouping ────────────────────────────────────────────────────────

std::string GroupKey::str() const {
    if (matched) return internal_part_number + "_" + footprint;
    return "NO_MATCH_" + value + "_" + footprint;
}

bool GroupKey::operator<(const GroupKey& other) const {
    return std::tie(matched, internal_part_number, value, footprint) <
           std::tie(other.matched, other.internal_part_number, other.value, other.footprint);
}

bool GroupKey::operator==(const GroupKey& other) const {
    return std::tie(matched, internal_part_number, value, footprint) ==
           std::tie(other.matched, other.internal_part_number, other.value, other.footprint);
}

std::vector<std::string> MatchGroup::references() const {
    std::vector<std::string> refs;
    for (auto c : members) refs.push_back(c->reference);
    std::sort(refs.begin(), refs.end(), designator_less);
    return refs;
}

// Components that would produce the same match share one lookup
static std::string match_signature(const Component& c) {
    std::string key = c.library_id + '\x1f' + normalize_value(c.value) + '\x1f' + c.footprint;
    for (auto& [name, value] : c.properties) {
        key += '\x1f' + name + '=' + value;
    }
    return key;
}

GroupedResults MatchEngine::group_and_match(const std::vector<Component>& components) const {
    GroupedResults groups;
    std::map<std::string, ComponentMatch> memo;

    for (auto& component : components) {
        std::string sig = match_signature(component);
        auto it = memo.find(sig);
        if (it == memo.end()) {
            it = memo.emplace(sig, match(component)).first;
        }
        const ComponentMatch& m = it->second;

        GroupKey key;
        key.footprint = component.footprint;
        if (m.matched()) {
            key.matched = true;
            key.internal_part_number = m.best()->item->internal_part_number;
        } else {
            key.value = component.value;
        }

        auto g = groups.find(key);
        if (g == groups.end()) {
            MatchGroup group;
            group.key = key;
            group.match = m;
            g = groups.emplace(key, std::move(group)).first;
        } else {
            // Members with other requirements may still land on the same part
            auto& warnings = g->second.match.warnings;
            for (auto& w : m.warnings) {
                if (std::find(warnings.begin(), warnings.end(), w) == warnings.end()) {
                    warnings.push_back(w);
                }
            }
        }
        g->second.members.push_back(&component);
    }

    log("Grouped " + std::to_string(components.size()) + " components into " +
        std::to_string(groups.size()) + " groups (" + std::to_string(memo.size()) +
        " distinct parts)");
    return groups;
}

// ── display ─────────────────────────────────────────────────────────

std::string MatchEngine::format_display_value(const Component& component) const {
    ComponentProfile profile = scorer_.profile(component);
    switch (profile.category) {
    case Category::Resistor:
        if (auto ohms = parse_resistance(component.value))
            return format_resistance_eia(*ohms, profile.precision_implied);
        break;
    case Category::Capacitor:
        if (auto farads = parse_capacitance(component.value, opts_.capacitance_mode))
            return format_capacitance_eia(*farads);
        break;
    case Category::Inductor:
        if (auto henries = parse_inductance(component.value))
            return format_inductance_eia(*henries);
        break;
    default:
        break;
    }
    return component.value;
}

// ── ordering ────────────────────────────────────────────────────────

static int designator_number(const std::string& reference) {
    std::string ref = trim(reference);
    size_t i = 0;
    while (i < ref.size() && std::isalpha((unsigned char)ref[i])) i++;
    size_t j = i;
    while (j < ref.size() && std::isdigit((unsigned char)ref[j])) j++;
    if (j == i) return INT_MAX;
    return parse_int(ref.substr(i, j - i), INT_MAX);
}

bool designator_less(const std::string& a, const std::string& b) {
    auto ka = std::make_tuple(reference_prefix(a), designator_number(a), a);
    auto kb = std::make_tuple(reference_prefix(b), designator_number(b), b);
    return ka < kb;
}

std::vector<const MatchGroup*> bom_order(const GroupedResults& groups) {
    struct Entry {
        std::string prefix;
        int number;
        std::string refs;
        const MatchGroup* group;
    };

    std::vector<Entry> entries;
    for (auto& [key, group] : groups) {
        auto refs = group.references();
        Entry e;
        e.prefix = refs.empty() ? std::string() : reference_prefix(refs.front());
        e.number = INT_MAX;
        for (auto& r : refs) e.number = std::min(e.number, designator_number(r));
        for (size_t i = 0; i < refs.size(); i++) {
            if (i > 0) e.refs += ", ";
            e.refs += refs[i];
        }
        e.group = &group;
        entries.push_back(std::move(e));
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return std::tie(a.prefix, a.number, a.refs) < std::tie(b.prefix, b.number, b.refs);
    });

    std::vector<const MatchGroup*> ordered;
    for (auto& e : entries) ordered.push_back(e.group);
    return ordered;
}

// ── logging ─────────────────────────────────────────────────────────

void MatchEngine::log(const std::string& msg) const {
    if (opts_.verbose || opts_.debug) {
        std::cout << "[Match] " << msg << std::endl;
    }
}

void MatchEngine::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace bommatch
