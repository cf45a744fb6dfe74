#include "diagnostic_analyzer.h"
#include "package_extractor.h"
#include "type_classifier.h"
#include "utils.h"

#include <algorithm>
#include <set>

namespace bommatch {

// ── analysis ────────────────────────────────────────────────────────

Diagnostic analyze(const Component& component, const std::vector<InventoryItem>& inventory,
                   const MatchScorer& scorer) {
    Diagnostic diag;
    diag.reference = component.reference;
    diag.library_id = component.library_id;
    diag.value = trim(component.value);
    diag.package = extract_package(component.footprint);

    ComponentProfile profile = scorer.profile(component);
    diag.category = profile.category;
    if (profile.category == Category::Unknown) {
        diag.issue = DiagnosticIssue::TypeUnknown;
        return diag;
    }

    const char* code = category_code(profile.category);
    bool has_value = !profile.normalized_value.empty();
    int type_matches = 0;
    int value_matches = 0;
    int package_misses = 0;
    std::set<std::string> other_packages;

    for (auto& item : inventory) {
        if (!icontains(item.category, code)) continue;
        type_matches++;

        // Without a value every item of the type is a candidate
        if (has_value && !scorer.values_match(component, profile, item)) continue;
        value_matches++;

        if (!profile.package.empty() && !package_matches(profile.package, item.package)) {
            package_misses++;
            std::string pkg = trim(item.package);
            if (!pkg.empty()) other_packages.insert(pkg);
        }
    }

    if (type_matches == 0) {
        diag.issue = DiagnosticIssue::NoTypeMatch;
    } else if (value_matches == 0 && has_value) {
        diag.issue = DiagnosticIssue::NoValueMatch;
    } else if (package_misses > 0) {
        diag.required_package = profile.package;
        if (!other_packages.empty()) {
            diag.issue = DiagnosticIssue::PackageMismatch;
            diag.available_packages.assign(other_packages.begin(), other_packages.end());
        } else {
            diag.issue = DiagnosticIssue::PackageMismatchGeneric;
        }
    } else {
        diag.issue = DiagnosticIssue::NoMatch;
    }
    return diag;
}

Diagnostic analyze(const Component& component, const std::vector<InventoryItem>& inventory) {
    return analyze(component, inventory, MatchScorer());
}

// ── rendering ───────────────────────────────────────────────────────

static void split_library_id(const std::string& id, std::string& ns, std::string& part) {
    auto colon = id.find(':');
    if (colon == std::string::npos) {
        ns.clear();
        part = id;
    } else {
        ns = id.substr(0, colon);
        part = id.substr(colon + 1);
    }
}

// "is a 10K 0603 Resistor"
static std::string describe_part(const Diagnostic& diag) {
    std::string s = "is a";
    if (!diag.value.empty()) s += " " + diag.value;
    if (!diag.package.empty()) s += " " + diag.package;
    s += " ";
    s += category_name(diag.category);
    return s;
}

static std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

static std::string issue_text(const Diagnostic& diag, bool console) {
    std::string friendly = to_lower(category_name(diag.category)) + "s";
    const char* code = category_code(diag.category);

    switch (diag.issue) {
    case DiagnosticIssue::TypeUnknown:
        if (console)
            return "Cannot determine component type - may be a non-electronic part "
                   "(board outline, label, etc.)";
        return "Component type could not be determined";
    case DiagnosticIssue::NoTypeMatch:
        if (console) return "No " + friendly + " in inventory";
        return std::string("No ") + code + " components found in inventory";
    case DiagnosticIssue::NoValueMatch:
        if (console) return "No " + friendly + " with value '" + diag.value + "' in inventory";
        return std::string("No ") + code + " components with value " + diag.value + " found";
    case DiagnosticIssue::PackageMismatch:
        return "Value '" + diag.value + "' available in " + join(diag.available_packages, ", ") +
               " packages, but not " + diag.required_package;
    case DiagnosticIssue::PackageMismatchGeneric:
        if (console) return "Package mismatch - needs " + diag.required_package;
        return "Package mismatch - required " + diag.required_package;
    case DiagnosticIssue::NoMatch:
        break;
    }
    return "Component specification doesn't match any inventory items";
}

std::string render_terse(const Diagnostic& diag) {
    std::string ns, part;
    split_library_id(diag.library_id, ns, part);

    std::string desc = "Component: " + diag.reference + " (" + diag.library_id + ")";
    if (diag.category == Category::Unknown) {
        desc += " from " + ns + " (part: " + part + ")";
    } else {
        desc += " " + describe_part(diag);
    }
    return desc + "; Issue: " + issue_text(diag, false);
}

std::string render_verbose(const Diagnostic& diag) {
    std::string ns, part;
    split_library_id(diag.library_id, ns, part);

    std::string desc = "Component " + diag.reference + " from " + ns;
    if (diag.category == Category::Unknown) {
        desc += " (part: " + part + ")";
    } else {
        desc += " " + describe_part(diag);
    }
    return desc + "\n    Issue: " + issue_text(diag, true);
}

const char* issue_code(DiagnosticIssue issue) {
    switch (issue) {
    case DiagnosticIssue::TypeUnknown:            return "type_unknown";
    case DiagnosticIssue::NoTypeMatch:            return "no_type_match";
    case DiagnosticIssue::NoValueMatch:           return "no_value_match";
    case DiagnosticIssue::PackageMismatch:        return "package_mismatch";
    case DiagnosticIssue::PackageMismatchGeneric: return "package_mismatch_generic";
    case DiagnosticIssue::NoMatch:                break;
    }
    return "no_match";
}

} // namespace bommatch
