#pragma once

#include "match_scorer.h"
#include "part_model.h"
#include <string>
#include <vector>

namespace bommatch {

// Why a component found no inventory match. Exactly one per unmatched component.
enum class DiagnosticIssue {
    TypeUnknown,             // category could not be determined
    NoTypeMatch,             // no inventory item of that category
    NoValueMatch,            // items of the category exist, none with the value
    PackageMismatch,         // value available, but only in other packages
    PackageMismatchGeneric,  // value available, package wrong, no alternatives listed
    NoMatch                  // none of the above
};

struct Diagnostic {
    DiagnosticIssue issue = DiagnosticIssue::NoMatch;
    std::string reference;
    std::string library_id;
    std::string value;
    Category category = Category::Unknown;
    std::string package;                          // best-effort package of the footprint
    std::string required_package;                 // recognized token, mismatch issues only
    std::vector<std::string> available_packages;  // sorted, PackageMismatch only
};

Diagnostic analyze(const Component& component, const std::vector<InventoryItem>& inventory,
                   const MatchScorer& scorer);
Diagnostic analyze(const Component& component, const std::vector<InventoryItem>& inventory);

// Single line, for a spreadsheet cell:
//   Component: R1 (Device:R) is a 10K 0603 Resistor; Issue: No RES components with value 10K found
std::string render_terse(const Diagnostic& diag);

// Multi-line, for the console.
std::string render_verbose(const Diagnostic& diag);

// Stable machine-readable name: "type_unknown", "no_value_match", ...
const char* issue_code(DiagnosticIssue issue);

} // namespace bommatch
