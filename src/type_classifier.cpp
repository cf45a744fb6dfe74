#include "type_classifier.h"
#include "utils.h"

#include <cctype>

namespace bommatch {

// Which part of the identifiers a rule looks at
enum class RuleTarget {
    LibraryNamespace,  // "Device" in "Device:R"
    Symbol,            // "R" in "Device:R"
    LibraryId,         // the whole library id
    FootprintLibrary,  // "Resistor_SMD" in "Resistor_SMD:R_0603_1608Metric"
    FootprintName,     // "0603-RES" in "PCM_SPCoast:0603-RES"
    Footprint          // the whole footprint string
};

enum class RuleMatch {
    Prefix,    // target starts with pattern
    Token,     // target starts with pattern and the next character is not a letter
    Contains,  // pattern occurs anywhere in target
    Word       // pattern occurs delimited by non-alphanumerics ("0603-RES", "LED_RED")
};

struct ClassifierRule {
    RuleTarget target;
    RuleMatch match;
    const char* pattern;
    Category category;
};

// Evaluated top to bottom, first hit wins. All comparisons are case-insensitive.
// LED rules precede the single-letter inductor/diode tokens; library rules
// precede footprint rules.
static const ClassifierRule rules[] = {
    {RuleTarget::LibraryNamespace, RuleMatch::Token,    "LED",             Category::Led},
    {RuleTarget::Symbol,           RuleMatch::Token,    "LED",             Category::Led},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "MCU_",            Category::Microcontroller},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "microcontroller", Category::Microcontroller},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "Regulator_",      Category::Regulator},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "Relay",           Category::Relay},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "Connector",       Category::Connector},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "Switch",          Category::Switch},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "Transistor_",     Category::Transistor},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "Diode",           Category::Diode},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "Oscillator",      Category::Oscillator},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "Amplifier_",      Category::Analog},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "Timer",           Category::IntegratedCircuit},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "Interface",       Category::IntegratedCircuit},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "Memory",          Category::IntegratedCircuit},
    {RuleTarget::LibraryNamespace, RuleMatch::Prefix,   "74xx",            Category::IntegratedCircuit},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "resistor",        Category::Resistor},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "capacitor",       Category::Capacitor},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "inductor",        Category::Inductor},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "diode",           Category::Diode},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "crystal",         Category::Oscillator},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "oscillator",      Category::Oscillator},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "connector",       Category::Connector},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "switch",          Category::Switch},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "relay",           Category::Relay},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "regulator",       Category::Regulator},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "transistor",      Category::Transistor},
    {RuleTarget::LibraryId,        RuleMatch::Contains, "mosfet",          Category::Transistor},
    {RuleTarget::Symbol,           RuleMatch::Token,    "R",               Category::Resistor},
    {RuleTarget::Symbol,           RuleMatch::Token,    "CP",              Category::Capacitor},
    {RuleTarget::Symbol,           RuleMatch::Token,    "C",               Category::Capacitor},
    {RuleTarget::Symbol,           RuleMatch::Token,    "L",               Category::Inductor},
    {RuleTarget::Symbol,           RuleMatch::Token,    "D",               Category::Diode},
    {RuleTarget::Symbol,           RuleMatch::Token,    "Q",               Category::Transistor},
    {RuleTarget::Symbol,           RuleMatch::Token,    "Y",               Category::Oscillator},
    {RuleTarget::Symbol,           RuleMatch::Token,    "SW",              Category::Switch},
    {RuleTarget::Symbol,           RuleMatch::Token,    "K",               Category::Relay},
    {RuleTarget::Symbol,           RuleMatch::Token,    "J",               Category::Connector},
    {RuleTarget::Symbol,           RuleMatch::Token,    "Conn",            Category::Connector},
    {RuleTarget::Symbol,           RuleMatch::Token,    "U",               Category::IntegratedCircuit},
    {RuleTarget::Symbol,           RuleMatch::Token,    "IC",              Category::IntegratedCircuit},
    // Footprint libraries
    {RuleTarget::FootprintLibrary, RuleMatch::Prefix,   "LED_",            Category::Led},
    {RuleTarget::FootprintLibrary, RuleMatch::Prefix,   "Resistor_",       Category::Resistor},
    {RuleTarget::FootprintLibrary, RuleMatch::Prefix,   "Capacitor_",      Category::Capacitor},
    {RuleTarget::FootprintLibrary, RuleMatch::Prefix,   "Inductor_",       Category::Inductor},
    {RuleTarget::FootprintLibrary, RuleMatch::Prefix,   "Diode_",          Category::Diode},
    {RuleTarget::FootprintLibrary, RuleMatch::Prefix,   "Crystal",         Category::Oscillator},
    {RuleTarget::FootprintLibrary, RuleMatch::Prefix,   "Oscillator",      Category::Oscillator},
    {RuleTarget::FootprintLibrary, RuleMatch::Prefix,   "Connector",       Category::Connector},
    {RuleTarget::FootprintLibrary, RuleMatch::Prefix,   "Button_Switch",   Category::Switch},
    {RuleTarget::FootprintLibrary, RuleMatch::Prefix,   "Relay_",          Category::Relay},
    // Part-type words in custom footprint names
    {RuleTarget::FootprintName,    RuleMatch::Word,     "LED",             Category::Led},
    {RuleTarget::FootprintName,    RuleMatch::Word,     "RES",             Category::Resistor},
    {RuleTarget::FootprintName,    RuleMatch::Word,     "CAP",             Category::Capacitor},
    {RuleTarget::FootprintName,    RuleMatch::Word,     "IND",             Category::Inductor},
    {RuleTarget::FootprintName,    RuleMatch::Word,     "DIODE",           Category::Diode},
    // IC package shapes: a strong signal regardless of library id
    {RuleTarget::Footprint,        RuleMatch::Contains, "soic",            Category::IntegratedCircuit},
    {RuleTarget::Footprint,        RuleMatch::Contains, "ssop",            Category::IntegratedCircuit},
    {RuleTarget::Footprint,        RuleMatch::Contains, "msop",            Category::IntegratedCircuit},
    {RuleTarget::Footprint,        RuleMatch::Contains, "qfn",             Category::IntegratedCircuit},
    {RuleTarget::Footprint,        RuleMatch::Contains, "dfn",             Category::IntegratedCircuit},
    {RuleTarget::Footprint,        RuleMatch::Contains, "qfp",             Category::IntegratedCircuit},
    {RuleTarget::Footprint,        RuleMatch::Contains, "bga",             Category::IntegratedCircuit},
    {RuleTarget::Footprint,        RuleMatch::Contains, "plcc",            Category::IntegratedCircuit},
    {RuleTarget::Footprint,        RuleMatch::Contains, "wlcsp",           Category::IntegratedCircuit},
    {RuleTarget::Footprint,        RuleMatch::Contains, "dip-",            Category::IntegratedCircuit},
};

struct ClassifierInput {
    std::string library_namespace;
    std::string symbol;
    std::string library_id;
    std::string footprint_library;
    std::string footprint_name;
    std::string footprint;
};

// Split "lib:name" into its two halves. No colon -> empty library.
static void split_lib(const std::string& id, std::string& lib, std::string& name) {
    auto colon = id.find(':');
    if (colon == std::string::npos) {
        lib.clear();
        name = id;
    } else {
        lib = id.substr(0, colon);
        name = id.substr(colon + 1);
    }
}

static const std::string& rule_subject(const ClassifierRule& rule, const ClassifierInput& in) {
    switch (rule.target) {
    case RuleTarget::LibraryNamespace: return in.library_namespace;
    case RuleTarget::Symbol:           return in.symbol;
    case RuleTarget::LibraryId:        return in.library_id;
    case RuleTarget::FootprintLibrary: return in.footprint_library;
    case RuleTarget::FootprintName:    return in.footprint_name;
    case RuleTarget::Footprint:        break;
    }
    return in.footprint;
}

static bool contains_word(const std::string& subject, const std::string& word) {
    std::string s = to_lower(subject);
    std::string w = to_lower(word);
    for (size_t pos = s.find(w); pos != std::string::npos; pos = s.find(w, pos + 1)) {
        size_t end = pos + w.size();
        bool left = pos == 0 || !std::isalnum((unsigned char)s[pos - 1]);
        bool right = end == s.size() || !std::isalnum((unsigned char)s[end]);
        if (left && right) return true;
    }
    return false;
}

static bool rule_matches(const ClassifierRule& rule, const ClassifierInput& in) {
    const std::string& subject = rule_subject(rule, in);
    if (subject.empty()) return false;
    std::string pattern = rule.pattern;

    switch (rule.match) {
    case RuleMatch::Prefix:
        return starts_with_icase(subject, pattern);
    case RuleMatch::Token:
        if (!starts_with_icase(subject, pattern)) return false;
        return subject.size() == pattern.size() ||
               !std::isalpha((unsigned char)subject[pattern.size()]);
    case RuleMatch::Contains:
        return icontains(subject, pattern);
    case RuleMatch::Word:
        return contains_word(subject, pattern);
    }
    return false;
}

static Category run_rules(const ClassifierInput& in) {
    for (auto& rule : rules) {
        if (rule_matches(rule, in)) return rule.category;
    }
    return Category::Unknown;
}

Category classify(const std::string& library_id, const std::string& footprint) {
    ClassifierInput in;
    in.library_id = trim(library_id);
    split_lib(in.library_id, in.library_namespace, in.symbol);
    in.footprint = trim(footprint);
    split_lib(in.footprint, in.footprint_library, in.footprint_name);
    return run_rules(in);
}

Category classify(const Component& component) {
    Category c = classify(component.library_id, component.footprint);
    if (c != Category::Unknown) return c;

    // Designator prefix re-checked as if it were a symbol name
    ClassifierInput in;
    in.symbol = reference_prefix(component.reference);
    return run_rules(in);
}

std::string reference_prefix(const std::string& reference) {
    std::string prefix;
    for (char c : trim(reference)) {
        if (!std::isalpha((unsigned char)c)) break;
        prefix += static_cast<char>(std::toupper((unsigned char)c));
    }
    return prefix;
}

const char* category_code(Category category) {
    switch (category) {
    case Category::Resistor:          return "RES";
    case Category::Capacitor:         return "CAP";
    case Category::Inductor:          return "IND";
    case Category::Diode:             return "DIO";
    case Category::Led:               return "LED";
    case Category::Transistor:        return "Q";
    case Category::IntegratedCircuit: return "IC";
    case Category::Microcontroller:   return "MCU";
    case Category::Connector:         return "CON";
    case Category::Switch:            return "SWI";
    case Category::Relay:             return "RLY";
    case Category::Regulator:         return "REG";
    case Category::Oscillator:        return "OSC";
    case Category::Analog:            return "ANA";
    case Category::Unknown:           break;
    }
    return "";
}

const char* category_name(Category category) {
    switch (category) {
    case Category::Resistor:          return "Resistor";
    case Category::Capacitor:         return "Capacitor";
    case Category::Inductor:          return "Inductor";
    case Category::Diode:             return "Diode";
    case Category::Led:               return "LED";
    case Category::Transistor:        return "Transistor";
    case Category::IntegratedCircuit: return "IC";
    case Category::Microcontroller:   return "Microcontroller";
    case Category::Connector:         return "Connector";
    case Category::Switch:            return "Switch";
    case Category::Relay:             return "Relay";
    case Category::Regulator:         return "Regulator";
    case Category::Oscillator:        return "Oscillator";
    case Category::Analog:            return "Analog";
    case Category::Unknown:           break;
    }
    return "Unknown";
}

} // namespace bommatch
