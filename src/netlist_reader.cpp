#include "netlist_reader.h"
#include "utils.h"

#include <pugixml.hpp>
#include <iostream>

namespace bommatch {

// KiCad bookkeeping, not design attributes
static const char* const ignored_properties[] = {
    "Sheetname", "Sheetfile", "ki_description", "ki_keywords", "ki_fp_filters",
    "exclude_from_board", "dnp", "exclude_from_bom",
};

// Fields already carried by dedicated Component members or irrelevant to matching
static const char* const ignored_fields[] = {
    "Reference", "Value", "Footprint", "Datasheet", "Description",
};

static bool in_list(const std::string& name, const char* const* list, size_t n) {
    for (size_t i = 0; i < n; i++) {
        if (iequals(name, list[i])) return true;
    }
    return false;
}

template <size_t N>
static bool in_list(const std::string& name, const char* const (&list)[N]) {
    return in_list(name, list, N);
}

// A KiCad flag property is set when present, unless its value says otherwise
static bool flag_value(const pugi::xml_node& prop) {
    std::string v = to_lower(trim(prop.attribute("value").as_string()));
    return v.empty() || v == "1" || v == "yes" || v == "true";
}

NetlistReader::NetlistReader(const ReaderOptions& opts)
    : opts_(opts) {}

bool NetlistReader::read(const std::string& filename, std::vector<Component>& components) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(filename.c_str());
    if (!result) {
        warn("Failed to parse XML: " + std::string(result.description()));
        return false;
    }
    log("Reading " + filename);
    return read_document(doc, components);
}

bool NetlistReader::read_string(const std::string& xml_text, std::vector<Component>& components) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml_text.c_str());
    if (!result) {
        warn("Failed to parse XML: " + std::string(result.description()));
        return false;
    }
    return read_document(doc, components);
}

bool NetlistReader::read_document(const pugi::xml_document& doc,
                                  std::vector<Component>& components) {
    auto root = doc.child("export");
    if (!root) {
        warn("Not a KiCad netlist: missing <export> root element");
        return false;
    }
    log("Netlist version: " + std::string(root.attribute("version").as_string("unknown")));

    auto comps = root.child("components");
    if (!comps) {
        warn("No <components> section found");
        return false;
    }

    size_t count = 0;
    for (auto comp : comps.children("comp")) {
        Component c = read_comp(comp);
        if (c.reference.empty()) {
            warn("Skipping <comp> without ref attribute");
            continue;
        }
        components.push_back(std::move(c));
        count++;
    }

    log("Parsed " + std::to_string(count) + " components");
    return true;
}

Component NetlistReader::read_comp(const pugi::xml_node& comp) {
    Component c;
    c.reference = trim(comp.attribute("ref").as_string());
    c.value = trim(comp.child_value("value"));
    c.footprint = trim(comp.child_value("footprint"));

    auto lib = comp.child("libsource");
    if (lib) {
        std::string lib_name = trim(lib.attribute("lib").as_string());
        std::string part = trim(lib.attribute("part").as_string());
        c.library_id = lib_name.empty() ? part : lib_name + ":" + part;
    }

    for (auto field : comp.child("fields").children("field")) {
        std::string name = trim(field.attribute("name").as_string());
        if (name.empty() || in_list(name, ignored_fields)) continue;
        c.properties[name] = trim(field.child_value());
    }

    for (auto prop : comp.children("property")) {
        std::string name = trim(prop.attribute("name").as_string());
        if (iequals(name, "dnp")) {
            c.dnp = flag_value(prop);
        } else if (iequals(name, "exclude_from_bom")) {
            c.in_bom = !flag_value(prop);
        }
        if (name.empty() || in_list(name, ignored_properties) || in_list(name, ignored_fields))
            continue;
        // <fields> take precedence over same-named properties
        if (c.properties.count(name)) continue;
        c.properties[name] = trim(prop.attribute("value").as_string());
    }

    if (c.dnp) log(c.reference + " is marked DNP");
    return c;
}

// --- Logging ---

void NetlistReader::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cout << "[Netlist] " << msg << std::endl;
    }
}

void NetlistReader::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace bommatch
