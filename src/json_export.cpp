#include "json_export.h"
#include "utils.h"

#include <cstdio>
#include <iostream>

namespace bommatch {

// Helper: escape a string for JSON (handle quotes, backslashes, control chars)
static std::string json_str(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", (unsigned char)c);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

static void write_strings(std::ostream& out, const std::vector<std::string>& items) {
    out << "[";
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out << ",";
        out << json_str(items[i]);
    }
    out << "]";
}

static void write_result(std::ostream& out, const MatchResult& r) {
    const InventoryItem& item = *r.item;
    out << "{\"ipn\":" << json_str(item.internal_part_number)
        << ",\"category\":" << json_str(item.category)
        << ",\"value\":" << json_str(item.value)
        << ",\"package\":" << json_str(item.package)
        << ",\"tolerance\":" << json_str(item.tolerance)
        << ",\"manufacturer\":" << json_str(item.manufacturer)
        << ",\"mfgpn\":" << json_str(item.manufacturer_part_number)
        << ",\"distributor_id\":" << json_str(item.distributor_id)
        << ",\"description\":" << json_str(item.description)
        << ",\"datasheet\":" << json_str(item.datasheet)
        << ",\"smd\":" << json_str(item.smd)
        << ",\"score\":" << r.score
        << ",\"priority\":" << r.priority;
    if (r.debug_trace) {
        out << ",\"debug\":" << json_str(*r.debug_trace);
    }
    out << "}";
}

static void write_group(std::ostream& out, const MatchGroup& group) {
    const ComponentMatch& m = group.match;
    auto refs = group.references();

    out << "{\"key\":" << json_str(group.key.str())
        << ",\"references\":";
    write_strings(out, refs);
    out << ",\"quantity\":" << refs.size()
        << ",\"value\":" << json_str(m.display_value)
        << ",\"footprint\":" << json_str(group.key.footprint)
        << ",\"matched\":" << (m.matched() ? "true" : "false");

    out << ",\"best\":";
    if (m.best()) {
        write_result(out, *m.best());
    } else {
        out << "null";
    }

    out << ",\"alternates\":[";
    for (size_t i = 0; i < m.alternates.size(); i++) {
        if (i > 0) out << ",";
        write_result(out, m.alternates[i]);
    }
    out << "]";

    out << ",\"notes\":";
    write_strings(out, m.notes);
    out << ",\"warnings\":";
    write_strings(out, m.warnings);

    out << ",\"diagnostic\":";
    if (m.diagnostic) {
        out << "{\"issue\":" << json_str(issue_code(m.diagnostic->issue))
            << ",\"message\":" << json_str(render_terse(*m.diagnostic)) << "}";
    } else {
        out << "null";
    }
    out << "}";
}

void write_json(std::ostream& out, const std::vector<const MatchGroup*>& groups) {
    size_t matched = 0;
    size_t components = 0;
    for (auto g : groups) {
        if (g->match.matched()) matched++;
        components += g->members.size();
    }

    out << "{\"summary\":{\"groups\":" << groups.size()
        << ",\"matched_groups\":" << matched
        << ",\"components\":" << components << "}";

    out << ",\"bom\":[";
    for (size_t i = 0; i < groups.size(); i++) {
        if (i > 0) out << ",";
        out << "\n";
        write_group(out, *groups[i]);
    }
    out << "\n]}\n";
}

void write_json(std::ostream& out, const GroupedResults& groups) {
    write_json(out, bom_order(groups));
}

} // namespace bommatch
