#pragma once

#include "part_model.h"
#include <string>
#include <vector>

// Forward declare pugixml types
namespace pugi {
class xml_node;
class xml_document;
}

namespace bommatch {

struct ReaderOptions {
    bool verbose = false;
};

// Reads the <components> section of a KiCad XML netlist
// (File > Export > Netlist, KiCad XML format).
class NetlistReader {
public:
    explicit NetlistReader(const ReaderOptions& opts = {});

    // Parse a netlist file, appending to components. Returns true on success.
    bool read(const std::string& filename, std::vector<Component>& components);

    // Parse netlist XML held in memory.
    bool read_string(const std::string& xml_text, std::vector<Component>& components);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    ReaderOptions opts_;
    std::vector<std::string> warnings_;

    bool read_document(const pugi::xml_document& doc, std::vector<Component>& components);
    Component read_comp(const pugi::xml_node& comp);

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

} // namespace bommatch
