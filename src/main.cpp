#include "json_export.h"
#include "json_import.h"
#include "match_engine.h"
#include "netlist_reader.h"
#include "package_extractor.h"
#include "utils.h"

#include <iostream>
#include <fstream>
#include <string>
#include <vector>

static void print_help() {
    std::cout << "Usage: bommatch [options] <components> <inventory.json>\n"
              << "\n"
              << "Match schematic components against a parts inventory and write a BOM.\n"
              << "\n"
              << "Component input formats:\n"
              << "  .xml                KiCad XML netlist\n"
              << "  .json               Component list (reference, lib_id, value, footprint, properties)\n"
              << "\n"
              << "Options:\n"
              << "  -o, --output <file>       Output BOM JSON (default: <components>.bom.json, - for stdout)\n"
              << "  -c, --config <file>       Matcher configuration JSON (weights, thresholds)\n"
              << "  --verbose                 Show tied alternates and matching progress\n"
              << "  --debug                   Score traces and diagnostics for unmatched parts\n"
              << "  --smd-only                Keep only surface-mount BOM lines\n"
              << "  -h, --help                Show help\n";
}

static std::string replace_extension(const std::string& path, const std::string& new_ext) {
    auto dot = path.rfind('.');
    auto slash = path.find_last_of("/\\");
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        return path.substr(0, dot) + new_ext;
    }
    return path + new_ext;
}

enum class InputFormat { NETLIST, JSON, UNKNOWN };

static InputFormat detect_format(const std::string& path) {
    std::string lower_path = bommatch::to_lower(path);

    if (lower_path.size() >= 4 && lower_path.substr(lower_path.size() - 4) == ".xml")
        return InputFormat::NETLIST;
    if (lower_path.size() >= 4 && lower_path.substr(lower_path.size() - 4) == ".net")
        return InputFormat::NETLIST;
    if (lower_path.size() >= 5 && lower_path.substr(lower_path.size() - 5) == ".json")
        return InputFormat::JSON;

    return InputFormat::UNKNOWN;
}

static bool load_components(const std::string& path, bool verbose,
                            std::vector<bommatch::Component>& components) {
    InputFormat format = detect_format(path);

    if (format == InputFormat::NETLIST) {
        bommatch::ReaderOptions reader_opts;
        reader_opts.verbose = verbose;
        bommatch::NetlistReader reader(reader_opts);
        if (!reader.read(path, components)) {
            std::cerr << "Error: failed to parse " << path << "\n";
            for (auto& w : reader.warnings()) {
                std::cerr << "  " << w << "\n";
            }
            return false;
        }
        return true;
    }

    if (format == InputFormat::JSON) {
        std::ifstream json_file(path);
        if (!json_file.is_open()) {
            std::cerr << "Error: cannot open " << path << "\n";
            return false;
        }
        if (!bommatch::read_components(json_file, components)) {
            std::cerr << "Error: failed to parse components from " << path << "\n";
            return false;
        }
        return true;
    }

    std::cerr << "Error: cannot determine input format for '" << path << "'\n";
    std::cerr << "  Supported: .xml, .net (KiCad netlist), .json\n";
    return false;
}

// A BOM line is surface-mount when its chosen part (or, unmatched, its
// footprint) says so. Uncertain lines are dropped.
static bool is_smd_group(const bommatch::MatchGroup& group) {
    const bommatch::MatchResult* best = group.match.best();
    std::string smd = best ? best->item->smd : std::string();
    return bommatch::mount_type(smd, group.key.footprint) == bommatch::MountType::SMD;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> inputs;
    std::string output_file;
    std::string config_file;
    bool verbose = false;
    bool debug = false;
    bool smd_only = false;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -o requires an argument\n";
                return 1;
            }
            output_file = argv[++i];
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -c requires an argument\n";
                return 1;
            }
            config_file = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--debug") {
            debug = true;
        } else if (arg == "--smd-only") {
            smd_only = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            print_help();
            return 1;
        } else {
            inputs.push_back(arg);
        }
    }

    if (inputs.size() != 2) {
        std::cerr << "Error: expected a component file and an inventory file\n";
        print_help();
        return 1;
    }
    const std::string& component_file = inputs[0];
    const std::string& inventory_file = inputs[1];

    if (output_file.empty()) {
        output_file = replace_extension(component_file, ".bom.json");
    }

    // Configuration: file first, command-line flags on top
    bommatch::MatcherOptions opts;
    if (!config_file.empty()) {
        std::ifstream cfg(config_file);
        if (!cfg.is_open()) {
            std::cerr << "Error: cannot open " << config_file << "\n";
            return 1;
        }
        if (!bommatch::read_matcher_config(cfg, opts)) {
            std::cerr << "Error: invalid config " << config_file << "\n";
            return 1;
        }
    }
    if (verbose) opts.verbose = true;
    if (debug) opts.debug = true;

    std::vector<bommatch::Component> all_components;
    if (!load_components(component_file, opts.verbose, all_components)) {
        return 1;
    }

    std::vector<bommatch::Component> components;
    for (auto& c : all_components) {
        if (c.dnp || !c.in_bom) continue;
        components.push_back(c);
    }

    std::vector<bommatch::InventoryItem> inventory;
    {
        std::ifstream inv(inventory_file);
        if (!inv.is_open()) {
            std::cerr << "Error: cannot open " << inventory_file << "\n";
            return 1;
        }
        if (!bommatch::read_inventory(inv, inventory)) {
            std::cerr << "Error: failed to parse inventory from " << inventory_file << "\n";
            return 1;
        }
    }

    bommatch::MatchEngine engine(inventory, opts);
    bommatch::GroupedResults groups = engine.group_and_match(components);

    std::vector<const bommatch::MatchGroup*> ordered;
    for (auto g : bommatch::bom_order(groups)) {
        if (smd_only && !is_smd_group(*g)) continue;
        ordered.push_back(g);
    }

    // Console diagnostics
    size_t unmatched = 0;
    for (auto g : ordered) {
        const bommatch::ComponentMatch& m = g->match;
        if (m.diagnostic) {
            unmatched++;
            if (opts.debug) {
                std::cerr << bommatch::render_verbose(*m.diagnostic) << "\n";
            }
        }
        for (auto& w : m.warnings) {
            std::cerr << "[WARNING] " << g->key.str() << ": " << w << "\n";
        }
        if (opts.debug) {
            for (auto& c : m.candidates) {
                if (c.debug_trace) std::cerr << "  " << *c.debug_trace << "\n";
            }
        }
    }

    if (output_file == "-") {
        bommatch::write_json(std::cout, ordered);
        return 0;
    }

    std::ofstream out(output_file);
    if (!out.is_open()) {
        std::cerr << "Error: failed to write " << output_file << "\n";
        return 1;
    }
    bommatch::write_json(out, ordered);

    std::cout << "Matched " << component_file << " against " << inventory_file
              << " -> " << output_file << "\n";
    std::cout << "  Components: " << components.size()
              << " (" << (all_components.size() - components.size()) << " excluded)\n";
    std::cout << "  Inventory items: " << inventory.size() << "\n";
    std::cout << "  BOM lines: " << ordered.size() << "\n";
    std::cout << "  Unmatched lines: " << unmatched << "\n";

    return 0;
}
