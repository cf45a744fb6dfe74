#include "package_extractor.h"
#include "utils.h"

#include <cctype>
#include <regex>

namespace bommatch {

// Imperial chip code -> metric code, e.g. 0603 <-> 1608
struct ChipSize {
    const char* imperial;
    const char* metric;
};

static const ChipSize chip_sizes[] = {
    {"0201", "0603"},
    {"0402", "1005"},
    {"0603", "1608"},
    {"0805", "2012"},
    {"1008", "2520"},
    {"1206", "3216"},
    {"1210", "3225"},
    {"1812", "4532"},
    {"2010", "5025"},
    {"2512", "6332"},
};

static const char* imperial_for_metric(const std::string& metric) {
    for (auto& c : chip_sizes) {
        if (metric == c.metric) return c.imperial;
    }
    return nullptr;
}

// Families that make a package surface-mount
static const char* const smd_families[] = {
    "SOT", "TSOT", "SOD", "SC", "SOIC", "SSOP", "TSSOP", "HTSSOP", "MSOP",
    "QFN", "VQFN", "WQFN", "DFN", "QFP", "LQFP", "TQFP", "BGA", "PLCC", "WLCSP",
};

// --- recognized tokens, most specific first ---

static std::string try_chip_pair(const std::string& fp) {
    // R_0603_1608Metric -> 0603
    static const std::regex re_pair(R"((?:^|[^0-9])(\d{4})_(\d{4})Metric)", std::regex::icase);
    std::smatch m;
    if (std::regex_search(fp, m, re_pair)) return m[1].str();
    return {};
}

static std::string try_family(const std::string& fp) {
    // SOIC-8, SOT-23-5, QFN-32 (from QFN-32-1EP_5x5mm), TO-220-3
    static const std::regex re_family(
        R"((?:^|[^A-Za-z])(HTSSOP|TSSOP|SSOP|MSOP|SOIC|TSOT|SOT|SOD|VQFN|WQFN|QFN|DFN|LQFP|TQFP|QFP|BGA|PLCC|WLCSP|DIP|SIP|TO|SC)-(\d+)(?:-(\d+)(?![0-9A-Za-z]))?(?![0-9]))",
        std::regex::icase);
    std::smatch m;
    if (!std::regex_search(fp, m, re_family)) return {};
    std::string token = to_upper(m[1].str()) + "-" + m[2].str();
    if (m[3].matched) token += "-" + m[3].str();
    return token;
}

static std::string try_bare_imperial(const std::string& fp) {
    // PCM_SPCoast:0603-RES, C_0805
    static const std::regex re_imperial(
        R"((?:^|[^0-9])(0201|0402|0603|0805|1008|1206|1210|1812|2010|2512)(?![0-9]))");
    std::smatch m;
    if (std::regex_search(fp, m, re_imperial)) return m[1].str();
    return {};
}

static std::string try_metric_only(const std::string& fp) {
    // C_1608Metric -> 0603
    static const std::regex re_metric(R"((?:^|[^0-9])(\d{4})Metric)", std::regex::icase);
    std::smatch m;
    if (!std::regex_search(fp, m, re_metric)) return {};
    auto imperial = imperial_for_metric(m[1].str());
    return imperial ? imperial : std::string();
}

std::string recognized_package(const std::string& footprint) {
    std::string fp = trim(footprint);
    if (fp.empty()) return {};

    std::string token = try_chip_pair(fp);
    if (token.empty()) token = try_family(fp);
    if (token.empty()) token = try_bare_imperial(fp);
    if (token.empty()) token = try_metric_only(fp);
    return token;
}

std::string extract_package(const std::string& footprint) {
    std::string token = recognized_package(footprint);
    if (!token.empty()) return token;

    // Best effort: footprint name without library and size annotations
    std::string name = trim(footprint);
    auto colon = name.rfind(':');
    if (colon != std::string::npos) name = name.substr(colon + 1);

    static const std::regex re_dims(R"(_\d+(?:\.\d+)?x\d+(?:\.\d+)?(?:x\d+(?:\.\d+)?)?mm.*$)");
    static const std::regex re_pitch(R"(_P\d+(?:\.\d+)?mm.*$)");
    name = std::regex_replace(name, re_dims, "");
    name = std::regex_replace(name, re_pitch, "");

    while (!name.empty() && (name.back() == '_' || name.back() == '-')) name.pop_back();
    return name;
}

bool package_matches(const std::string& token, const std::string& inventory_package) {
    if (token.empty()) return true;
    if (inventory_package.empty()) return false;
    if (icontains(inventory_package, token)) return true;
    // Inventories often drop the dash: SOT23, SOD123
    if (token.find('-') != std::string::npos) {
        return icontains(inventory_package, replace_all(token, "-", ""));
    }
    return false;
}

MountType mount_type(const std::string& smd_field, const std::string& footprint) {
    static const char* const smd_values[] = {"SMD", "Y", "YES", "TRUE", "1"};
    static const char* const tht_values[] = {"PTH", "THT", "TH", "THROUGH-HOLE", "N", "NO", "FALSE", "0"};

    std::string field = to_upper(trim(smd_field));
    for (auto v : smd_values) {
        if (field == v) return MountType::SMD;
    }
    for (auto v : tht_values) {
        if (field == v) return MountType::THT;
    }
    if (!field.empty() && field != "UNKNOWN" && field != "N/A") return MountType::Unknown;

    std::string token = recognized_package(footprint);
    if (!token.empty()) {
        if (std::isdigit((unsigned char)token[0])) return MountType::SMD;
        std::string family = token.substr(0, token.find('-'));
        for (auto f : smd_families) {
            if (family == f) return MountType::SMD;
        }
    }

    static const char* const tht_hints[] = {
        "dip", "through-hole", "_tht", "axial", "radial", "to-220", "to-92", "to-39", "pinheader",
    };
    std::string lower = to_lower(footprint);
    for (auto hint : tht_hints) {
        if (lower.find(hint) != std::string::npos) return MountType::THT;
    }
    return MountType::Unknown;
}

} // namespace bommatch
