#include <catch2/catch.hpp>

#include "json_export.h"
#include "test_helpers.h"

#include <nlohmann/json.hpp>
#include <sstream>

using namespace bommatch;
using bommatch::testing::make_component;
using bommatch::testing::make_item;
using bommatch::testing::r0603;
using json = nlohmann::json;

TEST_CASE("BOM export", "[json][export]") {
    std::vector<InventoryItem> inventory = {
        make_item("R-10K", "RES", "10K", "0603", "1%"),
    };
    inventory[0].manufacturer = "Yageo \"Chip\"";
    MatchEngine engine(inventory);

    std::vector<Component> components = {
        make_component("R2", "Device:R", "10K", r0603()),
        make_component("R1", "Device:R", "10K", r0603()),
        make_component("X1", "Foo:Bar123", "", ""),
    };
    auto groups = engine.group_and_match(components);

    std::ostringstream out;
    write_json(out, groups);
    json j = json::parse(out.str());

    REQUIRE(j["summary"]["groups"] == 2);
    REQUIRE(j["summary"]["matched_groups"] == 1);
    REQUIRE(j["summary"]["components"] == 3);

    auto& bom = j["bom"];
    REQUIRE(bom.size() == 2);

    auto& r = bom[0];
    REQUIRE(r["references"] == json::array({"R1", "R2"}));
    REQUIRE(r["quantity"] == 2);
    REQUIRE(r["value"] == "10K");
    REQUIRE(r["matched"] == true);
    REQUIRE(r["best"]["ipn"] == "R-10K");
    REQUIRE(r["best"]["manufacturer"] == "Yageo \"Chip\"");
    REQUIRE(r["best"]["score"] == 120);
    REQUIRE(r["best"]["priority"] == 99);
    REQUIRE(r["diagnostic"].is_null());

    auto& x = bom[1];
    REQUIRE(x["matched"] == false);
    REQUIRE(x["best"].is_null());
    REQUIRE(x["diagnostic"]["issue"] == "type_unknown");
    REQUIRE(x["key"] == "NO_MATCH__");
}
