#include <catch2/catch.hpp>

#include "json_import.h"

using namespace bommatch;

TEST_CASE("Inventory rows", "[json][inventory]") {
    const char* text = R"([
        {"IPN": "R-10K", "Category": "RES", "Value": "10K", "Package": "0603",
         "Tolerance": "1%", "V": "50V", "W": "0.1W", "Manufacturer": "Yageo",
         "MFGPN": "RC0603FR-0710KL", "LCSC": "C98220", "Priority": 1, "SMD": "SMD"},
        {"IPN": "LED-RED", "Category": "LED", "Value": "Red", "Package": "0603",
         "Priority": "2", "Wavelength": "620nm", "mcd": 150},
        {"IPN": "C-100N", "Category": "CAP", "Value": "100nF", "Priority": "soon"},
        {"IPN": "C-1U", "Category": "CAP", "Value": "1uF"}
    ])";

    std::vector<InventoryItem> items;
    REQUIRE(read_inventory(std::string(text), items));
    REQUIRE(items.size() == 4);

    SECTION("standard columns") {
        auto& r = items[0];
        REQUIRE(r.internal_part_number == "R-10K");
        REQUIRE(r.category == "RES");
        REQUIRE(r.tolerance == "1%");
        REQUIRE(r.voltage == "50V");
        REQUIRE(r.wattage == "0.1W");
        REQUIRE(r.manufacturer_part_number == "RC0603FR-0710KL");
        REQUIRE(r.distributor_id == "C98220");
        REQUIRE(r.smd == "SMD");
        REQUIRE(r.priority == 1);
        REQUIRE(r.attributes.empty());
    }

    SECTION("other columns become attributes") {
        auto& led = items[1];
        REQUIRE(led.priority == 2);
        REQUIRE(led.attributes.at("Wavelength") == "620nm");
        REQUIRE(led.attributes.at("mcd") == "150");
    }

    SECTION("priority defaults to 99") {
        REQUIRE(items[2].priority == DEFAULT_PRIORITY);
        REQUIRE(items[3].priority == 99);
    }
}

TEST_CASE("Out-of-range priorities fall back to 99", "[json][inventory]") {
    const char* text = R"([
        {"IPN": "A", "Priority": 1e20},
        {"IPN": "B", "Priority": 5000000000},
        {"IPN": "C", "Priority": -5000000000},
        {"IPN": "D", "Priority": 18446744073709551615},
        {"IPN": "E", "Priority": "5000000000"},
        {"IPN": "F", "Priority": 3.0},
        {"IPN": "G", "Priority": 1000000}
    ])";

    std::vector<InventoryItem> items;
    REQUIRE(read_inventory(std::string(text), items));
    REQUIRE(items.size() == 7);
    REQUIRE(items[0].priority == DEFAULT_PRIORITY);
    REQUIRE(items[1].priority == DEFAULT_PRIORITY);
    REQUIRE(items[2].priority == DEFAULT_PRIORITY);
    REQUIRE(items[3].priority == DEFAULT_PRIORITY);
    REQUIRE(items[4].priority == DEFAULT_PRIORITY);
    REQUIRE(items[5].priority == 3);
    REQUIRE(items[6].priority == 1000000);
}

TEST_CASE("Inventory wrapped in an object", "[json][inventory]") {
    std::vector<InventoryItem> items;
    REQUIRE(read_inventory(std::string(R"({"items": [{"IPN": "R-1", "Category": "RES"}]})"), items));
    REQUIRE(items.size() == 1);
}

TEST_CASE("Malformed inventory", "[json][inventory]") {
    std::vector<InventoryItem> items;
    REQUIRE_FALSE(read_inventory(std::string("[{\"IPN\": "), items));
    REQUIRE_FALSE(read_inventory(std::string("42"), items));
    REQUIRE(items.empty());
}

TEST_CASE("Components", "[json][components]") {
    const char* text = R"({"components": [
        {"reference": "R1", "lib_id": "Device:R", "value": "10K",
         "footprint": "Resistor_SMD:R_0603_1608Metric", "properties": {"Tolerance": "1%"}},
        {"reference": "R2", "library_id": "Device:R", "value": 470, "dnp": true},
        {"reference": "TP1", "lib_id": "Connector:TestPoint", "in_bom": false}
    ]})";

    std::vector<Component> components;
    REQUIRE(read_components(std::string(text), components));
    REQUIRE(components.size() == 3);

    REQUIRE(components[0].library_id == "Device:R");
    REQUIRE(components[0].properties.at("Tolerance") == "1%");
    REQUIRE(components[0].in_bom);
    REQUIRE_FALSE(components[0].dnp);

    REQUIRE(components[1].library_id == "Device:R");
    REQUIRE(components[1].value == "470");
    REQUIRE(components[1].dnp);

    REQUIRE_FALSE(components[2].in_bom);
}

TEST_CASE("Matcher configuration", "[json][config]") {
    MatcherOptions opts;
    const char* text = R"({
        "verbose": true,
        "max_alternates": 3,
        "precision_threshold": 0.5,
        "legacy_bare_capacitance": true,
        "weights": {"type": 60, "keyword": 0},
        "unknown_key": "ignored"
    })";

    REQUIRE(read_matcher_config(std::string(text), opts));
    REQUIRE(opts.verbose);
    REQUIRE_FALSE(opts.debug);
    REQUIRE(opts.max_alternates == 3);
    REQUIRE(opts.precision_threshold == 0.5);
    REQUIRE(opts.capacitance_mode == CapacitanceMode::LegacyMicrofarads);
    REQUIRE(opts.weights.type == 60);
    REQUIRE(opts.weights.keyword == 0);
    REQUIRE(opts.weights.value == 40);

    SECTION("wrong types are rejected") {
        MatcherOptions other;
        REQUIRE_FALSE(read_matcher_config(std::string(R"({"max_alternates": "many"})"), other));
        REQUIRE_FALSE(read_matcher_config(std::string("[]"), other));
    }
}
