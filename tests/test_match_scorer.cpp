#include <catch2/catch.hpp>

#include "match_scorer.h"
#include "test_helpers.h"

using namespace bommatch;
using bommatch::testing::make_component;
using bommatch::testing::make_item;
using bommatch::testing::r0603;
using bommatch::testing::c0603;

TEST_CASE("Primary filters", "[scorer]") {
    MatchScorer scorer;
    auto r1 = make_component("R1", "Device:R", "10K", r0603());

    SECTION("category, package and value must agree") {
        REQUIRE(scorer.passes_primary_filters(r1, make_item("R-1", "RES", "10K", "0603")));
        REQUIRE_FALSE(scorer.passes_primary_filters(r1, make_item("C-1", "CAP", "10K", "0603")));
        REQUIRE_FALSE(scorer.passes_primary_filters(r1, make_item("R-2", "RES", "10K", "0805")));
        REQUIRE_FALSE(scorer.passes_primary_filters(r1, make_item("R-3", "RES", "22K", "0603")));
    }

    SECTION("values compare numerically") {
        REQUIRE(scorer.passes_primary_filters(r1, make_item("R-1", "RES", "10000", "0603")));
        REQUIRE(scorer.passes_primary_filters(r1, make_item("R-1", "res", "10k0", "0603")));
    }

    SECTION("parse failure excludes instead of throwing") {
        auto bad = make_component("R2", "Device:R", "ten kilo", r0603());
        REQUIRE_FALSE(scorer.passes_primary_filters(bad, make_item("R-1", "RES", "10K", "0603")));
        REQUIRE_FALSE(scorer.passes_primary_filters(r1, make_item("R-1", "RES", "", "0603")));
    }

    SECTION("unrecognized footprint does not filter") {
        auto odd = make_component("R3", "Device:R", "10K", "Custom:MyFootprint");
        REQUIRE(scorer.passes_primary_filters(odd, make_item("R-1", "RES", "10K", "0805")));
    }

    SECTION("non-numeric categories compare normalized strings") {
        auto u1 = make_component("U1", "Amplifier_Operational:LM358", "LM358",
                                 "Package_SO:SOIC-8_3.9x4.9mm_P1.27mm");
        REQUIRE(scorer.passes_primary_filters(u1, make_item("U-1", "ANA", "lm358", "SOIC-8")));
        REQUIRE_FALSE(scorer.passes_primary_filters(u1, make_item("U-2", "ANA", "LM324", "SOIC-8")));
    }

    SECTION("dashless inventory package") {
        auto q1 = make_component("Q1", "Device:Q_NPN_BEC", "MMBT3904", "Package_TO_SOT_SMD:SOT-23");
        REQUIRE(scorer.passes_primary_filters(q1, make_item("Q-1", "Q", "MMBT3904", "SOT23")));
    }
}

TEST_CASE("Base score", "[scorer]") {
    MatchScorer scorer;
    auto r1 = make_component("R1", "Device:R", "10K", r0603());
    REQUIRE(scorer.score(r1, make_item("R-1", "RES", "10K", "0603", "5%")) == 120);
}

TEST_CASE("Tolerance substitution", "[scorer]") {
    MatchScorer scorer;
    auto r1 = make_component("R1", "Device:R", "10K", r0603(), {{"Tolerance", "5%"}});

    int exact = scorer.score(r1, make_item("R-5", "RES", "10K", "0603", "5%"));
    int tighter = scorer.score(r1, make_item("R-1", "RES", "10K", "0603", "1%"));
    int looser = scorer.score(r1, make_item("R-10", "RES", "10K", "0603", "10%"));
    int base = scorer.score(r1, make_item("R-0", "RES", "10K", "0603"));

    REQUIRE(exact == base + 15);
    REQUIRE(tighter == base + 12);
    REQUIRE(looser == base);
    REQUIRE(tighter > base);
    REQUIRE(tighter < exact);

    SECTION("malformed tolerance contributes nothing") {
        auto odd = make_component("R2", "Device:R", "10K", r0603(), {{"Tolerance", "tight"}});
        REQUIRE(scorer.score(odd, make_item("R-1", "RES", "10K", "0603", "1%")) == base);
        REQUIRE(scorer.score(r1, make_item("R-x", "RES", "10K", "0603", "n/a")) == base);
    }
}

TEST_CASE("Precision notation implies 1%", "[scorer]") {
    MatchScorer scorer;
    auto r1 = make_component("R1", "Device:R", "10K0", r0603());

    ComponentProfile p = scorer.profile(r1);
    REQUIRE(p.precision_implied);
    REQUIRE(p.required_tolerance);
    REQUIRE(*p.required_tolerance == 1.0);

    int one = scorer.score(r1, make_item("R-1", "RES", "10K", "0603", "1%"));
    int five = scorer.score(r1, make_item("R-5", "RES", "10K", "0603", "5%"));
    REQUIRE(one > five);

    auto plain = make_component("R2", "Device:R", "10K", r0603());
    REQUIRE_FALSE(scorer.profile(plain).precision_implied);

    auto tol = make_component("R3", "Device:R", "10K", r0603(), {{"Tolerance", "0.5%"}});
    REQUIRE(scorer.profile(tol).precision_implied);
}

TEST_CASE("Property bonuses follow category relevance", "[scorer]") {
    MatchScorer scorer;

    SECTION("capacitor voltage") {
        auto c1 = make_component("C1", "Device:C", "100nF", c0603(), {{"Voltage", "50V"}});
        auto item = make_item("C-1", "CAP", "100nF", "0603");
        int without = scorer.score(c1, item);
        item.voltage = "50V";
        REQUIRE(scorer.score(c1, item) == without + 10);
    }

    SECTION("resistor ignores current") {
        auto r1 = make_component("R1", "Device:R", "10K", r0603(), {{"A", "1A"}});
        auto item = make_item("R-1", "RES", "10K", "0603");
        int without = scorer.score(r1, item);
        item.amperage = "1A";
        REQUIRE(scorer.score(r1, item) == without);
    }

    SECTION("resistor power") {
        auto r1 = make_component("R1", "Device:R", "10K", r0603(), {{"Power", "0.1W"}});
        auto item = make_item("R-1", "RES", "10K", "0603");
        int without = scorer.score(r1, item);
        item.wattage = "0.1W";
        REQUIRE(scorer.score(r1, item) == without + 10);
    }
}

TEST_CASE("Category-specific bonuses", "[scorer]") {
    MatchScorer scorer;

    SECTION("LED wavelength and angle") {
        auto d1 = make_component("D1", "Device:LED", "Red", "LED_SMD:LED_0603_1608Metric",
                                 {{"Wavelength", "620nm"}, {"Angle", "120"}});
        auto item = make_item("LED-1", "LED", "RED", "0603");
        int without = scorer.score(d1, item);
        item.attributes["Wavelength"] = "620nm";
        item.attributes["Angle"] = "120 deg";
        REQUIRE(scorer.score(d1, item) == without + 8 + 5);
    }

    SECTION("oscillator frequency") {
        auto y1 = make_component("Y1", "Device:Crystal", "16MHz", "Crystal:Crystal_SMD_3225-4Pin_3.2x2.5mm",
                                 {{"Frequency", "16MHz"}});
        auto item = make_item("Y-1", "OSC", "16MHz", "");
        int without = scorer.score(y1, item);
        item.attributes["Frequency"] = "16MHz";
        REQUIRE(scorer.score(y1, item) == without + 12);
    }

    SECTION("connector pitch") {
        auto j1 = make_component("J1", "Connector_Generic:Conn_01x04", "Conn_01x04",
                                 "Connector_PinHeader_2.54mm:PinHeader_1x04_P2.54mm_Vertical",
                                 {{"Pitch", "2.54mm"}});
        auto item = make_item("J-1", "CON", "Conn_01x04", "PinHeader");
        int without = scorer.score(j1, item);
        item.attributes["Pitch"] = "2.54mm";
        REQUIRE(scorer.score(j1, item) == without + 10);
    }

    SECTION("attributes of another category are ignored") {
        auto r1 = make_component("R1", "Device:R", "10K", r0603(), {{"Wavelength", "620nm"}});
        auto item = make_item("R-1", "RES", "10K", "0603");
        int without = scorer.score(r1, item);
        item.attributes["Wavelength"] = "620nm";
        // Not a resistor attribute, so it only counts as a generic property
        REQUIRE(scorer.score(r1, item) == without + 3);
    }
}

TEST_CASE("Generic property and keyword bonuses", "[scorer]") {
    MatchScorer scorer;
    auto r1 = make_component("R1", "Device:R", "10K", r0603(), {{"Manufacturer", "Yageo"}});
    auto item = make_item("R-1", "RES", "10K", "0603");
    int base = scorer.score(r1, item);

    item.manufacturer = "YAGEO";
    REQUIRE(scorer.score(r1, item) == base + 3);

    item.keywords = "pullup 10K general";
    REQUIRE(scorer.score(r1, item) == base + 3 + 10);
}

TEST_CASE("Custom weights and debug trace", "[scorer]") {
    ScorerOptions opts;
    opts.weights.type = 5;
    opts.weights.value = 4;
    opts.weights.package = 3;
    MatchScorer scorer(opts);

    auto r1 = make_component("R1", "Device:R", "10K", r0603());
    auto item = make_item("R-1", "RES", "10K", "0603");
    std::string trace;
    REQUIRE(scorer.score(r1, scorer.profile(r1), item, &trace) == 12);
    REQUIRE(trace.find("Type match: +5") != std::string::npos);
    REQUIRE(trace.find("Value match: +4") != std::string::npos);
    REQUIRE(trace.find("Footprint match: +3") != std::string::npos);
}
