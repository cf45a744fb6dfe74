#include <catch2/catch.hpp>

#include "package_extractor.h"

using namespace bommatch;

TEST_CASE("Chip package codes", "[package]") {
    REQUIRE(extract_package("R_0603_1608Metric") == "0603");
    REQUIRE(extract_package("Resistor_SMD:R_0603_1608Metric") == "0603");
    REQUIRE(extract_package("Capacitor_SMD:C_0805_2012Metric") == "0805");
    REQUIRE(extract_package("PCM_SPCoast:0402-RES") == "0402");
    REQUIRE(extract_package("Capacitor_SMD:C_1608Metric") == "0603");
}

TEST_CASE("Named package families", "[package]") {
    REQUIRE(extract_package("Package_SO:SOIC-8_3.9x4.9mm_P1.27mm") == "SOIC-8");
    REQUIRE(extract_package("Package_TO_SOT_SMD:SOT-23") == "SOT-23");
    REQUIRE(extract_package("Package_TO_SOT_SMD:SOT-23-5") == "SOT-23-5");
    REQUIRE(extract_package("Package_DFN_QFN:QFN-32-1EP_5x5mm_P0.5mm_EP3.45x3.45mm") == "QFN-32");
    REQUIRE(extract_package("Package_SO:TSSOP-20_4.4x6.5mm_P0.65mm") == "TSSOP-20");
    REQUIRE(extract_package("Package_DIP:DIP-8_W7.62mm") == "DIP-8");
    REQUIRE(extract_package("Package_TO_SOT_THT:TO-220-3_Vertical") == "TO-220-3");
}

TEST_CASE("Unrecognized footprints", "[package]") {
    SECTION("best-effort cleanup") {
        REQUIRE(extract_package("Connector_PinHeader_2.54mm:PinHeader_1x04_P2.54mm_Vertical") ==
                "PinHeader_1x04");
        REQUIRE(extract_package("Custom:Widget_3x3mm") == "Widget");
    }

    SECTION("only recognized tokens filter") {
        REQUIRE(recognized_package("Connector_PinHeader_2.54mm:PinHeader_1x04_P2.54mm_Vertical")
                    .empty());
        REQUIRE(recognized_package("Resistor_SMD:R_0603_1608Metric") == "0603");
    }

    SECTION("empty footprint") {
        REQUIRE(extract_package("").empty());
        REQUIRE(recognized_package("").empty());
    }
}

TEST_CASE("Package comparison", "[package]") {
    REQUIRE(package_matches("0603", "0603"));
    REQUIRE(package_matches("0603", "0603 (1608 metric)"));
    REQUIRE(package_matches("SOT-23", "sot-23"));
    REQUIRE(package_matches("SOT-23", "SOT23"));
    REQUIRE_FALSE(package_matches("0603", "0805"));
    REQUIRE_FALSE(package_matches("0603", ""));
    REQUIRE(package_matches("", "anything"));
}

TEST_CASE("Mount type", "[package]") {
    REQUIRE(mount_type("SMD", "") == MountType::SMD);
    REQUIRE(mount_type("yes", "") == MountType::SMD);
    REQUIRE(mount_type("PTH", "Resistor_SMD:R_0603_1608Metric") == MountType::THT);
    REQUIRE(mount_type("", "Resistor_SMD:R_0603_1608Metric") == MountType::SMD);
    REQUIRE(mount_type("", "Package_TO_SOT_SMD:SOT-23") == MountType::SMD);
    REQUIRE(mount_type("", "Package_DIP:DIP-8_W7.62mm") == MountType::THT);
    REQUIRE(mount_type("", "Resistor_THT:R_Axial_DIN0207_L6.3mm_D2.5mm_P10.16mm_Horizontal") ==
            MountType::THT);
    REQUIRE(mount_type("Q16", "Resistor_SMD:R_0603_1608Metric") == MountType::Unknown);
    REQUIRE(mount_type("", "Custom:Widget") == MountType::Unknown);
}
