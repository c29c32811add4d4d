#include <doctest/doctest.h>
#include "ventilink/products.hpp"
#include "ventilink/property.hpp"

#include <string>

using namespace ventilink;

TEST_CASE("Products are found by raw identity") {
    const ProductInfo* p = find_product(0x0001C892);
    REQUIRE(p != nullptr);
    CHECK(p->id == ProductId::VMD_02RPS78);
    CHECK(p->family == DeviceFamily::VentilationController);
    CHECK(find_product(0x0001C849)->family == DeviceFamily::Gateway);
    CHECK(find_product(0x00012345) == nullptr);
    CHECK(products_end() - products_begin() == 4);
}

TEST_CASE("Products are found by model code in any case, with '_' for '-'") {
    CHECK(find_product_by_name("VMD-02RPS78")->id == ProductId::VMD_02RPS78);
    CHECK(find_product_by_name("vmn_05lm02")->id == ProductId::VMN_05LM02);
    CHECK(find_product_by_name("brdg-02r13")->id == ProductId::BRDG_02R13);
    CHECK(find_product_by_name("VMD-07RPS13") == nullptr);
}

TEST_CASE("Property names map both ways") {
    CHECK(property_name(Property::RfAddress) == "rf_address");
    CHECK(property_name(node_slot_property(6)) == "node_address_7");

    Property p;
    REQUIRE(property_from_name("Temperature_Indoor", p));
    CHECK(p == Property::TemperatureIndoor);
    REQUIRE(property_from_name("node_address_32", p));
    CHECK(p == Property::NodeAddress32);
    CHECK_FALSE(property_from_name("no_such_property", p));
}
