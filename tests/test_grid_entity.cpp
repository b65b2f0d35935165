#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "grid_entity.hpp"

using Catch::Approx;

TEST_CASE("reactive demand sign follows the load kind", "[grid_entity]") {
    CHECK(deriveReactiveDemand(EntityKind::InductiveLoad, 100.0, 0.8) == Approx(75.0));
    CHECK(deriveReactiveDemand(EntityKind::CapacitiveLoad, 100.0, 0.8) == Approx(-75.0));
    CHECK(deriveReactiveDemand(EntityKind::ResistiveLoad, 100.0, 0.8) == 0.0);
    CHECK(deriveReactiveDemand(EntityKind::InductiveLoad, 100.0, 1.0) == Approx(0.0).margin(1e-12));
}

TEST_CASE("load derived figures", "[grid_entity]") {
    Load load(7, "Consumer_Bus_7", EntityKind::InductiveLoad, 3, 4, 100.0, 0.8);

    CHECK(load.id() == 7);
    CHECK(load.bus() == "Consumer_Bus_7");
    CHECK(load.label() == "CI");
    CHECK(load.gridX() == 3);
    CHECK(load.gridY() == 4);
    CHECK(load.reactiveDemand() == Approx(75.0));
    CHECK(load.apparentPower() == Approx(125.0));
    CHECK(load.actualPowerFactor() == Approx(0.8));
    CHECK_FALSE(load.isConnected());
    CHECK(load.status() == OperatingStatus::Inactive);
}

TEST_CASE("zero demand load reports unity power factor", "[grid_entity]") {
    Load load(1, "Consumer_Bus_1", EntityKind::ResistiveLoad, 0, 0, 0.0, 1.0);
    CHECK(load.apparentPower() == 0.0);
    CHECK(load.actualPowerFactor() == 1.0);
}

TEST_CASE("fresh source is nominal and empty", "[grid_entity]") {
    Source source(1, "PowerStation_Bus_1", 0, 0, 1000.0, 110.0);
    CHECK(source.label() == "PS");
    CHECK(source.voltagePerUnit() == 1.0);
    CHECK(source.loads().empty());
    CHECK(source.availableCapacity() == Approx(1000.0));
    CHECK_FALSE(source.isOverloaded());
}
