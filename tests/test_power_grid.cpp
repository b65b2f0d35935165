#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "event_log.hpp"
#include "power_grid.hpp"

#include <algorithm>
#include <cmath>
#include <string>

using Catch::Approx;

namespace {

bool logged(const EventLog& log, const std::string& message) {
    const auto entries = log.recent();
    return std::any_of(entries.begin(), entries.end(),
                       [&message](const LogEntry& e) { return e.message == message; });
}

std::size_t count_logged(const EventLog& log, const std::string& message) {
    const auto entries = log.recent();
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(),
                                                  [&message](const LogEntry& e) { return e.message == message; }));
}

} // namespace

TEST_CASE("inductive load scenario drives the source critical", "[power_grid]") {
    EventLog log(32, false);
    PowerGrid grid(&log);

    EntityId source = kInvalidEntityId;
    EntityId load = kInvalidEntityId;
    REQUIRE(grid.addSource(0, 0, 1000.0, 110.0, source).success);
    REQUIRE(grid.addLoad(EntityKind::InductiveLoad, 1, 0, 100.0, 0.8, load).success);
    REQUIRE(grid.connect(load, source).success);

    const Source* src = grid.findSource(source);
    REQUIRE(src);
    CHECK(grid.findLoad(load)->reactiveDemand() == Approx(75.0));
    CHECK(src->totalActiveDemand() == Approx(100.0));
    CHECK(src->totalReactiveDemand() == Approx(75.0));
    CHECK(src->loadingPercent() == Approx(0.1));
    CHECK(src->voltagePerUnit() == Approx(-0.51));
    CHECK(src->status() == OperatingStatus::Critical);
    CHECK(grid.findLoad(load)->status() == OperatingStatus::Critical);
    CHECK(*grid.voltageAt(load) == Approx(-0.51));

    CHECK(logged(log, "Connected CI (P=100.0MW, Q=75.0MVAr)"));
    CHECK(count_logged(log, "Warning: Low voltage at power station: -0.51 pu") == 1);

    SECTION("staying critical does not repeat the warning") {
        grid.recompute();
        grid.recompute();
        CHECK(count_logged(log, "Warning: Low voltage at power station: -0.51 pu") == 1);
    }
}

TEST_CASE("status thresholds", "[power_grid]") {
    PowerGrid grid;
    EntityId source = kInvalidEntityId;
    EntityId load = kInvalidEntityId;
    REQUIRE(grid.addSource(0, 0, 1000.0, 110.0, source).success);
    REQUIRE(grid.addLoad(EntityKind::ResistiveLoad, 1, 0, 100.0, 1.0, load).success);
    REQUIRE(grid.connect(load, source).success);

    CHECK(grid.source()->voltagePerUnit() == Approx(0.99));
    CHECK(grid.source()->status() == OperatingStatus::Normal);
    CHECK(grid.findLoad(load)->status() == OperatingStatus::Normal);

    REQUIRE(grid.updateDemand(load, 300.0).success);
    CHECK(grid.source()->voltagePerUnit() == Approx(0.97));
    CHECK(grid.source()->status() == OperatingStatus::Warning);
    CHECK(grid.findLoad(load)->status() == OperatingStatus::Warning);

    REQUIRE(grid.updateDemand(load, 950.0).success);
    CHECK(grid.source()->loadingPercent() == Approx(0.95));
    CHECK(grid.source()->status() == OperatingStatus::Critical);

    REQUIRE(grid.updateDemand(load, 1200.0).success);
    CHECK(grid.source()->isOverloaded());
    CHECK(grid.source()->availableCapacity() == 0.0);
}

TEST_CASE("loading ignores the configured nominal power", "[power_grid]") {
    PowerGrid grid;
    EntityId source = kInvalidEntityId;
    EntityId load = kInvalidEntityId;
    REQUIRE(grid.addSource(0, 0, 100.0, 110.0, source).success);
    REQUIRE(grid.addLoad(EntityKind::ResistiveLoad, 1, 0, 50.0, 1.0, load).success);
    REQUIRE(grid.connect(load, source).success);

    CHECK(grid.source()->loadingPercent() == Approx(0.05));
    CHECK(grid.source()->availableCapacity() == Approx(950.0));
}

TEST_CASE("connecting twice keeps a single edge", "[power_grid]") {
    PowerGrid grid;
    EntityId source = kInvalidEntityId;
    EntityId load = kInvalidEntityId;
    REQUIRE(grid.addSource(0, 0, 1000.0, 110.0, source).success);
    REQUIRE(grid.addLoad(EntityKind::InductiveLoad, 1, 0, 5.0, 0.8, load).success);

    REQUIRE(grid.connect(load, source).success);
    Result again = grid.connect(load, source);
    CHECK_FALSE(again.success);
    CHECK(again.error == ErrorCode::AlreadyConnected);
    CHECK(grid.source()->loads().size() == 1);
    CHECK(grid.source()->totalActiveDemand() == Approx(5.0));
}

TEST_CASE("disconnect and reconnect round trip", "[power_grid]") {
    PowerGrid grid;
    EntityId source = kInvalidEntityId;
    EntityId a = kInvalidEntityId;
    EntityId b = kInvalidEntityId;
    REQUIRE(grid.addSource(0, 0, 1000.0, 110.0, source).success);
    REQUIRE(grid.addLoad(EntityKind::InductiveLoad, 1, 0, 10.0, 0.8, a).success);
    REQUIRE(grid.addLoad(EntityKind::ResistiveLoad, 2, 0, 20.0, 1.0, b).success);
    REQUIRE(grid.connect(a, source).success);
    REQUIRE(grid.connect(b, source).success);
    CHECK(grid.source()->totalActiveDemand() == Approx(30.0));
    const double q = grid.findLoad(a)->reactiveDemand();

    REQUIRE(grid.disconnect(a).success);
    CHECK_FALSE(grid.findLoad(a)->isConnected());
    CHECK(grid.findLoad(a)->status() == OperatingStatus::Inactive);
    CHECK_FALSE(grid.voltageAt(a));
    CHECK(grid.source()->totalActiveDemand() == Approx(20.0));
    CHECK(grid.source()->totalReactiveDemand() == Approx(0.0).margin(1e-12));

    SECTION("second disconnect is reported") {
        CHECK(grid.disconnect(a).error == ErrorCode::NotConnected);
        CHECK(grid.disconnect(source, a).error == ErrorCode::NotConnected);
    }

    SECTION("reconnect restores the contribution") {
        REQUIRE(grid.connect(a, source).success);
        CHECK(grid.source()->totalActiveDemand() == Approx(30.0));
        CHECK(grid.findLoad(a)->reactiveDemand() == Approx(q));
        CHECK(grid.source()->totalReactiveDemand() == Approx(q));
    }

    SECTION("source side disconnect clears both ends") {
        REQUIRE(grid.disconnect(source, b).success);
        CHECK_FALSE(grid.findLoad(b)->isConnected());
        CHECK(grid.source()->loads().empty());
        CHECK(grid.source()->totalActiveDemand() == 0.0);
    }
}

TEST_CASE("capacitive demand cancels inductive demand", "[power_grid]") {
    PowerGrid grid;
    EntityId source = kInvalidEntityId;
    EntityId ind = kInvalidEntityId;
    EntityId cap = kInvalidEntityId;
    REQUIRE(grid.addSource(0, 0, 1000.0, 110.0, source).success);
    REQUIRE(grid.addLoad(EntityKind::CapacitiveLoad, 1, 0, 5.0, 0.9, cap).success);
    CHECK(grid.findLoad(cap)->reactiveDemand() < 0.0);

    REQUIRE(grid.connect(cap, source).success);
    const double cap_only = std::fabs(grid.source()->totalReactiveDemand());

    REQUIRE(grid.addLoad(EntityKind::InductiveLoad, 2, 0, 5.0, 0.9, ind).success);
    REQUIRE(grid.connect(ind, source).success);
    CHECK(std::fabs(grid.source()->totalReactiveDemand()) < cap_only);
    CHECK(grid.source()->totalReactiveDemand() == Approx(0.0).margin(1e-9));
    CHECK(grid.source()->voltagePerUnit() == Approx(0.999));
}

TEST_CASE("connect failures leave the graph untouched", "[power_grid]") {
    PowerGrid grid;
    EntityId load = kInvalidEntityId;
    REQUIRE(grid.addLoad(EntityKind::ResistiveLoad, 1, 0, 5.0, 1.0, load).success);

    CHECK(grid.findLoad(load)->status() == OperatingStatus::Inactive);
    CHECK(grid.connect(load, kInvalidEntityId).error == ErrorCode::NilSource);
    CHECK(grid.connect(load, 42).error == ErrorCode::NilSource);
    CHECK_FALSE(grid.findLoad(load)->isConnected());
    CHECK(grid.disconnect(load).error == ErrorCode::NotConnected);

    EntityId source = kInvalidEntityId;
    REQUIRE(grid.addSource(0, 0, 1000.0, 110.0, source).success);
    CHECK(grid.connect(99, source).error == ErrorCode::UnknownEntity);
    CHECK(grid.source()->loads().empty());
}

TEST_CASE("placement rules", "[power_grid]") {
    EventLog log(8, false);
    PowerGrid grid(&log);
    EntityId first = kInvalidEntityId;
    EntityId second = kInvalidEntityId;
    REQUIRE(grid.addSource(0, 0, 1000.0, 110.0, first).success);
    CHECK(grid.source()->bus() == "PowerStation_Bus_1");

    Result dup = grid.addSource(5, 5, 1000.0, 110.0, second);
    CHECK(dup.error == ErrorCode::SourceExists);
    CHECK(dup.message == "Only one power station allowed");

    EntityId load = kInvalidEntityId;
    CHECK(grid.addLoad(EntityKind::ResistiveLoad, 0, 0, 5.0, 1.0, load).error == ErrorCode::Occupied);
    CHECK(grid.addLoad(EntityKind::ResistiveLoad, 1, 0, -1.0, 1.0, load).error == ErrorCode::InvalidDemand);
    CHECK(grid.addLoad(EntityKind::ResistiveLoad, 1, 0, 5.0, 0.0, load).error == ErrorCode::InvalidDemand);
    CHECK(grid.addLoad(EntityKind::Source, 1, 0, 5.0, 1.0, load).error == ErrorCode::UnknownEntity);

    REQUIRE(grid.addLoad(EntityKind::CapacitiveLoad, -3, 7, 5.0, 0.9, load).success);
    CHECK(grid.findLoad(load)->bus() == "Consumer_Bus_2");
    CHECK(grid.entityAt(-3, 7) == load);
    CHECK(grid.entityAt(0, 0) == first);
    CHECK(grid.entityAt(9, 9) == kInvalidEntityId);
    CHECK(grid.entityCount() == 2);
}

TEST_CASE("demand updates are validated", "[power_grid]") {
    PowerGrid grid;
    EntityId load = kInvalidEntityId;
    REQUIRE(grid.addLoad(EntityKind::InductiveLoad, 1, 0, 10.0, 0.8, load).success);

    CHECK(grid.updateDemand(load, -5.0).error == ErrorCode::InvalidDemand);
    CHECK(grid.updateDemand(load, 5.0, 1.5).error == ErrorCode::InvalidDemand);
    CHECK(grid.updateDemand(77, 5.0).error == ErrorCode::UnknownEntity);
    CHECK(grid.findLoad(load)->activeDemand() == Approx(10.0));

    REQUIRE(grid.updateDemand(load, 20.0, 0.6).success);
    CHECK(grid.findLoad(load)->powerFactor() == Approx(0.6));
    CHECK(grid.findLoad(load)->reactiveDemand() == Approx(20.0 * 4.0 / 3.0));
}

TEST_CASE("removing entities", "[power_grid]") {
    PowerGrid grid;
    EntityId source = kInvalidEntityId;
    EntityId a = kInvalidEntityId;
    EntityId b = kInvalidEntityId;
    REQUIRE(grid.addSource(0, 0, 1000.0, 110.0, source).success);
    REQUIRE(grid.addLoad(EntityKind::ResistiveLoad, 1, 0, 10.0, 1.0, a).success);
    REQUIRE(grid.addLoad(EntityKind::ResistiveLoad, 2, 0, 20.0, 1.0, b).success);
    REQUIRE(grid.connect(a, source).success);
    REQUIRE(grid.connect(b, source).success);

    SECTION("a load") {
        REQUIRE(grid.remove(a).success);
        CHECK(grid.findLoad(a) == nullptr);
        CHECK(grid.source()->loads().size() == 1);
        CHECK(grid.source()->totalActiveDemand() == Approx(20.0));
    }

    SECTION("the source") {
        REQUIRE(grid.remove(source).success);
        CHECK(grid.source() == nullptr);
        CHECK_FALSE(grid.findLoad(a)->isConnected());
        CHECK(grid.findLoad(b)->status() == OperatingStatus::Inactive);
    }

    SECTION("unknown id") {
        CHECK(grid.remove(123).error == ErrorCode::UnknownEntity);
    }
}

TEST_CASE("reset clears the grid and restarts bus numbering", "[power_grid]") {
    PowerGrid grid;
    EntityId id = kInvalidEntityId;
    REQUIRE(grid.addSource(0, 0, 1000.0, 110.0, id).success);
    REQUIRE(grid.addLoad(EntityKind::ResistiveLoad, 1, 0, 10.0, 1.0, id).success);

    grid.reset();
    CHECK(grid.entityCount() == 0);
    CHECK(grid.source() == nullptr);

    REQUIRE(grid.addLoad(EntityKind::ResistiveLoad, 1, 0, 10.0, 1.0, id).success);
    CHECK(id == 1);
    CHECK(grid.findLoad(id)->bus() == "Consumer_Bus_1");
}
