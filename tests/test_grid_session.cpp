#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "config_loader.hpp"
#include "grid_session.hpp"

#include <string>
#include <vector>

using Catch::Approx;

namespace {

Config memory_config() {
    Config config = ConfigLoader::loadConfigFromString("persistence: {database_path: ':memory:'}");
    return config;
}

} // namespace

TEST_CASE("placement reads the effective configuration", "[grid_session]") {
    GridSession session(memory_config());
    session.setEchoToConsole(false);

    REQUIRE(session.saveParameter(ComponentKind::InductiveConsumer, "p_demand_rate", 20.0).success);

    EntityId station = kInvalidEntityId;
    EntityId load = kInvalidEntityId;
    REQUIRE(session.placeSource(0, 0, station).success);
    REQUIRE(session.placeLoad(EntityKind::InductiveLoad, 1, 1, load).success);

    auto row = session.status(load);
    REQUIRE(row);
    CHECK(row->active_power == Approx(20.0));
    CHECK(row->reactive_power == Approx(15.0));
    CHECK(row->status == OperatingStatus::Inactive);
    CHECK_FALSE(row->voltage_pu);

    SECTION("later configuration changes do not alter placed entities") {
        REQUIRE(session.saveParameter(ComponentKind::InductiveConsumer, "p_demand_rate", 50.0).success);
        CHECK(session.status(load)->active_power == Approx(20.0));
    }

    SECTION("connecting to the placed station") {
        REQUIRE(session.connect(load).success);
        auto src = session.status(station);
        REQUIRE(src);
        CHECK(src->active_power == Approx(20.0));
        CHECK(src->bus == "PowerStation_Bus_1");
        CHECK(session.status(load)->connected_to == station);
        CHECK(*session.status(load)->voltage_pu == Approx(*src->voltage_pu));
    }
}

TEST_CASE("session failures reach the log panel", "[grid_session]") {
    GridSession session(memory_config());
    session.setEchoToConsole(false);

    EntityId id = kInvalidEntityId;
    REQUIRE(session.placeSource(0, 0, id).success);
    CHECK(session.placeSource(1, 1, id).error == ErrorCode::SourceExists);
    CHECK(session.entityAt(0, 0) == 1);

    const auto log = session.recentLog();
    REQUIRE_FALSE(log.empty());
    CHECK(log.back().message == "Only one power station allowed");
    CHECK(log.back().level == LogLevel::Warning);
}

TEST_CASE("connect without a station reports a nil source", "[grid_session]") {
    GridSession session(memory_config());
    session.setEchoToConsole(false);

    EntityId load = kInvalidEntityId;
    REQUIRE(session.placeLoad(EntityKind::ResistiveLoad, 0, 0, load).success);
    CHECK(session.connect(load).error == ErrorCode::NilSource);
}

TEST_CASE("status report lists every entity", "[grid_session]") {
    GridSession session(memory_config());
    session.setEchoToConsole(false);

    EntityId station = kInvalidEntityId;
    EntityId a = kInvalidEntityId;
    EntityId b = kInvalidEntityId;
    REQUIRE(session.placeSource(0, 0, station).success);
    REQUIRE(session.placeLoad(EntityKind::CapacitiveLoad, 1, 0, a).success);
    REQUIRE(session.placeLoad(EntityKind::ResistiveLoad, 2, 0, b).success);
    REQUIRE(session.connect(a).success);
    session.tick();

    auto rows = session.statusReport();
    REQUIRE(rows.size() == 3);
    CHECK(rows[0].label == "PS");
    CHECK(rows[1].label == "CC");
    CHECK(rows[1].reactive_power < 0.0);
    CHECK(rows[2].label == "CR");
    CHECK(rows[2].status == OperatingStatus::Inactive);

    session.resetGrid();
    CHECK(session.statusReport().empty());
    REQUIRE(session.placeLoad(EntityKind::ResistiveLoad, 2, 0, b).success);
    CHECK(b == 1);
}

TEST_CASE("presets through the session", "[grid_session]") {
    GridSession session(memory_config());
    session.setEchoToConsole(false);

    std::vector<std::string> tags;
    SubscriptionId sub = session.subscribe([&tags](ConfigEvent event) { tags.push_back(eventTag(event)); });

    REQUIRE(session.saveParameter(ComponentKind::PowerStation, "p_nom_mw", 2000.0).success);
    REQUIRE(session.savePreset("Plant", ComponentKind::PowerStation, "large").success);
    auto presets = session.listPresets(ComponentKind::PowerStation);
    REQUIRE(presets.size() == 1);

    REQUIRE(session.resetParameters(ComponentKind::PowerStation).success);
    CHECK(*session.getEffective(ComponentKind::PowerStation, "p_nom_mw") == Approx(1000.0));
    REQUIRE(session.applyPreset(presets[0].id).success);
    CHECK(session.getEffective(ComponentKind::PowerStation).at("p_nom_mw") == Approx(2000.0));

    ParameterSnapshot snapshot;
    REQUIRE(session.loadPreset(presets[0].id, snapshot).success);
    CHECK(snapshot.at("v_nom_kv") == Approx(110.0));

    REQUIRE(session.deletePreset(presets[0].id).success);
    CHECK(session.unsubscribe(sub));
    CHECK(tags == std::vector<std::string>{"config_changed", "instance_saved", "config_changed",
                                           "config_changed", "instance_deleted"});
    CHECK(session.recentLog().back().message == "Instance deleted successfully");
    CHECK(session.definitions(ComponentKind::PowerStation).size() == 2);
}

TEST_CASE("listeners can read back through the session", "[grid_session]") {
    GridSession session(memory_config());
    session.setEchoToConsole(false);

    std::size_t seen = 0;
    Result nested;
    session.subscribe([&](ConfigEvent event) {
        if (event == ConfigEvent::PresetSaved) {
            seen = session.listPresets().size();
            nested = session.saveParameter(ComponentKind::PowerStation, "p_nom_mw", 3000.0);
        }
    });

    REQUIRE(session.savePreset("A", ComponentKind::PowerStation).success);
    CHECK(seen == 1);
    CHECK(nested.error == ErrorCode::ReentrantCall);
    CHECK(*session.getEffective(ComponentKind::PowerStation, "p_nom_mw") == Approx(1000.0));
}
