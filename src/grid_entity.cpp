#include "grid_entity.hpp"
#include "power_grid.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

double deriveReactiveDemand(EntityKind kind, double active_demand, double power_factor) {
    switch (kind) {
        case EntityKind::InductiveLoad:
            return active_demand * std::tan(std::acos(power_factor));
        case EntityKind::CapacitiveLoad:
            return -active_demand * std::tan(std::acos(power_factor));
        case EntityKind::ResistiveLoad:
        case EntityKind::Source:
            return 0.0;
    }
    return 0.0;
}

GridEntity::GridEntity(EntityId id, std::string bus, EntityKind kind, int grid_x, int grid_y)
    : current_status(OperatingStatus::Normal), entity_id(id), bus_name(std::move(bus)),
      entity_kind(kind), x(grid_x), y(grid_y) {}

Source::Source(EntityId id, std::string bus, int grid_x, int grid_y, double p_nom_mw, double v_nom_kv)
    : GridEntity(id, std::move(bus), EntityKind::Source, grid_x, grid_y),
      p_nom(p_nom_mw), v_nom(v_nom_kv), voltage_pu(1.0), total_p(0.0), total_q(0.0), loading(0.0) {}

double Source::availableCapacity() const {
    return std::max(0.0, kFixedSourceCapacityMw - total_p);
}

bool Source::hasLoad(EntityId load) const {
    return std::find(connected_loads.begin(), connected_loads.end(), load) != connected_loads.end();
}

bool Source::attach(EntityId load) {
    if (hasLoad(load)) {
        return false;
    }
    connected_loads.push_back(load);
    return true;
}

bool Source::detach(EntityId load) {
    auto it = std::find(connected_loads.begin(), connected_loads.end(), load);
    if (it == connected_loads.end()) {
        return false;
    }
    connected_loads.erase(it);
    return true;
}

Load::Load(EntityId id, std::string bus, EntityKind kind, int grid_x, int grid_y,
           double active_demand, double power_factor)
    : GridEntity(id, std::move(bus), kind, grid_x, grid_y),
      p_demand(0.0), pf(1.0), q_demand(0.0), source_id(kInvalidEntityId) {
    current_status = OperatingStatus::Inactive;
    setDemand(active_demand, power_factor);
}

void Load::setDemand(double active_demand, double power_factor) {
    p_demand = active_demand;
    pf = power_factor;
    q_demand = deriveReactiveDemand(kind(), p_demand, pf);
}

double Load::apparentPower() const {
    return std::sqrt(p_demand * p_demand + q_demand * q_demand);
}

double Load::actualPowerFactor() const {
    double s = apparentPower();
    return s > 0.0 ? p_demand / s : 1.0;
}
