#include "grid_session.hpp"
#include <utility>

GridSession::GridSession(const Config& config)
    : event_log(static_cast<std::size_t>(config.sim_params.max_log_messages)),
      database(config.persistence.database_path),
      parameter_store(database, config.parameters),
      config_service(database, parameter_store),
      grid(&event_log) {}

Result GridSession::report(Result result) {
    if (result.success) {
        event_log.info(result.message);
    } else {
        event_log.warning(result.message);
    }
    return result;
}

// Successful grid operations are logged by PowerGrid itself.
Result GridSession::reportFailure(Result result) {
    if (!result.success) {
        event_log.warning(result.message);
    }
    return result;
}

Result GridSession::placeSource(int grid_x, int grid_y, EntityId& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    const ParameterSnapshot params = config_service.getEffective(ComponentKind::PowerStation);
    auto p_nom = params.find("p_nom_mw");
    auto v_nom = params.find("v_nom_kv");
    if (p_nom == params.end() || v_nom == params.end()) {
        return reportFailure(Result::failure(ErrorCode::UnknownParameter,
                                             "Power station parameters p_nom_mw/v_nom_kv are not defined"));
    }
    return reportFailure(grid.addSource(grid_x, grid_y, p_nom->second, v_nom->second, id));
}

Result GridSession::placeLoad(EntityKind kind, int grid_x, int grid_y, EntityId& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    if (kind == EntityKind::Source) {
        return reportFailure(Result::failure(ErrorCode::UnknownEntity, "A power station is not a load"));
    }
    const ComponentKind component = componentKindFor(kind);
    const ParameterSnapshot params = config_service.getEffective(component);
    auto demand = params.find("p_demand_rate");
    auto pf = params.find("power_factor");
    if (demand == params.end() || pf == params.end()) {
        return reportFailure(Result::failure(ErrorCode::UnknownParameter,
                                             toString(component) + " parameters p_demand_rate/power_factor are not defined"));
    }
    return reportFailure(grid.addLoad(kind, grid_x, grid_y, demand->second, pf->second, id));
}

Result GridSession::connect(EntityId load_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    const Source* src = grid.source();
    return reportFailure(grid.connect(load_id, src ? src->id() : kInvalidEntityId));
}

Result GridSession::connect(EntityId load_id, EntityId source_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return reportFailure(grid.connect(load_id, source_id));
}

Result GridSession::disconnect(EntityId load_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return reportFailure(grid.disconnect(load_id));
}

Result GridSession::disconnect(EntityId source_id, EntityId load_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return reportFailure(grid.disconnect(source_id, load_id));
}

Result GridSession::updateDemand(EntityId load_id, double active_demand, std::optional<double> power_factor) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return report(grid.updateDemand(load_id, active_demand, power_factor));
}

Result GridSession::remove(EntityId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return reportFailure(grid.remove(id));
}

void GridSession::resetGrid() {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    grid.reset();
}

void GridSession::tick() {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    grid.recompute();
}

EntityId GridSession::entityAt(int grid_x, int grid_y) const {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return grid.entityAt(grid_x, grid_y);
}

EntityStatus GridSession::describe(const GridEntity& entity) const {
    EntityStatus row;
    row.id = entity.id();
    row.bus = entity.bus();
    row.kind = entity.kind();
    row.label = entity.label();
    row.grid_x = entity.gridX();
    row.grid_y = entity.gridY();
    row.status = entity.status();
    row.connected_to = kInvalidEntityId;

    if (const Source* src = grid.findSource(entity.id())) {
        row.voltage_pu = src->voltagePerUnit();
        row.active_power = src->totalActiveDemand();
        row.reactive_power = src->totalReactiveDemand();
    } else if (const Load* load = grid.findLoad(entity.id())) {
        row.voltage_pu = grid.voltageAt(load->id());
        row.active_power = load->activeDemand();
        row.reactive_power = load->reactiveDemand();
        row.connected_to = load->source();
    } else {
        row.active_power = 0.0;
        row.reactive_power = 0.0;
    }
    return row;
}

std::optional<EntityStatus> GridSession::status(EntityId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    const GridEntity* entity = grid.find(id);
    if (!entity) {
        return std::nullopt;
    }
    return describe(*entity);
}

std::vector<EntityStatus> GridSession::statusReport() const {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    std::vector<EntityStatus> rows;
    if (const Source* src = grid.source()) {
        rows.push_back(describe(*src));
    }
    for (const Load* load : grid.loads()) {
        rows.push_back(describe(*load));
    }
    return rows;
}

ParameterSnapshot GridSession::getEffective(ComponentKind kind) const {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return config_service.getEffective(kind);
}

std::optional<double> GridSession::getEffective(ComponentKind kind, const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return config_service.getEffective(kind, name);
}

std::vector<ParameterDefinition> GridSession::definitions(ComponentKind kind) const {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return config_service.definitions(kind);
}

Result GridSession::saveParameter(ComponentKind kind, const std::string& name, double value) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return report(config_service.save(kind, name, value));
}

Result GridSession::resetParameters(ComponentKind kind, const std::optional<std::string>& name) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return report(config_service.reset(kind, name));
}

Result GridSession::savePreset(const std::string& name, ComponentKind kind, const std::string& description) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return report(config_service.savePreset(name, kind, description));
}

Result GridSession::loadPreset(std::int64_t id, ParameterSnapshot& parameters) const {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return config_service.loadPreset(id, parameters);
}

Result GridSession::applyPreset(std::int64_t id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return report(config_service.applyPreset(id));
}

Result GridSession::deletePreset(std::int64_t id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return report(config_service.deletePreset(id));
}

std::vector<Preset> GridSession::listPresets(std::optional<ComponentKind> kind) const {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return config_service.listPresets(kind);
}

SubscriptionId GridSession::subscribe(ConfigListener listener) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return config_service.subscribe(std::move(listener));
}

bool GridSession::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return config_service.unsubscribe(id);
}

std::vector<LogEntry> GridSession::recentLog() const {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return event_log.recent();
}

void GridSession::setEchoToConsole(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    event_log.setEchoToConsole(enabled);
}
