#include "power_grid.hpp"
#include "event_log.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace {

std::string fixed(double value, int digits) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(digits) << value;
    return out.str();
}

bool valid_demand(double active_demand, double power_factor) {
    return std::isfinite(active_demand) && active_demand >= 0.0 &&
           std::isfinite(power_factor) && power_factor > 0.0 && power_factor <= 1.0;
}

OperatingStatus classify(double loading, double voltage_pu) {
    if (loading > kCriticalLoading || voltage_pu < kCriticalVoltagePu) {
        return OperatingStatus::Critical;
    }
    if (loading > kWarningLoading || voltage_pu < kWarningVoltagePu) {
        return OperatingStatus::Warning;
    }
    return OperatingStatus::Normal;
}

} // namespace

PowerGrid::PowerGrid(EventLog* event_log) : log(event_log), next_id(1) {}

Result PowerGrid::addSource(int grid_x, int grid_y, double p_nom_mw, double v_nom_kv, EntityId& id) {
    if (power_source) {
        return Result::failure(ErrorCode::SourceExists, "Only one power station allowed");
    }
    if (entityAt(grid_x, grid_y) != kInvalidEntityId) {
        return Result::failure(ErrorCode::Occupied, "Tile is already occupied");
    }

    id = next_id++;
    power_source = std::make_unique<Source>(id, "PowerStation_Bus_" + std::to_string(id),
                                            grid_x, grid_y, p_nom_mw, v_nom_kv);
    recomputeSource(*power_source);

    std::string message = "Placed PS (P=" + fixed(p_nom_mw, 1) + "MW, V=" + fixed(v_nom_kv, 1) + "kV)";
    logInfo(message);
    return Result::ok(message);
}

Result PowerGrid::addLoad(EntityKind kind, int grid_x, int grid_y, double active_demand, double power_factor,
                          EntityId& id) {
    if (kind == EntityKind::Source) {
        return Result::failure(ErrorCode::UnknownEntity, "A power station is not a load");
    }
    if (!valid_demand(active_demand, power_factor)) {
        return Result::failure(ErrorCode::InvalidDemand, "Demand must be >= 0 and power factor in (0, 1]");
    }
    if (entityAt(grid_x, grid_y) != kInvalidEntityId) {
        return Result::failure(ErrorCode::Occupied, "Tile is already occupied");
    }

    id = next_id++;
    auto load = std::make_unique<Load>(id, "Consumer_Bus_" + std::to_string(id), kind,
                                       grid_x, grid_y, active_demand, power_factor);
    std::string message = "Placed " + load->label() + " (P=" + fixed(active_demand, 1) + "MW, pf=" +
                          fixed(power_factor, 2) + ")";
    consumers.emplace(id, std::move(load));
    logInfo(message);
    return Result::ok(message);
}

Result PowerGrid::connect(EntityId load_id, EntityId source_id) {
    Source* src = sourceById(source_id);
    if (!src) {
        return Result::failure(ErrorCode::NilSource, "No power station to connect to");
    }
    Load* load = loadById(load_id);
    if (!load) {
        return Result::failure(ErrorCode::UnknownEntity, "Unknown consumer " + std::to_string(load_id));
    }
    if (load->isConnected() || src->hasLoad(load_id)) {
        return Result::failure(ErrorCode::AlreadyConnected, load->label() + " is already connected");
    }

    src->attach(load_id);
    load->source_id = source_id;
    recomputeSource(*src);

    std::string message = "Connected " + load->label() + " (P=" + fixed(load->activeDemand(), 1) + "MW, Q=" +
                          fixed(load->reactiveDemand(), 1) + "MVAr)";
    logInfo(message);
    return Result::ok(message);
}

Result PowerGrid::disconnect(EntityId load_id) {
    Load* load = loadById(load_id);
    if (!load) {
        return Result::failure(ErrorCode::UnknownEntity, "Unknown consumer " + std::to_string(load_id));
    }
    if (!load->isConnected()) {
        return Result::failure(ErrorCode::NotConnected, load->label() + " is not connected");
    }
    return disconnect(load->source(), load_id);
}

Result PowerGrid::disconnect(EntityId source_id, EntityId load_id) {
    Source* src = sourceById(source_id);
    if (!src) {
        return Result::failure(ErrorCode::NilSource, "No power station " + std::to_string(source_id));
    }
    Load* load = loadById(load_id);
    if (!load || !src->hasLoad(load_id)) {
        return Result::failure(ErrorCode::NotConnected, "Consumer is not connected to this power station");
    }

    src->detach(load_id);
    load->source_id = kInvalidEntityId;
    load->current_status = OperatingStatus::Inactive;
    recomputeSource(*src);

    std::string message = "Disconnected " + load->label();
    logInfo(message);
    return Result::ok(message);
}

Result PowerGrid::updateDemand(EntityId load_id, double active_demand, std::optional<double> power_factor) {
    Load* load = loadById(load_id);
    if (!load) {
        return Result::failure(ErrorCode::UnknownEntity, "Unknown consumer " + std::to_string(load_id));
    }
    double pf = power_factor.value_or(load->powerFactor());
    if (!valid_demand(active_demand, pf)) {
        return Result::failure(ErrorCode::InvalidDemand, "Demand must be >= 0 and power factor in (0, 1]");
    }

    load->setDemand(active_demand, pf);
    if (Source* src = sourceById(load->source())) {
        recomputeSource(*src);
    }
    return Result::ok("Updated " + load->label() + " (P=" + fixed(active_demand, 1) + "MW, Q=" +
                      fixed(load->reactiveDemand(), 1) + "MVAr)");
}

Result PowerGrid::remove(EntityId id) {
    if (power_source && power_source->id() == id) {
        for (EntityId load_id : power_source->loads()) {
            if (Load* load = loadById(load_id)) {
                load->source_id = kInvalidEntityId;
                load->current_status = OperatingStatus::Inactive;
            }
        }
        power_source.reset();
        logInfo("Removed PS");
        return Result::ok("Removed PS");
    }

    auto it = consumers.find(id);
    if (it == consumers.end()) {
        return Result::failure(ErrorCode::UnknownEntity, "Unknown entity " + std::to_string(id));
    }
    Load& load = *it->second;
    std::string message = "Removed " + load.label();
    if (Source* src = sourceById(load.source())) {
        src->detach(id);
        consumers.erase(it);
        recomputeSource(*src);
    } else {
        consumers.erase(it);
    }
    logInfo(message);
    return Result::ok(message);
}

void PowerGrid::reset() {
    consumers.clear();
    power_source.reset();
    next_id = 1;
    logInfo("Grid cleared");
}

void PowerGrid::recompute() {
    if (power_source) {
        recomputeSource(*power_source);
    }
    for (auto& entry : consumers) {
        if (!entry.second->isConnected()) {
            entry.second->current_status = OperatingStatus::Inactive;
        }
    }
}

void PowerGrid::recomputeSource(Source& src) {
    double total_p = 0.0;
    double total_q = 0.0;
    for (EntityId load_id : src.loads()) {
        if (const Load* load = loadById(load_id)) {
            total_p += load->activeDemand();
            total_q += load->reactiveDemand();
        }
    }

    src.total_p = total_p;
    src.total_q = total_q;
    src.loading = total_p / kFixedSourceCapacityMw;
    // Linear approximation; deliberately unclamped, may go negative.
    src.voltage_pu = 1.0 - src.loading * 0.1 - std::fabs(total_q) * 0.02;

    OperatingStatus previous = src.current_status;
    src.current_status = classify(src.loading, src.voltage_pu);
    if (src.current_status == OperatingStatus::Critical && previous != OperatingStatus::Critical) {
        if (src.loading > kCriticalLoading) {
            logWarning("Warning: High loading at power station: " + fixed(src.loading * 100.0, 1) + "%");
        }
        if (src.voltage_pu < kCriticalVoltagePu) {
            logWarning("Warning: Low voltage at power station: " + fixed(src.voltage_pu, 2) + " pu");
        }
    }

    for (EntityId load_id : src.loads()) {
        if (Load* load = loadById(load_id)) {
            classifyLoad(*load);
        }
    }
}

void PowerGrid::classifyLoad(Load& load) {
    OperatingStatus previous = load.current_status;
    std::optional<double> voltage = voltageAt(load.id());
    if (!voltage) {
        load.current_status = OperatingStatus::Inactive;
        return;
    }

    if (*voltage < kCriticalVoltagePu) {
        load.current_status = OperatingStatus::Critical;
    } else if (*voltage < kWarningVoltagePu) {
        load.current_status = OperatingStatus::Warning;
    } else {
        load.current_status = OperatingStatus::Normal;
    }

    if (load.current_status == OperatingStatus::Critical && previous != OperatingStatus::Critical) {
        logWarning("Low voltage at " + load.label() + ": " + fixed(*voltage, 2) + " pu");
    }
}

const GridEntity* PowerGrid::find(EntityId id) const {
    if (const Source* src = findSource(id)) {
        return src;
    }
    return findLoad(id);
}

const Source* PowerGrid::findSource(EntityId id) const {
    if (power_source && power_source->id() == id) {
        return power_source.get();
    }
    return nullptr;
}

const Load* PowerGrid::findLoad(EntityId id) const {
    auto it = consumers.find(id);
    return it == consumers.end() ? nullptr : it->second.get();
}

Source* PowerGrid::sourceById(EntityId id) {
    if (power_source && power_source->id() == id) {
        return power_source.get();
    }
    return nullptr;
}

Load* PowerGrid::loadById(EntityId id) {
    auto it = consumers.find(id);
    return it == consumers.end() ? nullptr : it->second.get();
}

std::vector<const Load*> PowerGrid::loads() const {
    std::vector<const Load*> result;
    result.reserve(consumers.size());
    for (const auto& entry : consumers) {
        result.push_back(entry.second.get());
    }
    return result;
}

EntityId PowerGrid::entityAt(int grid_x, int grid_y) const {
    if (power_source && power_source->gridX() == grid_x && power_source->gridY() == grid_y) {
        return power_source->id();
    }
    for (const auto& entry : consumers) {
        if (entry.second->gridX() == grid_x && entry.second->gridY() == grid_y) {
            return entry.first;
        }
    }
    return kInvalidEntityId;
}

std::optional<double> PowerGrid::voltageAt(EntityId load_id) const {
    const Load* load = findLoad(load_id);
    if (!load) {
        return std::nullopt;
    }
    const Source* src = findSource(load->source());
    if (!src) {
        return std::nullopt;
    }
    return src->voltagePerUnit();
}

std::size_t PowerGrid::entityCount() const {
    return consumers.size() + (power_source ? 1 : 0);
}

void PowerGrid::logInfo(const std::string& message) {
    if (log) {
        log->info(message);
    }
}

void PowerGrid::logWarning(const std::string& message) {
    if (log) {
        log->warning(message);
    }
}
