#ifndef GRID_SESSION_H
#define GRID_SESSION_H

#include "config_service.hpp"
#include "database.hpp"
#include "event_log.hpp"
#include "grid_types.hpp"
#include "parameter_store.hpp"
#include "power_grid.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @struct EntityStatus
 * @brief Value copy of one entity's state, for drawing.
 */
struct EntityStatus {
    EntityId id;
    std::string bus;
    EntityKind kind;
    std::string label;
    int grid_x;
    int grid_y;
    OperatingStatus status;
    std::optional<double> voltage_pu; ///< Empty for an unconnected load
    double active_power;              ///< Demand of a load, total demand of the source (MW)
    double reactive_power;            ///< MVAr, signed
    EntityId connected_to;            ///< Source of a load; kInvalidEntityId otherwise
};

/**
 * @class GridSession
 * @brief The grid core behind one mutex: configuration, presets, entities and the log panel.
 *
 * Every public method locks the session, so it can be shared between the
 * simulation thread and the caller's thread. Config listeners run on the
 * notifying thread with the lock held; the lock is recursive so a listener
 * may read back through the session (listPresets, getEffective). Changing the
 * configuration from a listener fails with ErrorCode::ReentrantCall.
 */
class GridSession {
public:
    /**
     * @brief Opens the database named by the configuration and seeds the parameter definitions.
     * @param config The loaded configuration.
     * @throw PersistenceError if the database cannot be opened or initialised.
     */
    explicit GridSession(const Config& config);

    GridSession(const GridSession&) = delete;
    GridSession& operator=(const GridSession&) = delete;

    // --- Grid ---

    /// @brief Places the power station using the effective POWER_STATION parameters.
    Result placeSource(int grid_x, int grid_y, EntityId& id);

    /// @brief Places an unconnected load using the effective parameters of its kind.
    Result placeLoad(EntityKind kind, int grid_x, int grid_y, EntityId& id);

    /// @brief Connects a load to the placed power station.
    Result connect(EntityId load_id);
    Result connect(EntityId load_id, EntityId source_id);
    Result disconnect(EntityId load_id);
    Result disconnect(EntityId source_id, EntityId load_id);
    Result updateDemand(EntityId load_id, double active_demand, std::optional<double> power_factor = std::nullopt);
    Result remove(EntityId id);

    /// @brief Clears the grid. Configuration and presets are kept.
    void resetGrid();

    /// @brief One simulation step.
    void tick();

    EntityId entityAt(int grid_x, int grid_y) const;
    std::optional<EntityStatus> status(EntityId id) const;
    std::vector<EntityStatus> statusReport() const;

    // --- Configuration ---

    ParameterSnapshot getEffective(ComponentKind kind) const;
    std::optional<double> getEffective(ComponentKind kind, const std::string& name) const;
    std::vector<ParameterDefinition> definitions(ComponentKind kind) const;
    Result saveParameter(ComponentKind kind, const std::string& name, double value);
    Result resetParameters(ComponentKind kind, const std::optional<std::string>& name = std::nullopt);

    Result savePreset(const std::string& name, ComponentKind kind, const std::string& description = "");
    Result loadPreset(std::int64_t id, ParameterSnapshot& parameters) const;
    Result applyPreset(std::int64_t id);
    Result deletePreset(std::int64_t id);
    std::vector<Preset> listPresets(std::optional<ComponentKind> kind = std::nullopt) const;

    SubscriptionId subscribe(ConfigListener listener);
    bool unsubscribe(SubscriptionId id);

    // --- Log panel ---

    std::vector<LogEntry> recentLog() const;
    void setEchoToConsole(bool enabled);

private:
    Result report(Result result);
    Result reportFailure(Result result);
    EntityStatus describe(const GridEntity& entity) const;

    mutable std::recursive_mutex mutex;
    EventLog event_log;
    Database database;
    ParameterStore parameter_store;
    ConfigurationService config_service;
    PowerGrid grid;
};

#endif // GRID_SESSION_H
