#ifndef GRID_TYPES_H
#define GRID_TYPES_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/// @brief Component kinds that carry configurable parameters.
enum class ComponentKind {
    PowerStation,       ///< The single power source of a grid
    InductiveConsumer,  ///< Motors, transformers (positive Q)
    CapacitiveConsumer, ///< Capacitor banks (negative Q)
    ResistiveConsumer   ///< Heating, lighting (zero Q)
};

/// @brief Kind tag of a placed grid entity.
enum class EntityKind {
    Source,
    InductiveLoad,
    CapacitiveLoad,
    ResistiveLoad
};

/// @brief Operating status used by the presentation layer for color-coding.
enum class OperatingStatus {
    Normal,
    Warning,
    Critical,
    Inactive ///< Unconnected load
};

/// @brief Change tags published by the ConfigurationService.
enum class ConfigEvent {
    ConfigChanged, ///< "config_changed"
    PresetSaved,   ///< "instance_saved"
    PresetDeleted  ///< "instance_deleted"
};

/// @brief Typed failure reasons carried by Result.
enum class ErrorCode {
    None,
    UnknownParameter,
    OutOfRange,
    NameRequired,
    DuplicateName,
    NotFound,
    Persistence,
    AlreadyConnected,
    NotConnected,
    NilSource,
    UnknownEntity,
    SourceExists,
    Occupied,
    InvalidDemand,
    ReentrantCall
};

/**
 * @struct Result
 * @brief Outcome of a mutating core operation.
 *
 * The message is meant for direct display. On failure the operation left
 * all prior state intact.
 */
struct Result {
    bool success = false;
    std::string message;
    ErrorCode error = ErrorCode::None;

    static Result ok(std::string message) {
        return {true, std::move(message), ErrorCode::None};
    }

    static Result failure(ErrorCode error, std::string message) {
        return {false, std::move(message), error};
    }
};

/**
 * @struct ParameterDefinition
 * @brief Seeded default and admissible range of one component parameter.
 */
struct ParameterDefinition {
    ComponentKind kind;
    std::string name;
    double default_value;
    double min_value;
    double max_value;
    std::string description;
    std::string unit;
};

/// @brief Parameter name to value, for one component kind.
using ParameterSnapshot = std::map<std::string, double>;

/// @brief Effective parameters of every component kind.
using ConfigurationSnapshot = std::map<ComponentKind, ParameterSnapshot>;

/**
 * @struct Preset
 * @brief A named, persisted snapshot of a component kind's effective parameters.
 */
struct Preset {
    std::int64_t id = 0;
    std::string name;
    std::string description;
    ComponentKind kind = ComponentKind::PowerStation;
    ParameterSnapshot parameters;
    std::string created_at;
};

/**
 * @struct SimulationParams
 * @brief Parameters that control the simulation driver.
 */
struct SimulationParams {
    int update_interval_ms = 1000;
    int max_log_messages = 8;
};

/**
 * @struct PersistenceParams
 * @brief Where parameter overrides and presets are stored.
 */
struct PersistenceParams {
    std::string database_path = "power_grid.db";
};

/**
 * @struct Config
 * @brief Top-level structure to hold the entire parsed configuration.
 */
struct Config {
    SimulationParams sim_params;
    PersistenceParams persistence;
    std::vector<ParameterDefinition> parameters;
};

/// @brief All component kinds, in display order.
const std::vector<ComponentKind>& allComponentKinds();

/// @brief Persisted name of a component kind, e.g. "POWER_STATION".
std::string toString(ComponentKind kind);

/// @brief Parses a persisted component kind name.
std::optional<ComponentKind> parseComponentKind(const std::string& text);

std::string toString(EntityKind kind);
std::string toString(OperatingStatus status);

/// @brief Short map label of an entity kind ("PS", "CI", "CC", "CR").
std::string entityLabel(EntityKind kind);

/// @brief Component kind whose parameters initialise an entity of the given kind.
ComponentKind componentKindFor(EntityKind kind);

/// @brief Tag string delivered to subscribers, e.g. "config_changed".
std::string eventTag(ConfigEvent event);

#endif // GRID_TYPES_H
