#ifndef CONFIG_SERVICE_H
#define CONFIG_SERVICE_H

#include "database.hpp"
#include "grid_types.hpp"
#include "parameter_store.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/// @brief Callback invoked synchronously for every published ConfigEvent.
using ConfigListener = std::function<void(ConfigEvent)>;

/// @brief Handle returned by subscribe(), used to unsubscribe.
using SubscriptionId = std::uint64_t;

/**
 * @class ConfigurationService
 * @brief Resolves effective parameters, validates writes, and manages presets.
 *
 * After every successful write the in-memory configuration snapshot is rebuilt
 * for all component kinds and subscribers are notified in registration order.
 *
 * Listeners must not modify the configuration while being notified: any
 * mutating call made during dispatch fails with ErrorCode::ReentrantCall.
 * Read accessors are allowed. Listeners added or removed during dispatch take
 * effect from the next notification.
 */
class ConfigurationService {
public:
    /**
     * @brief Creates the Presets table if needed and builds the initial snapshot.
     * @param db Open database, must outlive the service.
     * @param store Parameter store backed by the same database.
     * @throw PersistenceError if the schema cannot be created.
     */
    ConfigurationService(Database& db, ParameterStore& store);

    /**
     * @brief The current configuration of every component kind.
     *
     * Writes made directly through the ParameterStore are picked up here too:
     * the snapshot is rebuilt whenever the store's revision has moved.
     */
    const ConfigurationSnapshot& current() const;

    /// @brief Effective parameters of one kind, for populating edit screens.
    ParameterSnapshot getEffective(ComponentKind kind) const;

    /// @brief Effective value of one parameter; empty if the parameter is undefined.
    std::optional<double> getEffective(ComponentKind kind, const std::string& name) const;

    std::vector<ParameterDefinition> definitions(ComponentKind kind) const;

    /**
     * @brief Validates and persists a parameter override, then publishes ConfigChanged.
     */
    Result save(ComponentKind kind, const std::string& name, double value);

    /**
     * @brief Restores one parameter, or every parameter of the kind, to its default.
     */
    Result reset(ComponentKind kind, const std::optional<std::string>& name = std::nullopt);

    /**
     * @brief Snapshots the current effective parameters of a kind under a unique name.
     * @return NameRequired for an empty name, DuplicateName if the name is taken.
     */
    Result savePreset(const std::string& name, ComponentKind kind, const std::string& description = "");

    /**
     * @brief Reads a preset's parameter snapshot.
     * @param id Preset id.
     * @param parameters Filled with the snapshot on success.
     * @return NotFound if no preset has this id.
     */
    Result loadPreset(std::int64_t id, ParameterSnapshot& parameters) const;

    /**
     * @brief Writes a preset's snapshot back as overrides, all or nothing.
     */
    Result applyPreset(std::int64_t id);

    /**
     * @brief Deletes a preset and publishes PresetDeleted.
     * @return NotFound (nothing published) if the id is absent.
     */
    Result deletePreset(std::int64_t id);

    /// @brief All presets, optionally filtered by kind, ordered by id.
    std::vector<Preset> listPresets(std::optional<ComponentKind> kind = std::nullopt) const;

    std::optional<Preset> findPreset(const std::string& name) const;

    SubscriptionId subscribe(ConfigListener listener);
    bool unsubscribe(SubscriptionId id);

private:
    void rebuildSnapshot() const;
    void notify(ConfigEvent event);
    Result rejectIfDispatching() const;
    Preset readPreset(const Statement& row) const;

    Database& db;
    ParameterStore& store;
    mutable ConfigurationSnapshot snapshot;
    mutable std::uint64_t snapshot_revision;

    std::vector<std::pair<SubscriptionId, ConfigListener>> listeners;
    SubscriptionId next_subscription_id;
    bool dispatching;
};

#endif // CONFIG_SERVICE_H
