#ifndef PARAMETER_STORE_H
#define PARAMETER_STORE_H

#include "database.hpp"
#include "grid_types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @class ParameterStore
 * @brief Persisted parameter defaults, ranges and user overrides.
 *
 * Definitions are seeded once into ComponentParameterDefaults and then read
 * back, so rows already present in the database take precedence over the
 * seed. Overrides live in ParameterOverrides and are mirrored in memory; the
 * mirror only changes after the database write succeeded.
 *
 * The effective value of a parameter is its override when one exists, else
 * its default. Writes outside [min, max] are rejected, never clamped.
 */
class ParameterStore {
public:
    /**
     * @brief Creates the schema if needed, seeds definitions and loads overrides.
     * @param db Open database, must outlive the store.
     * @param seed Definitions inserted when their (kind, name) row is absent.
     * @throw PersistenceError if the schema cannot be created or read.
     */
    ParameterStore(Database& db, const std::vector<ParameterDefinition>& seed);

    /**
     * @brief Looks up the definition of a parameter.
     * @return Pointer into the store, or nullptr if (kind, name) is undefined.
     */
    const ParameterDefinition* findDefinition(ComponentKind kind, const std::string& name) const;

    /// @brief All definitions of a component kind, ordered by parameter name.
    std::vector<ParameterDefinition> definitions(ComponentKind kind) const;

    /**
     * @brief Effective value of one parameter.
     * @return The override if present, else the default; empty if (kind, name) is undefined.
     */
    std::optional<double> getEffective(ComponentKind kind, const std::string& name) const;

    /// @brief Effective values of every parameter of a kind.
    ParameterSnapshot getEffective(ComponentKind kind) const;

    /// @brief The stored override, if any.
    std::optional<double> getOverride(ComponentKind kind, const std::string& name) const;

    /**
     * @brief Validates and upserts an override.
     * @return Failure with UnknownParameter, OutOfRange or Persistence; state unchanged on failure.
     */
    Result setOverride(ComponentKind kind, const std::string& name, double value);

    /**
     * @brief Upserts several overrides of one kind in a single transaction.
     *
     * Every value is validated before anything is written; either all
     * overrides are stored or none are.
     */
    Result setOverrides(ComponentKind kind, const ParameterSnapshot& values);

    /**
     * @brief Validates a value against a parameter's range without writing it.
     */
    Result validate(ComponentKind kind, const std::string& name, double value) const;

    /**
     * @brief Deletes one override, or every override of the kind when name is empty.
     */
    Result resetOverride(ComponentKind kind, const std::optional<std::string>& name = std::nullopt);

    /// @brief Incremented by every successful override write or reset.
    std::uint64_t revision() const { return revision_counter; }

private:
    using Key = std::pair<ComponentKind, std::string>;

    void createSchema();
    void seedDefinitions(const std::vector<ParameterDefinition>& seed);
    void loadDefinitions();
    void loadOverrides();

    Database& db;
    std::map<Key, ParameterDefinition> definitions_by_key;
    std::map<Key, double> overrides;
    std::uint64_t revision_counter;
};

#endif // PARAMETER_STORE_H
