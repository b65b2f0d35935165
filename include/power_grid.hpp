#ifndef POWER_GRID_H
#define POWER_GRID_H

#include "grid_entity.hpp"
#include "grid_types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <vector>

class EventLog;

/// @brief Capacity that loading is measured against, in MW.
constexpr double kFixedSourceCapacityMw = 1000.0;

/// @brief Status thresholds applied on every recompute.
constexpr double kCriticalLoading = 0.9;
constexpr double kWarningLoading = 0.7;
constexpr double kCriticalVoltagePu = 0.95;
constexpr double kWarningVoltagePu = 0.98;

/**
 * @class PowerGrid
 * @brief Owns the placed entities and the connection graph between them.
 *
 * A grid has at most one Source. Every Load is connected to at most one
 * Source, and both ends of an edge are updated together: a failed
 * connect/disconnect leaves the graph untouched. The class is not
 * thread-safe; GridSession serialises access to it.
 */
class PowerGrid {
public:
    /**
     * @param log Receives placement, connection and Critical transition messages. May be null.
     */
    explicit PowerGrid(EventLog* log = nullptr);

    /**
     * @brief Places the Source.
     * @param id Set to the new entity id on success.
     * @return SourceExists if a Source is already placed, Occupied if the tile is taken.
     */
    Result addSource(int grid_x, int grid_y, double p_nom_mw, double v_nom_kv, EntityId& id);

    /**
     * @brief Places an unconnected Load.
     * @param kind One of the three load kinds.
     * @param id Set to the new entity id on success.
     * @return UnknownEntity for EntityKind::Source, InvalidDemand or Occupied otherwise.
     */
    Result addLoad(EntityKind kind, int grid_x, int grid_y, double active_demand, double power_factor,
                   EntityId& id);

    /**
     * @brief Connects a Load to a Source and recomputes that Source.
     * @return NilSource if source_id names no Source, UnknownEntity if load_id names no Load,
     *         AlreadyConnected if the Load already has a Source.
     */
    Result connect(EntityId load_id, EntityId source_id);

    /// @brief Detaches a Load from its Source. NotConnected if it has none.
    Result disconnect(EntityId load_id);

    /// @brief Removes load_id from the given Source's load set. NotConnected if it is not there.
    Result disconnect(EntityId source_id, EntityId load_id);

    /**
     * @brief Changes a Load's demand and re-derives its reactive demand.
     * @param power_factor Unchanged when empty.
     * @return InvalidDemand unless P >= 0 and 0 < pf <= 1.
     */
    Result updateDemand(EntityId load_id, double active_demand, std::optional<double> power_factor = std::nullopt);

    /// @brief Removes an entity. A removed Source leaves all its Loads unconnected.
    Result remove(EntityId id);

    /// @brief Drops every entity and restarts id allocation at 1.
    void reset();

    /// @brief Recomputes every Source and the status of every Load.
    void recompute();

    const GridEntity* find(EntityId id) const;
    const Source* findSource(EntityId id) const;
    const Load* findLoad(EntityId id) const;

    /// @brief The placed Source, or nullptr.
    const Source* source() const { return power_source.get(); }

    /// @brief All Loads, ordered by id.
    std::vector<const Load*> loads() const;

    /// @brief Id of the entity on a tile, or kInvalidEntityId.
    EntityId entityAt(int grid_x, int grid_y) const;

    /// @brief Per-unit voltage seen by a Load, i.e. that of its Source. Empty when unconnected.
    std::optional<double> voltageAt(EntityId load_id) const;

    std::size_t entityCount() const;

private:
    Source* sourceById(EntityId id);
    Load* loadById(EntityId id);
    void recomputeSource(Source& src);
    void classifyLoad(Load& load);
    void logInfo(const std::string& message);
    void logWarning(const std::string& message);

    EventLog* log;
    EntityId next_id;
    std::unique_ptr<Source> power_source;
    std::map<EntityId, std::unique_ptr<Load>> consumers;
};

#endif // POWER_GRID_H
