#ifndef GRID_ENTITY_H
#define GRID_ENTITY_H

#include "grid_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

/// @brief Stable handle of a placed entity. Ids are never reused within a session.
using EntityId = std::uint64_t;
constexpr EntityId kInvalidEntityId = 0;

/**
 * @brief Reactive power of a load, signed by its kind.
 *
 * Inductive: Q = P * tan(acos(pf)). Capacitive: the negated value.
 * Resistive (and Source): zero.
 */
double deriveReactiveDemand(EntityKind kind, double active_demand, double power_factor);

/**
 * @class GridEntity
 * @brief Common attributes of everything placed on the grid.
 */
class GridEntity {
public:
    GridEntity(EntityId id, std::string bus, EntityKind kind, int grid_x, int grid_y);
    virtual ~GridEntity() = default;

    EntityId id() const { return entity_id; }
    const std::string& bus() const { return bus_name; }
    EntityKind kind() const { return entity_kind; }
    std::string label() const { return entityLabel(entity_kind); }
    int gridX() const { return x; }
    int gridY() const { return y; }
    OperatingStatus status() const { return current_status; }

protected:
    friend class PowerGrid;

    OperatingStatus current_status;

private:
    EntityId entity_id;
    std::string bus_name;
    EntityKind entity_kind;
    int x;
    int y;
};

/**
 * @class Source
 * @brief The power station feeding every connected load.
 *
 * Loading is computed against a fixed capacity, not against the configured
 * nominal power.
 */
class Source : public GridEntity {
public:
    Source(EntityId id, std::string bus, int grid_x, int grid_y, double p_nom_mw, double v_nom_kv);

    double nominalPower() const { return p_nom; }
    double nominalVoltage() const { return v_nom; }
    double voltagePerUnit() const { return voltage_pu; }
    double totalActiveDemand() const { return total_p; }
    double totalReactiveDemand() const { return total_q; }
    double loadingPercent() const { return loading; }

    /// @brief Remaining headroom against the fixed capacity, never negative.
    double availableCapacity() const;
    bool isOverloaded() const { return loading > 1.0; }

    const std::vector<EntityId>& loads() const { return connected_loads; }
    bool hasLoad(EntityId load) const;

private:
    friend class PowerGrid;

    bool attach(EntityId load);
    bool detach(EntityId load);

    double p_nom;
    double v_nom;
    double voltage_pu;
    double total_p;
    double total_q;
    double loading;
    std::vector<EntityId> connected_loads;
};

/**
 * @class Load
 * @brief A consumer with an active demand and a power factor.
 *
 * The reactive demand is re-derived whenever the active demand or the power
 * factor changes. Loads have no voltage of their own.
 */
class Load : public GridEntity {
public:
    Load(EntityId id, std::string bus, EntityKind kind, int grid_x, int grid_y,
         double active_demand, double power_factor);

    double activeDemand() const { return p_demand; }
    double powerFactor() const { return pf; }
    double reactiveDemand() const { return q_demand; }

    /// @brief S = sqrt(P^2 + Q^2), in MVA.
    double apparentPower() const;

    /// @brief P / S, or 1.0 when S is zero.
    double actualPowerFactor() const;

    EntityId source() const { return source_id; }
    bool isConnected() const { return source_id != kInvalidEntityId; }

private:
    friend class PowerGrid;

    void setDemand(double active_demand, double power_factor);

    double p_demand;
    double pf;
    double q_demand;
    EntityId source_id;
};

#endif // GRID_ENTITY_H
