#include "grid_types.hpp"

const std::vector<ComponentKind>& allComponentKinds() {
    static const std::vector<ComponentKind> kinds = {
        ComponentKind::PowerStation,
        ComponentKind::InductiveConsumer,
        ComponentKind::CapacitiveConsumer,
        ComponentKind::ResistiveConsumer
    };
    return kinds;
}

std::string toString(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::PowerStation: return "POWER_STATION";
        case ComponentKind::InductiveConsumer: return "INDUCTIVE_CONSUMER";
        case ComponentKind::CapacitiveConsumer: return "CAPACITIVE_CONSUMER";
        case ComponentKind::ResistiveConsumer: return "RESISTIVE_CONSUMER";
    }
    return "UNKNOWN";
}

std::optional<ComponentKind> parseComponentKind(const std::string& text) {
    for (ComponentKind kind : allComponentKinds()) {
        if (toString(kind) == text) return kind;
    }
    return std::nullopt;
}

std::string toString(EntityKind kind) {
    switch (kind) {
        case EntityKind::Source: return "Source";
        case EntityKind::InductiveLoad: return "InductiveLoad";
        case EntityKind::CapacitiveLoad: return "CapacitiveLoad";
        case EntityKind::ResistiveLoad: return "ResistiveLoad";
    }
    return "Unknown";
}

std::string toString(OperatingStatus status) {
    switch (status) {
        case OperatingStatus::Normal: return "Normal";
        case OperatingStatus::Warning: return "Warning";
        case OperatingStatus::Critical: return "Critical";
        case OperatingStatus::Inactive: return "Inactive";
    }
    return "Unknown";
}

std::string entityLabel(EntityKind kind) {
    switch (kind) {
        case EntityKind::Source: return "PS";
        case EntityKind::InductiveLoad: return "CI";
        case EntityKind::CapacitiveLoad: return "CC";
        case EntityKind::ResistiveLoad: return "CR";
    }
    return "??";
}

ComponentKind componentKindFor(EntityKind kind) {
    switch (kind) {
        case EntityKind::Source: return ComponentKind::PowerStation;
        case EntityKind::InductiveLoad: return ComponentKind::InductiveConsumer;
        case EntityKind::CapacitiveLoad: return ComponentKind::CapacitiveConsumer;
        case EntityKind::ResistiveLoad: return ComponentKind::ResistiveConsumer;
    }
    return ComponentKind::PowerStation;
}

std::string eventTag(ConfigEvent event) {
    switch (event) {
        case ConfigEvent::ConfigChanged: return "config_changed";
        case ConfigEvent::PresetSaved: return "instance_saved";
        case ConfigEvent::PresetDeleted: return "instance_deleted";
    }
    return "unknown";
}
