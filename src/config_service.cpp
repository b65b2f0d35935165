#include "config_service.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>

using json = nlohmann::json;

namespace {

std::string encode_parameters(const ParameterSnapshot& parameters) {
    json j = json::object();
    for (const auto& pair : parameters) {
        j[pair.first] = pair.second;
    }
    return j.dump();
}

ParameterSnapshot decode_parameters(const std::string& text) {
    json j = json::parse(text);
    if (!j.is_object()) {
        throw PersistenceError("preset parameters are not an object");
    }
    ParameterSnapshot parameters;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number()) {
            throw PersistenceError("preset parameter '" + it.key() + "' is not a number");
        }
        parameters[it.key()] = it.value().get<double>();
    }
    return parameters;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

ConfigurationService::ConfigurationService(Database& database, ParameterStore& parameter_store)
    : db(database), store(parameter_store), snapshot_revision(0), next_subscription_id(1), dispatching(false) {
    db.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS Presets (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT UNIQUE NOT NULL,
            description TEXT,
            component_kind TEXT NOT NULL,
            parameters_json TEXT NOT NULL,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        );
    )SQL");
    rebuildSnapshot();
}

void ConfigurationService::rebuildSnapshot() const {
    // The whole table is recomputed on every write, not just the changed kind.
    ConfigurationSnapshot fresh;
    for (ComponentKind kind : allComponentKinds()) {
        fresh[kind] = store.getEffective(kind);
    }
    snapshot = std::move(fresh);
    snapshot_revision = store.revision();
}

const ConfigurationSnapshot& ConfigurationService::current() const {
    if (snapshot_revision != store.revision()) {
        rebuildSnapshot();
    }
    return snapshot;
}

ParameterSnapshot ConfigurationService::getEffective(ComponentKind kind) const {
    const ConfigurationSnapshot& table = current();
    auto it = table.find(kind);
    if (it == table.end()) {
        return {};
    }
    return it->second;
}

std::optional<double> ConfigurationService::getEffective(ComponentKind kind, const std::string& name) const {
    const ConfigurationSnapshot& table = current();
    auto it = table.find(kind);
    if (it == table.end()) {
        return std::nullopt;
    }
    auto param = it->second.find(name);
    if (param == it->second.end()) {
        return std::nullopt;
    }
    return param->second;
}

std::vector<ParameterDefinition> ConfigurationService::definitions(ComponentKind kind) const {
    return store.definitions(kind);
}

Result ConfigurationService::rejectIfDispatching() const {
    if (dispatching) {
        return Result::failure(ErrorCode::ReentrantCall,
                               "Configuration cannot be modified from a change listener");
    }
    return Result::ok("");
}

Result ConfigurationService::save(ComponentKind kind, const std::string& name, double value) {
    Result guard = rejectIfDispatching();
    if (!guard.success) return guard;

    Result result = store.setOverride(kind, name, value);
    if (!result.success) {
        return result;
    }
    rebuildSnapshot();
    notify(ConfigEvent::ConfigChanged);
    return result;
}

Result ConfigurationService::reset(ComponentKind kind, const std::optional<std::string>& name) {
    Result guard = rejectIfDispatching();
    if (!guard.success) return guard;

    Result result = store.resetOverride(kind, name);
    if (!result.success) {
        return result;
    }
    rebuildSnapshot();
    notify(ConfigEvent::ConfigChanged);
    return result;
}

Result ConfigurationService::savePreset(const std::string& name, ComponentKind kind, const std::string& description) {
    Result guard = rejectIfDispatching();
    if (!guard.success) return guard;

    if (is_blank(name)) {
        return Result::failure(ErrorCode::NameRequired, "Name is required");
    }

    const ParameterSnapshot parameters = getEffective(kind);
    try {
        Statement insert = db.prepare(
            "INSERT INTO Presets (name, description, component_kind, parameters_json) VALUES (?, ?, ?, ?)");
        insert.bind(1, name);
        insert.bind(2, description);
        insert.bind(3, toString(kind));
        insert.bind(4, encode_parameters(parameters));
        insert.step();
    } catch (const ConstraintError&) {
        return Result::failure(ErrorCode::DuplicateName, "An instance named '" + name + "' already exists");
    } catch (const PersistenceError& e) {
        return Result::failure(ErrorCode::Persistence, std::string("Error saving instance: ") + e.what());
    }

    notify(ConfigEvent::PresetSaved);
    return Result::ok("Saved instance '" + name + "' successfully");
}

Result ConfigurationService::loadPreset(std::int64_t id, ParameterSnapshot& parameters) const {
    try {
        Statement query = db.prepare("SELECT parameters_json FROM Presets WHERE id = ?");
        query.bind(1, id);
        if (!query.step()) {
            return Result::failure(ErrorCode::NotFound, "No saved instance with id " + std::to_string(id));
        }
        parameters = decode_parameters(query.columnText(0));
    } catch (const PersistenceError& e) {
        return Result::failure(ErrorCode::Persistence, std::string("Error loading instance: ") + e.what());
    } catch (const json::exception& e) {
        return Result::failure(ErrorCode::Persistence, std::string("Saved instance is corrupt: ") + e.what());
    }
    return Result::ok("Loaded instance " + std::to_string(id));
}

Result ConfigurationService::applyPreset(std::int64_t id) {
    Result guard = rejectIfDispatching();
    if (!guard.success) return guard;

    std::optional<Preset> preset;
    for (const auto& candidate : listPresets()) {
        if (candidate.id == id) {
            preset = candidate;
            break;
        }
    }
    if (!preset) {
        return Result::failure(ErrorCode::NotFound, "No saved instance with id " + std::to_string(id));
    }

    Result result = store.setOverrides(preset->kind, preset->parameters);
    if (!result.success) {
        return result;
    }
    rebuildSnapshot();
    notify(ConfigEvent::ConfigChanged);
    return Result::ok("Applied instance '" + preset->name + "'");
}

Result ConfigurationService::deletePreset(std::int64_t id) {
    Result guard = rejectIfDispatching();
    if (!guard.success) return guard;

    try {
        Statement del = db.prepare("DELETE FROM Presets WHERE id = ?");
        del.bind(1, id);
        del.step();
    } catch (const PersistenceError& e) {
        return Result::failure(ErrorCode::Persistence, std::string("Error deleting instance: ") + e.what());
    }

    if (db.changes() == 0) {
        return Result::failure(ErrorCode::NotFound, "No saved instance with id " + std::to_string(id));
    }
    notify(ConfigEvent::PresetDeleted);
    return Result::ok("Instance deleted successfully");
}

Preset ConfigurationService::readPreset(const Statement& row) const {
    Preset preset;
    preset.id = row.columnInt64(0);
    preset.name = row.columnText(1);
    preset.description = row.columnText(2);
    auto kind = parseComponentKind(row.columnText(3));
    if (!kind) {
        throw PersistenceError("unknown component kind '" + row.columnText(3) + "'");
    }
    preset.kind = *kind;
    preset.parameters = decode_parameters(row.columnText(4));
    preset.created_at = row.columnText(5);
    return preset;
}

std::vector<Preset> ConfigurationService::listPresets(std::optional<ComponentKind> kind) const {
    std::vector<Preset> presets;
    try {
        Statement query = kind
            ? db.prepare("SELECT id, name, description, component_kind, parameters_json, created_at "
                         "FROM Presets WHERE component_kind = ? ORDER BY id")
            : db.prepare("SELECT id, name, description, component_kind, parameters_json, created_at "
                         "FROM Presets ORDER BY id");
        if (kind) {
            query.bind(1, toString(*kind));
        }
        while (query.step()) {
            try {
                presets.push_back(readPreset(query));
            } catch (const json::exception& e) {
                std::cerr << "Warning: Skipping corrupt saved instance " << query.columnInt64(0)
                          << ": " << e.what() << std::endl;
            } catch (const PersistenceError& e) {
                std::cerr << "Warning: Skipping corrupt saved instance " << query.columnInt64(0)
                          << ": " << e.what() << std::endl;
            }
        }
    } catch (const PersistenceError& e) {
        std::cerr << "Error listing saved instances: " << e.what() << std::endl;
    }
    return presets;
}

std::optional<Preset> ConfigurationService::findPreset(const std::string& name) const {
    for (const auto& preset : listPresets()) {
        if (preset.name == name) {
            return preset;
        }
    }
    return std::nullopt;
}

SubscriptionId ConfigurationService::subscribe(ConfigListener listener) {
    SubscriptionId id = next_subscription_id++;
    listeners.emplace_back(id, std::move(listener));
    return id;
}

bool ConfigurationService::unsubscribe(SubscriptionId id) {
    auto it = std::find_if(listeners.begin(), listeners.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == listeners.end()) {
        return false;
    }
    listeners.erase(it);
    return true;
}

void ConfigurationService::notify(ConfigEvent event) {
    // Dispatch over a copy so subscribe/unsubscribe from a listener is safe.
    const auto targets = listeners;
    dispatching = true;
    try {
        for (const auto& entry : targets) {
            entry.second(event);
        }
    } catch (...) {
        dispatching = false;
        throw;
    }
    dispatching = false;
}
