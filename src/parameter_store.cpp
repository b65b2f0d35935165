#include "parameter_store.hpp"
#include <iostream>
#include <sstream>

namespace {

std::string format_value(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string key_name(ComponentKind kind, const std::string& name) {
    return toString(kind) + "." + name;
}

} // namespace

ParameterStore::ParameterStore(Database& database, const std::vector<ParameterDefinition>& seed)
    : db(database), revision_counter(0) {
    createSchema();
    seedDefinitions(seed);
    loadDefinitions();
    loadOverrides();
}

void ParameterStore::createSchema() {
    db.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS ComponentParameterDefaults (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            component_kind TEXT NOT NULL,
            parameter_name TEXT NOT NULL,
            default_value REAL NOT NULL,
            min_value REAL NOT NULL,
            max_value REAL NOT NULL,
            description TEXT,
            unit TEXT,
            UNIQUE(component_kind, parameter_name)
        );
        CREATE TABLE IF NOT EXISTS ParameterOverrides (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            component_kind TEXT NOT NULL,
            parameter_name TEXT NOT NULL,
            value REAL NOT NULL,
            last_modified TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            UNIQUE(component_kind, parameter_name)
        );
    )SQL");
}

void ParameterStore::seedDefinitions(const std::vector<ParameterDefinition>& seed) {
    Transaction txn(db);
    Statement insert = db.prepare(
        "INSERT OR IGNORE INTO ComponentParameterDefaults "
        "(component_kind, parameter_name, default_value, min_value, max_value, description, unit) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    for (const auto& def : seed) {
        insert.reset();
        insert.bind(1, toString(def.kind));
        insert.bind(2, def.name);
        insert.bind(3, def.default_value);
        insert.bind(4, def.min_value);
        insert.bind(5, def.max_value);
        insert.bind(6, def.description);
        insert.bind(7, def.unit);
        insert.step();
    }
    txn.commit();
}

void ParameterStore::loadDefinitions() {
    definitions_by_key.clear();
    Statement query = db.prepare(
        "SELECT component_kind, parameter_name, default_value, min_value, max_value, description, unit "
        "FROM ComponentParameterDefaults");
    while (query.step()) {
        auto kind = parseComponentKind(query.columnText(0));
        if (!kind) {
            std::cerr << "Warning: Ignoring definition for unknown component kind "
                      << query.columnText(0) << std::endl;
            continue;
        }
        ParameterDefinition def;
        def.kind = *kind;
        def.name = query.columnText(1);
        def.default_value = query.columnDouble(2);
        def.min_value = query.columnDouble(3);
        def.max_value = query.columnDouble(4);
        def.description = query.columnText(5);
        def.unit = query.columnText(6);
        definitions_by_key[{def.kind, def.name}] = def;
    }
}

void ParameterStore::loadOverrides() {
    overrides.clear();
    Statement query = db.prepare("SELECT component_kind, parameter_name, value FROM ParameterOverrides");
    while (query.step()) {
        auto kind = parseComponentKind(query.columnText(0));
        if (!kind) continue;
        Key key{*kind, query.columnText(1)};
        auto def = definitions_by_key.find(key);
        if (def == definitions_by_key.end()) {
            std::cerr << "Warning: Ignoring override for undefined parameter "
                      << key_name(key.first, key.second) << std::endl;
            continue;
        }
        const double value = query.columnDouble(2);
        if (!(value >= def->second.min_value && value <= def->second.max_value)) {
            std::cerr << "Warning: Ignoring out of range override " << key_name(key.first, key.second)
                      << " = " << format_value(value) << std::endl;
            continue;
        }
        overrides[key] = value;
    }
}

const ParameterDefinition* ParameterStore::findDefinition(ComponentKind kind, const std::string& name) const {
    auto it = definitions_by_key.find({kind, name});
    if (it == definitions_by_key.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<ParameterDefinition> ParameterStore::definitions(ComponentKind kind) const {
    std::vector<ParameterDefinition> result;
    for (const auto& pair : definitions_by_key) {
        if (pair.first.first == kind) {
            result.push_back(pair.second);
        }
    }
    return result;
}

std::optional<double> ParameterStore::getEffective(ComponentKind kind, const std::string& name) const {
    const ParameterDefinition* def = findDefinition(kind, name);
    if (!def) {
        return std::nullopt;
    }
    auto it = overrides.find({kind, name});
    if (it != overrides.end()) {
        return it->second;
    }
    return def->default_value;
}

ParameterSnapshot ParameterStore::getEffective(ComponentKind kind) const {
    ParameterSnapshot snapshot;
    for (const auto& pair : definitions_by_key) {
        if (pair.first.first != kind) continue;
        auto it = overrides.find(pair.first);
        snapshot[pair.first.second] = (it != overrides.end()) ? it->second : pair.second.default_value;
    }
    return snapshot;
}

std::optional<double> ParameterStore::getOverride(ComponentKind kind, const std::string& name) const {
    auto it = overrides.find({kind, name});
    if (it == overrides.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result ParameterStore::validate(ComponentKind kind, const std::string& name, double value) const {
    const ParameterDefinition* def = findDefinition(kind, name);
    if (!def) {
        return Result::failure(ErrorCode::UnknownParameter, "Unknown parameter " + key_name(kind, name));
    }
    // written so that NaN fails as well
    if (!(value >= def->min_value && value <= def->max_value)) {
        return Result::failure(ErrorCode::OutOfRange,
                               "Value must be between " + format_value(def->min_value) + " and " +
                                   format_value(def->max_value) + " " + def->unit);
    }
    return Result::ok("Value is valid");
}

Result ParameterStore::setOverride(ComponentKind kind, const std::string& name, double value) {
    Result check = validate(kind, name, value);
    if (!check.success) {
        return check;
    }

    try {
        Statement upsert = db.prepare(
            "INSERT OR REPLACE INTO ParameterOverrides "
            "(component_kind, parameter_name, value, last_modified) "
            "VALUES (?, ?, ?, CURRENT_TIMESTAMP)");
        upsert.bind(1, toString(kind));
        upsert.bind(2, name);
        upsert.bind(3, value);
        upsert.step();
    } catch (const PersistenceError& e) {
        return Result::failure(ErrorCode::Persistence, std::string("Error saving configuration: ") + e.what());
    }

    overrides[{kind, name}] = value;
    ++revision_counter;
    return Result::ok("Configuration saved successfully");
}

Result ParameterStore::setOverrides(ComponentKind kind, const ParameterSnapshot& values) {
    for (const auto& pair : values) {
        Result check = validate(kind, pair.first, pair.second);
        if (!check.success) {
            return Result::failure(check.error, pair.first + ": " + check.message);
        }
    }

    try {
        Transaction txn(db);
        Statement upsert = db.prepare(
            "INSERT OR REPLACE INTO ParameterOverrides "
            "(component_kind, parameter_name, value, last_modified) "
            "VALUES (?, ?, ?, CURRENT_TIMESTAMP)");
        for (const auto& pair : values) {
            upsert.reset();
            upsert.bind(1, toString(kind));
            upsert.bind(2, pair.first);
            upsert.bind(3, pair.second);
            upsert.step();
        }
        txn.commit();
    } catch (const PersistenceError& e) {
        return Result::failure(ErrorCode::Persistence, std::string("Error saving configuration: ") + e.what());
    }

    for (const auto& pair : values) {
        overrides[{kind, pair.first}] = pair.second;
    }
    ++revision_counter;
    return Result::ok("Configuration saved successfully");
}

Result ParameterStore::resetOverride(ComponentKind kind, const std::optional<std::string>& name) {
    if (name && !findDefinition(kind, *name)) {
        return Result::failure(ErrorCode::UnknownParameter, "Unknown parameter " + key_name(kind, *name));
    }

    try {
        if (name) {
            Statement del = db.prepare(
                "DELETE FROM ParameterOverrides WHERE component_kind = ? AND parameter_name = ?");
            del.bind(1, toString(kind));
            del.bind(2, *name);
            del.step();
        } else {
            Statement del = db.prepare("DELETE FROM ParameterOverrides WHERE component_kind = ?");
            del.bind(1, toString(kind));
            del.step();
        }
    } catch (const PersistenceError& e) {
        return Result::failure(ErrorCode::Persistence, std::string("Error resetting configuration: ") + e.what());
    }

    ++revision_counter;
    if (name) {
        overrides.erase({kind, *name});
        return Result::ok("Reset " + *name + " to its default value");
    }
    for (auto it = overrides.begin(); it != overrides.end();) {
        if (it->first.first == kind) {
            it = overrides.erase(it);
        } else {
            ++it;
        }
    }
    return Result::ok("Reset all parameters to default values");
}
