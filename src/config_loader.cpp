#include "config_loader.hpp"
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <stdexcept>

namespace {

ComponentKind to_kind(const std::string& s) {
    auto kind = parseComponentKind(s);
    if (!kind) {
        throw std::runtime_error("Invalid component kind: " + s);
    }
    return *kind;
}

void check_definition(const ParameterDefinition& def) {
    const std::string key = toString(def.kind) + "." + def.name;
    if (def.min_value > def.max_value) {
        throw std::runtime_error("Parameter " + key + " has min greater than max");
    }
    if (def.default_value < def.min_value || def.default_value > def.max_value) {
        throw std::runtime_error("Parameter " + key + " has a default outside its range");
    }
}

Config parse_root(const YAML::Node& root) {
    Config config;

    // Load Simulation Parameters
    if (const auto& sim_node = root["simulation_parameters"]) {
        if (sim_node["update_interval_ms"]) {
            config.sim_params.update_interval_ms = sim_node["update_interval_ms"].as<int>();
        }
        if (sim_node["max_log_messages"]) {
            config.sim_params.max_log_messages = sim_node["max_log_messages"].as<int>();
        }
    }
    if (config.sim_params.update_interval_ms <= 0) {
        throw std::runtime_error("update_interval_ms must be positive");
    }
    if (config.sim_params.max_log_messages <= 0) {
        throw std::runtime_error("max_log_messages must be positive");
    }

    // Load Persistence
    if (const auto& db_node = root["persistence"]) {
        if (db_node["database_path"]) {
            config.persistence.database_path = db_node["database_path"].as<std::string>();
        }
    }

    // Load Parameter Definitions
    const auto& defs_node = root["parameter_definitions"];
    if (!defs_node) {
        config.parameters = ConfigLoader::builtinDefinitions();
        return config;
    }

    for (const auto& kind_entry : defs_node) {
        const ComponentKind kind = to_kind(kind_entry.first.as<std::string>());
        for (const auto& param_entry : kind_entry.second) {
            const auto& node = param_entry.second;
            ParameterDefinition def;
            def.kind = kind;
            def.name = param_entry.first.as<std::string>();
            def.default_value = node["default"].as<double>();
            def.min_value = node["min"].as<double>();
            def.max_value = node["max"].as<double>();
            def.description = node["description"] ? node["description"].as<std::string>() : std::string();
            def.unit = node["units"] ? node["units"].as<std::string>() : std::string();
            check_definition(def);
            config.parameters.push_back(def);
        }
    }
    return config;
}

} // namespace

Config ConfigLoader::loadConfig(const std::string& filename) {
    YAML::Node root = YAML::LoadFile(filename);
    Config config = parse_root(root);
    std::cout << "Loaded " << config.parameters.size() << " parameter definitions from " << filename << std::endl;
    return config;
}

Config ConfigLoader::loadConfigFromString(const std::string& text) {
    return parse_root(YAML::Load(text));
}

std::vector<ParameterDefinition> ConfigLoader::builtinDefinitions() {
    return {
        {ComponentKind::PowerStation, "p_nom_mw", 1000.0, 100.0, 5000.0, "Nominal Power Capacity", "MW"},
        {ComponentKind::PowerStation, "v_nom_kv", 110.0, 11.0, 400.0, "Nominal Voltage", "kV"},
        {ComponentKind::InductiveConsumer, "p_demand_rate", 5.0, 0.1, 100.0, "Power Demand", "MW"},
        {ComponentKind::InductiveConsumer, "power_factor", 0.8, 0.5, 0.95, "Power Factor", "pu"},
        {ComponentKind::CapacitiveConsumer, "p_demand_rate", 5.0, 0.1, 100.0, "Power Demand", "MW"},
        {ComponentKind::CapacitiveConsumer, "power_factor", 0.9, 0.85, 1.0, "Power Factor", "pu"},
        {ComponentKind::ResistiveConsumer, "p_demand_rate", 5.0, 0.1, 100.0, "Power Demand", "MW"},
        {ComponentKind::ResistiveConsumer, "power_factor", 1.0, 0.98, 1.0, "Power Factor", "pu"},
    };
}
