#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "grid_types.hpp"
#include <string>
#include <vector>

/**
 * @class ConfigLoader
 * @brief Parses the YAML grid profile to populate the Config structure.
 *
 * This class uses the yaml-cpp library to read the simulation parameters,
 * the database location and the seeded parameter definitions of every
 * component kind.
 */
class ConfigLoader {
public:
    /**
     * @brief Loads and parses the YAML profile file.
     * @param filename The path to the YAML profile.
     * @return A Config object populated with data from the file.
     * @throw YAML::Exception if the file cannot be opened or parsed.
     * @throw std::runtime_error if a parameter definition is inconsistent.
     */
    static Config loadConfig(const std::string& filename);

    /**
     * @brief Parses a YAML profile held in memory.
     * @param text The YAML document.
     * @return A Config object populated with data from the document.
     */
    static Config loadConfigFromString(const std::string& text);

    /**
     * @brief The parameter definitions used when a profile declares none.
     */
    static std::vector<ParameterDefinition> builtinDefinitions();
};

#endif // CONFIG_LOADER_H
