// =================================================================
// include/Warden/ConfigParser.hpp
// =================================================================
// Reads .warden/config.yml into flattened dotted keys.

#pragma once

#include <map>
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief YAML configuration reader
 *
 * Nested mappings are flattened to dotted keys ("apply.max_attempts").
 * Scalar sequences are available through getListValue().
 */
class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the config.yml file. A missing file
     *        yields an empty configuration.
     * @throws std::runtime_error if the file exists but is not valid YAML
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Parse configuration from YAML text
     */
    static ConfigParser fromString(const std::string& yaml_text);

    /**
     * @brief Retrieves a string value for a given key.
     * @param key The configuration key (e.g., "apply.max_attempts").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief Retrieves a list of scalars for a given key.
     * @return The list, empty if not found.
     */
    std::vector<std::string> getListValue(const std::string& key) const;

    /**
     * @brief Direct scalar children of a mapping key
     * @return Child key -> value, empty if not found
     */
    std::map<std::string, std::string> getSection(const std::string& key) const;

    bool hasKey(const std::string& key) const;

    bool isLoaded() const { return m_loaded; }

private:
    ConfigParser() = default;

    void load(const std::string& yaml_text, const std::string& source);

    std::map<std::string, std::string> m_config_values;
    std::map<std::string, std::vector<std::string>> m_list_values;
    bool m_loaded = false;
};

} // namespace Warden
