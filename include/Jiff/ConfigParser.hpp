// =================================================================
// include/Jiff/ConfigParser.hpp
// =================================================================
// Defines the parser for the jiff YAML configuration file.

#pragma once

#include <string>
#include <map>

namespace Jiff {

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     *
     * Nested maps are flattened into dotted keys, so
     * `side_by_side: {width: 160}` is read back as "side_by_side.width".
     * A missing file yields an empty configuration; a malformed one is
     * reported as a warning and also yields an empty configuration.
     * @param config_path The path to the config.yml file.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Retrieves a string value for a given key.
     * @param key The configuration key (e.g., "context_lines").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief True if the file existed and parsed.
     */
    bool isLoaded() const;

private:
    std::map<std::string, std::string> m_config_values;
    bool m_loaded = false;
};

} // namespace Jiff
