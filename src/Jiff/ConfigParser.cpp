// =================================================================
// src/Jiff/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration parser.

#include "Jiff/ConfigParser.hpp"
#include "Jiff/Logger.hpp"
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace Jiff {

// Collects every scalar below `node` under its dotted path.
static void flattenNode(const YAML::Node& node, const std::string& prefix,
                        std::map<std::string, std::string>& values) {
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            flattenNode(it->second, prefix.empty() ? key : prefix + "." + key, values);
        }
    } else if (node.IsScalar()) {
        values[prefix] = node.as<std::string>();
    }
}

ConfigParser::ConfigParser(const std::string& config_path) {
    if (config_path.empty() || !std::filesystem::exists(config_path)) {
        // It's okay if the file doesn't exist; defaults apply.
        return;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        flattenNode(root, "", m_config_values);
        m_loaded = true;
    } catch (const YAML::Exception& e) {
        m_config_values.clear();
        Logger::getInstance().warning("ConfigParser",
            "Failed to parse configuration file, using defaults: " + std::string(e.what()),
            config_path);
    }
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return ""; // Return empty string if key not found
}

bool ConfigParser::isLoaded() const {
    return m_loaded;
}

} // namespace Jiff
