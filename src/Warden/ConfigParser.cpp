// =================================================================
// src/Warden/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration parser.

#include "Warden/ConfigParser.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Warden {

namespace {

void flatten(const YAML::Node& node, const std::string& prefix,
             std::map<std::string, std::string>& values,
             std::map<std::string, std::vector<std::string>>& lists) {
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            flatten(it->second, prefix.empty() ? key : prefix + "." + key, values, lists);
        }
    } else if (node.IsSequence()) {
        std::vector<std::string> items;
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            if (it->IsScalar()) {
                items.push_back(it->as<std::string>());
            }
        }
        lists[prefix] = items;
    } else if (node.IsScalar()) {
        values[prefix] = node.as<std::string>();
    }
}

} // namespace

ConfigParser::ConfigParser(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        // Not an error before `init` has been run
        return;
    }

    std::stringstream buffer;
    buffer << config_file.rdbuf();
    load(buffer.str(), config_path);
}

ConfigParser ConfigParser::fromString(const std::string& yaml_text) {
    ConfigParser parser;
    parser.load(yaml_text, "<string>");
    return parser;
}

void ConfigParser::load(const std::string& yaml_text, const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid configuration " + source + ": " + e.what());
    }

    if (root.IsNull()) {
        m_loaded = true;
        return;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Invalid configuration " + source + ": top level must be a mapping");
    }

    flatten(root, "", m_config_values, m_list_values);
    m_loaded = true;
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return ""; // Return empty string if key not found
}

std::vector<std::string> ConfigParser::getListValue(const std::string& key) const {
    auto it = m_list_values.find(key);
    if (it != m_list_values.end()) {
        return it->second;
    }
    return {};
}

std::map<std::string, std::string> ConfigParser::getSection(const std::string& key) const {
    std::map<std::string, std::string> section;
    const std::string prefix = key + ".";

    for (auto it = m_config_values.lower_bound(prefix); it != m_config_values.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        std::string child = it->first.substr(prefix.size());
        if (child.find('.') == std::string::npos) {
            section[child] = it->second;
        }
    }
    return section;
}

bool ConfigParser::hasKey(const std::string& key) const {
    return m_config_values.count(key) > 0 || m_list_values.count(key) > 0;
}

} // namespace Warden
