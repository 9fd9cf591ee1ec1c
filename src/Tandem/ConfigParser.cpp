// =================================================================
// src/Tandem/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration parser.

#include "Tandem/ConfigParser.hpp"
#include "Tandem/Errors.hpp"
#include "Tandem/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace Tandem {

namespace {

void flatten(const YAML::Node& node, const std::string& prefix,
             std::map<std::string, std::string>& out) {
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            flatten(it->second, prefix.empty() ? key : prefix + "." + key, out);
        }
    } else if (node.IsSequence()) {
        std::ostringstream joined;
        for (size_t i = 0; i < node.size(); ++i) {
            if (i > 0) joined << ",";
            joined << node[i].as<std::string>();
        }
        out[prefix] = joined.str();
    } else if (node.IsScalar()) {
        out[prefix] = node.as<std::string>();
    }
}

std::vector<std::string> splitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::istringstream stream(key);
    std::string part;
    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

void insert(YAML::Node parent, const std::vector<std::string>& parts, size_t index,
            const std::string& value) {
    if (index + 1 == parts.size()) {
        parent[parts[index]] = value;
        return;
    }
    YAML::Node child = parent[parts[index]];
    insert(child, parts, index + 1, value);
}

} // namespace

ConfigParser::ConfigParser(const std::string& config_path) : m_config_path(config_path) {
    if (!std::filesystem::exists(config_path)) {
        // It's okay if the file doesn't exist, e.g. before `config save` is run.
        return;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        if (root.IsMap()) {
            flatten(root, "", m_config_values);
        }
        m_loaded = true;
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse " + config_path + ": " + e.what());
    }

    Logger::getInstance().debug("ConfigParser", "Configuration loaded",
        config_path + ", " + std::to_string(m_config_values.size()) + " keys");
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return "";
}

bool ConfigParser::hasValue(const std::string& key) const {
    return m_config_values.count(key) > 0;
}

void ConfigParser::setValue(const std::string& key, const std::string& value) {
    m_config_values[key] = value;
}

std::vector<std::string> ConfigParser::getListValue(const std::string& key) const {
    std::vector<std::string> items;
    std::istringstream stream(getStringValue(key));
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool ConfigParser::save() {
    YAML::Node root(YAML::NodeType::Map);
    for (const auto& [key, value] : m_config_values) {
        auto parts = splitKey(key);
        if (parts.empty()) {
            continue;
        }
        insert(root, parts, 0, value);
    }

    std::error_code ec;
    auto parent = std::filesystem::path(m_config_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            Logger::getInstance().error("ConfigParser", "Cannot create config directory", ec.message());
            return false;
        }
    }

    std::ofstream out(m_config_path);
    if (!out.is_open()) {
        Logger::getInstance().error("ConfigParser", "Cannot write configuration", m_config_path);
        return false;
    }

    YAML::Emitter emitter;
    emitter << root;
    out << emitter.c_str() << "\n";
    m_loaded = true;

    Logger::getInstance().info("ConfigParser", "Configuration saved", m_config_path);
    return out.good();
}

} // namespace Tandem
