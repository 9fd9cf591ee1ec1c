// =================================================================
// include/Tandem/ConfigParser.hpp
// =================================================================
// YAML-backed configuration file reader and writer.

#pragma once

#include "Tandem/ConfigurationStore.hpp"
#include <string>
#include <map>
#include <vector>

namespace Tandem {

/**
 * @brief Reads .tandem/config.yml into flat dotted keys
 *
 * Nested maps are flattened ("ollama: {server_url: x}" becomes
 * "ollama.server_url"); sequences are kept as comma-joined strings.
 * Writes go back to the same file as nested YAML on save().
 */
class ConfigParser : public ConfigurationStore {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the config.yml file.
     *
     * A missing file yields an empty configuration; a malformed one
     * throws ConfigurationError.
     */
    explicit ConfigParser(const std::string& config_path);

    std::string getStringValue(const std::string& key) const override;
    bool hasValue(const std::string& key) const override;
    void setValue(const std::string& key, const std::string& value) override;
    bool save() override;

    /**
     * @brief Retrieve a sequence value
     * @param key Configuration key
     * @return Items of the sequence, empty when absent
     */
    std::vector<std::string> getListValue(const std::string& key) const;

    const std::string& getPath() const { return m_config_path; }

    bool isLoaded() const { return m_loaded; }

private:
    std::string m_config_path;
    std::map<std::string, std::string> m_config_values;
    bool m_loaded = false;
};

} // namespace Tandem
