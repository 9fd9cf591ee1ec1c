// =================================================================
// include/Tandem/ConfigurationStore.hpp
// =================================================================
// Key-value persistence interface for user configuration.

#pragma once

#include <string>

namespace Tandem {

/**
 * @brief Opaque key-value store for persisted settings
 *
 * Keys are dotted paths ("models.coder.tier"); values are strings.
 */
class ConfigurationStore {
public:
    virtual ~ConfigurationStore() = default;

    /**
     * @brief Retrieve the value for a key
     * @return The stored value, or an empty string if not found
     */
    virtual std::string getStringValue(const std::string& key) const = 0;

    virtual bool hasValue(const std::string& key) const = 0;

    virtual void setValue(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Persist pending changes
     * @return True on success
     */
    virtual bool save() = 0;
};

} // namespace Tandem
