// =================================================================
// src/Tandem/ModelTierManager.cpp
// =================================================================
// Implementation of memory detection and configuration analysis.

#include "Tandem/ModelTierManager.hpp"
#include "Tandem/Errors.hpp"
#include "Tandem/Logger.hpp"
#include <unistd.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace Tandem {

namespace {

// Share of the ratings contributed by each role
double roleWeight(AgentRole role) {
    switch (role) {
        case AgentRole::ORCHESTRATOR: return 0.35;
        case AgentRole::CODER: return 0.35;
        case AgentRole::RESEARCHER: return 0.2;
        case AgentRole::VISION: return 0.1;
    }
    return 0.0;
}

std::string formatGB(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << " GB";
    return oss.str();
}

CustomConfiguration enabledOnly(const CustomConfiguration& config) {
    CustomConfiguration enabled;
    for (const auto& selection : config) {
        if (selection.enabled) {
            enabled.push_back(selection);
        }
    }
    return enabled;
}

double ramFor(const ModelSelection& selection) {
    return ModelCatalog::getVariant(selection.role, selection.tier).estimated_ram_gb;
}

} // namespace

ModelTierManager::ModelTierManager(const TierManagerConfig& config) : m_config(config) {
    if (m_config.overhead_factor < 1.0) {
        throw ConfigurationError("overhead_factor must be at least 1.0");
    }
    if (m_config.safety_factor <= 0.0 || m_config.safety_factor > 1.0) {
        throw ConfigurationError("safety_factor must be in (0, 1]");
    }

    if (m_config.system_ram_gb > 0.0) {
        m_system_ram_gb = m_config.system_ram_gb;
    } else {
        m_system_ram_gb = detectSystemRAM();
        if (m_system_ram_gb <= 0.0) {
            m_system_ram_gb = m_config.fallback_ram_gb;
            m_ram_fallback = true;
            TANDEM_LOG_WARNING("ModelTierManager", "Could not detect system RAM, assuming " + formatGB(m_system_ram_gb));
        }
    }

    m_recommended_tier = recommendedTier(m_system_ram_gb);
    m_active_configuration = createDefaultConfiguration();

    Logger::getInstance().info("ModelTierManager", "Initialized",
        "RAM: " + formatGB(m_system_ram_gb) + ", tier: " + ModelCatalog::tierToString(m_recommended_tier));
}

double ModelTierManager::detectSystemRAM() {
    long pages = sysconf(_SC_PHYS_PAGES);
    long page_size = sysconf(_SC_PAGE_SIZE);
    if (pages > 0 && page_size > 0) {
        double bytes = static_cast<double>(pages) * static_cast<double>(page_size);
        return std::round(bytes / (1024.0 * 1024.0 * 1024.0));
    }

    std::ifstream meminfo("/proc/meminfo");
    std::string label;
    while (meminfo >> label) {
        if (label == "MemTotal:") {
            double kilobytes = 0.0;
            if (meminfo >> kilobytes) {
                return std::round(kilobytes / (1024.0 * 1024.0));
            }
            break;
        }
        meminfo.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }

    return 0.0;
}

double ModelTierManager::getUsableRAM() const {
    return m_system_ram_gb * m_config.safety_factor;
}

ModelTier ModelTierManager::recommendedTier(double ram_gb) const {
    if (ram_gb >= m_config.large_tier_min_ram_gb) {
        return ModelTier::LARGE;
    }
    if (ram_gb >= m_config.medium_tier_min_ram_gb) {
        return ModelTier::MEDIUM;
    }
    return ModelTier::SMALL;
}

double ModelTierManager::tierMinimumRAM(ModelTier tier) const {
    switch (tier) {
        case ModelTier::SMALL: return m_config.small_tier_min_ram_gb;
        case ModelTier::MEDIUM: return m_config.medium_tier_min_ram_gb;
        case ModelTier::LARGE: return m_config.large_tier_min_ram_gb;
    }
    return 0.0;
}

CustomConfiguration ModelTierManager::createDefaultConfiguration() const {
    CustomConfiguration config;
    for (AgentRole role : AgentCapabilityUtils::allRoles()) {
        config.push_back({role, m_recommended_tier, true});
    }
    return config;
}

std::vector<std::pair<ModelTier, ModelVariant>> ModelTierManager::getModelOptions(AgentRole role) const {
    return ModelCatalog::getOptions(role);
}

ConfigurationAnalysis ModelTierManager::analyzeConfiguration(const CustomConfiguration& config) const {
    ConfigurationAnalysis analysis;
    CustomConfiguration enabled = enabledOnly(config);

    if (enabled.empty()) {
        analysis.can_fit = true;
        analysis.recommendation = "Select at least one model.";
        return analysis;
    }

    double raw_ram = 0.0;
    double weighted_quality = 0.0;
    double weighted_speed = 0.0;
    double total_weight = 0.0;

    for (const auto& selection : enabled) {
        const ModelVariant& variant = ModelCatalog::getVariant(selection.role, selection.tier);
        analysis.total_disk_gb += variant.disk_size_gb;
        raw_ram += variant.estimated_ram_gb;

        double weight = roleWeight(selection.role);
        weighted_quality += weight * variant.quality;
        weighted_speed += weight * variant.speed;
        total_weight += weight;

        std::ostringstream description;
        description << AgentCapabilityUtils::profile(selection.role).display_name << ": "
                    << variant.name << " (" << variant.parameter_count << ", "
                    << formatGB(variant.disk_size_gb) << " disk, ~"
                    << formatGB(variant.estimated_ram_gb * m_config.overhead_factor) << " RAM)";
        analysis.model_descriptions.push_back(description.str());
    }

    analysis.estimated_ram_gb = raw_ram * m_config.overhead_factor;
    analysis.can_fit = analysis.estimated_ram_gb <= getUsableRAM();

    analysis.quality_rating = total_weight > 0.0 ? weighted_quality / total_weight : 0.0;
    analysis.speed_rating = total_weight > 0.0 ? weighted_speed / total_weight : 0.0;
    if (!analysis.can_fit) {
        // Models will be swapped through memory on every switch
        analysis.speed_rating /= 2.0;
    }

    analysis.recommendation = buildRecommendation(enabled, analysis.estimated_ram_gb, analysis.can_fit);
    return analysis;
}

std::string ModelTierManager::buildRecommendation(const CustomConfiguration& enabled,
                                                  double estimated_ram_gb, bool can_fit) const {
    double usable = getUsableRAM();
    std::ostringstream text;

    if (!can_fit) {
        // Largest tier first, heaviest model within a tier
        auto largest = std::max_element(enabled.begin(), enabled.end(),
            [](const ModelSelection& a, const ModelSelection& b) {
                if (a.tier != b.tier) {
                    return ModelCatalog::tierRank(a.tier) < ModelCatalog::tierRank(b.tier);
                }
                return ramFor(a) < ramFor(b);
            });

        const std::string& name = AgentCapabilityUtils::profile(largest->role).display_name;
        if (largest->tier != ModelTier::SMALL) {
            ModelTier lower = static_cast<ModelTier>(ModelCatalog::tierRank(largest->tier) - 1);
            text << "Downgrade " << name << " from " << ModelCatalog::tierToString(largest->tier)
                 << " to " << ModelCatalog::tierToString(lower) << ": configuration needs "
                 << formatGB(estimated_ram_gb) << " but only " << formatGB(usable) << " is usable.";
        } else {
            text << "Disable " << name << ": even small models need "
                 << formatGB(estimated_ram_gb) << " but only " << formatGB(usable) << " is usable.";
        }
        return text.str();
    }

    double headroom = usable - estimated_ram_gb;
    if (headroom > m_config.upgrade_headroom_gb) {
        // Cheapest upgrade of the lowest-tier role that still fits
        const ModelSelection* candidate = nullptr;
        double candidate_extra = 0.0;
        for (const auto& selection : enabled) {
            if (selection.tier == ModelTier::LARGE) {
                continue;
            }
            ModelTier next = static_cast<ModelTier>(ModelCatalog::tierRank(selection.tier) + 1);
            double extra = (ModelCatalog::getVariant(selection.role, next).estimated_ram_gb - ramFor(selection))
                           * m_config.overhead_factor;
            if (extra > headroom) {
                continue;
            }
            if (!candidate || ModelCatalog::tierRank(selection.tier) < ModelCatalog::tierRank(candidate->tier)) {
                candidate = &selection;
                candidate_extra = extra;
            }
        }

        if (candidate) {
            ModelTier next = static_cast<ModelTier>(ModelCatalog::tierRank(candidate->tier) + 1);
            text << "Upgrade " << AgentCapabilityUtils::profile(candidate->role).display_name
                 << " to " << ModelCatalog::tierToString(next) << " for better quality ("
                 << formatGB(candidate_extra) << " more, " << formatGB(headroom) << " headroom).";
            return text.str();
        }
    }

    text << "Configuration fits with " << formatGB(headroom) << " headroom.";
    return text.str();
}

void ModelTierManager::validateConfiguration(const CustomConfiguration& config) const {
    std::set<AgentRole> seen;
    bool any_enabled = false;

    for (const auto& selection : config) {
        if (!seen.insert(selection.role).second) {
            throw ConfigurationError("Duplicate selection for role " +
                AgentCapabilityUtils::roleToString(selection.role));
        }
        any_enabled = any_enabled || selection.enabled;
    }

    if (!any_enabled) {
        throw ConfigurationError("Select at least one model.");
    }
}

CustomConfiguration ModelTierManager::getActiveConfiguration() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active_configuration;
}

ConfigurationAnalysis ModelTierManager::getActiveAnalysis() const {
    return analyzeConfiguration(getActiveConfiguration());
}

void ModelTierManager::updateConfiguration(const CustomConfiguration& config, bool allow_overcommit) {
    validateConfiguration(config);

    ConfigurationAnalysis analysis = analyzeConfiguration(config);
    if (!analysis.can_fit) {
        if (!allow_overcommit) {
            throw ConfigurationError("Configuration does not fit in memory. " + analysis.recommendation);
        }
        Logger::getInstance().warning("ModelTierManager",
            "Accepting configuration that exceeds the memory budget", analysis.recommendation);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active_configuration = config;
    }

    Logger::getInstance().info("ModelTierManager", "Configuration updated",
        "Estimated RAM: " + formatGB(analysis.estimated_ram_gb));
}

void ModelTierManager::resetConfiguration() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_active_configuration = createDefaultConfiguration();
}

bool ModelTierManager::isRoleEnabled(AgentRole role) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& selection : m_active_configuration) {
        if (selection.role == role) {
            return selection.enabled;
        }
    }
    return false;
}

ModelVariant ModelTierManager::getActiveVariant(AgentRole role) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& selection : m_active_configuration) {
        if (selection.role == role && selection.enabled) {
            return ModelCatalog::getVariant(role, selection.tier);
        }
    }
    throw ConfigurationError("Role " + AgentCapabilityUtils::roleToString(role) + " is not enabled");
}

std::vector<std::string> ModelTierManager::findMissingModels(const std::vector<std::string>& installed_tags) const {
    std::vector<std::string> missing;
    for (const auto& selection : getActiveConfiguration()) {
        if (!selection.enabled) {
            continue;
        }
        const std::string& tag = ModelCatalog::getVariant(selection.role, selection.tier).tag;
        bool installed = std::any_of(installed_tags.begin(), installed_tags.end(),
            [&tag](const std::string& candidate) {
                return candidate == tag ||
                       (tag.find(':') == std::string::npos && candidate == tag + ":latest");
            });
        if (!installed && std::find(missing.begin(), missing.end(), tag) == missing.end()) {
            missing.push_back(tag);
        }
    }
    return missing;
}

bool ModelTierManager::saveConfiguration(ConfigurationStore& store) const {
    CustomConfiguration config = getActiveConfiguration();

    std::string order;
    for (const auto& selection : config) {
        std::string role = AgentCapabilityUtils::roleToString(selection.role);
        if (!order.empty()) order += ",";
        order += role;

        store.setValue("models." + role + ".tier", ModelCatalog::tierToString(selection.tier));
        store.setValue("models." + role + ".enabled", selection.enabled ? "true" : "false");
    }
    store.setValue("models.order", order);

    return store.save();
}

bool ModelTierManager::loadConfiguration(const ConfigurationStore& store) {
    std::string order = store.getStringValue("models.order");
    if (order.empty()) {
        return false;
    }

    CustomConfiguration config;
    try {
        std::istringstream roles(order);
        std::string role_id;
        while (std::getline(roles, role_id, ',')) {
            ModelSelection selection;
            selection.role = AgentCapabilityUtils::stringToRole(role_id);
            selection.tier = ModelCatalog::stringToTier(store.getStringValue("models." + role_id + ".tier"));
            std::string enabled = store.getStringValue("models." + role_id + ".enabled");
            selection.enabled = enabled.empty() || enabled == "true" || enabled == "1";
            config.push_back(selection);
        }
        updateConfiguration(config, true);
    } catch (const std::invalid_argument& e) {
        Logger::getInstance().warning("ModelTierManager", "Ignoring stored configuration", e.what());
        return false;
    } catch (const ConfigurationError& e) {
        Logger::getInstance().warning("ModelTierManager", "Ignoring stored configuration", e.what());
        return false;
    }

    return true;
}

MemorySettings ModelTierManager::getMemorySettings() const {
    MemorySettings settings;

    switch (m_recommended_tier) {
        case ModelTier::SMALL:
            settings.context_window = 16384;
            settings.max_tokens = 4096;
            settings.keep_alive = "5m";
            break;
        case ModelTier::MEDIUM:
            settings.context_window = 8192;
            settings.max_tokens = 4096;
            settings.keep_alive = "10m";
            break;
        case ModelTier::LARGE:
            settings.context_window = 4096;
            settings.max_tokens = 2048;
            settings.keep_alive = "30m";
            break;
    }

    if (!getActiveAnalysis().can_fit) {
        settings.context_window /= 2;
        settings.max_tokens /= 2;
        settings.keep_alive = "2m";
    }

    unsigned int cores = std::thread::hardware_concurrency();
    settings.num_thread = std::clamp(static_cast<int>(cores), 4, 16);
    settings.num_gpu = 99;

    return settings;
}

std::vector<TierComparison> ModelTierManager::getTierComparisons() const {
    std::vector<TierComparison> rows;

    for (ModelTier tier : ModelCatalog::allTiers()) {
        TierComparison row;
        row.tier = tier;
        row.minimum_ram_gb = tierMinimumRAM(tier);

        double quality = 0.0;
        double speed = 0.0;
        const auto& roles = AgentCapabilityUtils::allRoles();
        for (AgentRole role : roles) {
            const ModelVariant& variant = ModelCatalog::getVariant(role, tier);
            row.total_disk_gb += variant.disk_size_gb;
            quality += variant.quality;
            speed += variant.speed;
        }
        row.quality = quality / roles.size();
        row.speed = speed / roles.size();
        row.recommended = tier == m_recommended_tier;
        row.available = m_system_ram_gb >= row.minimum_ram_gb;
        rows.push_back(row);
    }

    return rows;
}

} // namespace Tandem
