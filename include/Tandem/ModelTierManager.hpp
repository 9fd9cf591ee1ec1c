// =================================================================
// include/Tandem/ModelTierManager.hpp
// =================================================================
// Host memory detection and multi-model configuration analysis.

#pragma once

#include "Tandem/AgentCapabilities.hpp"
#include "Tandem/ModelCatalog.hpp"
#include "Tandem/ConfigurationStore.hpp"
#include <string>
#include <vector>
#include <mutex>

namespace Tandem {

/**
 * @brief One role's entry in a user configuration
 */
struct ModelSelection {
    AgentRole role = AgentRole::ORCHESTRATOR;
    ModelTier tier = ModelTier::SMALL;
    bool enabled = true;
};

/**
 * @brief Ordered list of per-role model choices
 */
using CustomConfiguration = std::vector<ModelSelection>;

/**
 * @brief Derived snapshot of a configuration against the memory budget
 */
struct ConfigurationAnalysis {
    bool can_fit = true;                        ///< Estimated RAM is within the usable budget
    double estimated_ram_gb = 0.0;              ///< Sum of resident sizes including overhead
    double total_disk_gb = 0.0;                 ///< Sum of download sizes
    double speed_rating = 0.0;                  ///< 0-10, higher is faster
    double quality_rating = 0.0;                ///< 0-10, higher is better
    std::string recommendation;                 ///< Advice for the user
    std::vector<std::string> model_descriptions; ///< One line per enabled model
};

/**
 * @brief Runtime options passed to the inference runtime
 */
struct MemorySettings {
    int context_window = 8192;      ///< Context length in tokens (num_ctx)
    int max_tokens = 4096;          ///< Generation cap (num_predict)
    std::string keep_alive = "10m"; ///< How long the runtime keeps a model loaded
    int num_gpu = 99;               ///< GPU layers to offload
    int num_thread = 8;             ///< CPU threads
};

/**
 * @brief Row of the tier comparison table
 */
struct TierComparison {
    ModelTier tier = ModelTier::SMALL;
    double minimum_ram_gb = 0.0;
    double total_disk_gb = 0.0;     ///< Disk needed for all four roles
    double quality = 0.0;
    double speed = 0.0;
    bool recommended = false;       ///< Tier recommended for this host
    bool available = false;         ///< Host meets the tier's RAM floor
};

/**
 * @brief Tunables of the memory model
 */
struct TierManagerConfig {
    double system_ram_gb = 0.0;            ///< Host RAM override, 0 to detect
    double fallback_ram_gb = 16.0;         ///< Assumed RAM when detection fails
    double overhead_factor = 1.2;          ///< Runtime buffers on top of model size
    double safety_factor = 0.85;           ///< Share of RAM the models may use
    double upgrade_headroom_gb = 8.0;      ///< Headroom before suggesting an upgrade
    double small_tier_min_ram_gb = 16.0;
    double medium_tier_min_ram_gb = 24.0;
    double large_tier_min_ram_gb = 32.0;
};

/**
 * @brief Decides which model tiers fit on this host
 *
 * Holds the active configuration. Analysis is a pure function of the
 * configuration and the detected RAM; the active configuration changes
 * only through updateConfiguration(), resetConfiguration() or
 * loadConfiguration().
 */
class ModelTierManager {
public:
    /**
     * @brief Construct the manager and detect host memory once
     * @param config Memory model tunables
     */
    explicit ModelTierManager(const TierManagerConfig& config = TierManagerConfig());

    /**
     * @brief Query physical memory of the host
     * @return Memory in GB rounded to whole gigabytes, or 0 if unknown
     */
    static double detectSystemRAM();

    double getSystemRAM() const { return m_system_ram_gb; }

    /**
     * @brief RAM the models may occupy (system RAM times safety factor)
     */
    double getUsableRAM() const;

    bool usedFallbackRAM() const { return m_ram_fallback; }

    const TierManagerConfig& getConfig() const { return m_config; }

    /**
     * @brief Map a RAM amount to a tier band
     * @param ram_gb Host memory in GB
     * @return Largest tier whose floor is met, SMALL otherwise
     */
    ModelTier recommendedTier(double ram_gb) const;

    ModelTier getRecommendedTier() const { return m_recommended_tier; }

    double tierMinimumRAM(ModelTier tier) const;

    /**
     * @brief One enabled selection per role at the recommended tier
     */
    CustomConfiguration createDefaultConfiguration() const;

    /**
     * @brief Catalog options for a role, sorted ascending by size
     */
    std::vector<std::pair<ModelTier, ModelVariant>> getModelOptions(AgentRole role) const;

    /**
     * @brief Analyze a configuration against the memory budget
     * @param config Configuration to analyze
     * @return Fresh analysis; never cached
     */
    ConfigurationAnalysis analyzeConfiguration(const CustomConfiguration& config) const;

    /**
     * @brief Check a configuration for structural errors
     *
     * Throws ConfigurationError on duplicate roles or when no model is
     * enabled. Fit is not checked here.
     */
    void validateConfiguration(const CustomConfiguration& config) const;

    CustomConfiguration getActiveConfiguration() const;

    ConfigurationAnalysis getActiveAnalysis() const;

    /**
     * @brief Replace the active configuration
     * @param config New configuration
     * @param allow_overcommit Accept a configuration that does not fit
     *
     * Throws ConfigurationError and leaves the active configuration
     * untouched when the configuration is invalid or does not fit.
     */
    void updateConfiguration(const CustomConfiguration& config, bool allow_overcommit = false);

    /**
     * @brief Restore the default configuration
     */
    void resetConfiguration();

    /**
     * @brief Whether the role is enabled in the active configuration
     */
    bool isRoleEnabled(AgentRole role) const;

    /**
     * @brief Model serving a role in the active configuration
     * @return Variant, or throws ConfigurationError if the role is disabled
     */
    ModelVariant getActiveVariant(AgentRole role) const;

    /**
     * @brief Tags of enabled models that the runtime does not have
     * @param installed_tags Tags reported by the runtime
     * @return Missing tags in configuration order, empty when all are installed
     *
     * A tag without a version also matches its ":latest" form.
     */
    std::vector<std::string> findMissingModels(const std::vector<std::string>& installed_tags) const;

    /**
     * @brief Persist the active configuration
     * @param store Destination store
     * @return True if the store saved successfully
     */
    bool saveConfiguration(ConfigurationStore& store) const;

    /**
     * @brief Replace the active configuration from a store
     * @param store Source store
     * @return False if the store holds no or invalid configuration; the
     *         active configuration is unchanged in that case
     */
    bool loadConfiguration(const ConfigurationStore& store);

    /**
     * @brief Runtime options for the recommended tier and active fit
     */
    MemorySettings getMemorySettings() const;

    std::vector<TierComparison> getTierComparisons() const;

private:
    TierManagerConfig m_config;
    double m_system_ram_gb = 0.0;
    bool m_ram_fallback = false;
    ModelTier m_recommended_tier = ModelTier::SMALL;

    mutable std::mutex m_mutex;
    CustomConfiguration m_active_configuration;

    std::string buildRecommendation(const CustomConfiguration& enabled,
                                    double estimated_ram_gb, bool can_fit) const;
};

} // namespace Tandem
