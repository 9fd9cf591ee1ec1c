// =================================================================
// include/Tandem/ModelCatalog.hpp
// =================================================================
// Static catalog of model variants per role and tier.

#pragma once

#include "Tandem/AgentCapabilities.hpp"
#include <string>
#include <vector>
#include <utility>

namespace Tandem {

/**
 * @brief Cost/quality band of a model variant within a role
 */
enum class ModelTier {
    SMALL,      ///< 7-8B parameter models
    MEDIUM,     ///< 14B parameter models
    LARGE       ///< 32-35B parameter models
};

/**
 * @brief One downloadable model in the catalog
 */
struct ModelVariant {
    std::string name;               ///< Human-readable name
    std::string tag;                ///< Runtime model tag (e.g. "qwen3:8b")
    std::string parameter_count;    ///< Parameter count label (e.g. "8B")
    double disk_size_gb = 0.0;      ///< Download size
    double estimated_ram_gb = 0.0;  ///< Resident size before runtime overhead
    ModelTier tier = ModelTier::SMALL;
    int quality = 0;                ///< Output quality score, 1-10
    int speed = 0;                  ///< Generation speed score, 1-10
};

class ModelCatalog {
public:
    /**
     * @brief Get the variant for a role at a tier
     * @param role Agent role
     * @param tier Model tier
     * @return Catalog entry; every (role, tier) pair is present
     */
    static const ModelVariant& getVariant(AgentRole role, ModelTier tier);

    /**
     * @brief All variants for a role, sorted ascending by disk size
     */
    static std::vector<std::pair<ModelTier, ModelVariant>> getOptions(AgentRole role);

    static const std::vector<ModelTier>& allTiers();

    static std::string tierToString(ModelTier tier);

    /**
     * @brief Convert a tier name to the enum
     * @return ModelTier or throws std::invalid_argument if unknown
     */
    static ModelTier stringToTier(const std::string& str);

    /**
     * @brief Numeric rank of a tier, 0 for SMALL
     */
    static int tierRank(ModelTier tier);
};

} // namespace Tandem
