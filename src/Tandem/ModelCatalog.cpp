// =================================================================
// src/Tandem/ModelCatalog.cpp
// =================================================================
// Catalog tables for the four agent roles.

#include "Tandem/ModelCatalog.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

namespace Tandem {

namespace {

using VariantTable = std::map<std::pair<AgentRole, ModelTier>, ModelVariant>;

// RAM estimates are the quantized weights plus roughly half a gigabyte of
// runtime buffers; per-request context is covered by the overhead factor.
const VariantTable& variantTable() {
    static const VariantTable table = {
        {{AgentRole::ORCHESTRATOR, ModelTier::SMALL},
            {"Qwen3 8B", "qwen3:8b", "8B", 5.0, 5.5, ModelTier::SMALL, 6, 9}},
        {{AgentRole::ORCHESTRATOR, ModelTier::MEDIUM},
            {"Qwen3 14B", "qwen3:14b", "14B", 9.0, 9.5, ModelTier::MEDIUM, 8, 7}},
        {{AgentRole::ORCHESTRATOR, ModelTier::LARGE},
            {"Qwen3 32B", "qwen3:32b", "32B", 20.0, 21.0, ModelTier::LARGE, 10, 5}},

        {{AgentRole::CODER, ModelTier::SMALL},
            {"Qwen2.5-Coder 7B", "qwen2.5-coder:7b", "7B", 4.5, 5.0, ModelTier::SMALL, 6, 9}},
        {{AgentRole::CODER, ModelTier::MEDIUM},
            {"Qwen2.5-Coder 14B", "qwen2.5-coder:14b", "14B", 9.0, 9.5, ModelTier::MEDIUM, 8, 7}},
        {{AgentRole::CODER, ModelTier::LARGE},
            {"Qwen2.5-Coder 32B", "qwen2.5-coder:32b", "32B", 20.0, 21.0, ModelTier::LARGE, 10, 5}},

        {{AgentRole::RESEARCHER, ModelTier::SMALL},
            {"Command-R 7B", "command-r7b:7b", "7B", 4.5, 5.0, ModelTier::SMALL, 6, 9}},
        {{AgentRole::RESEARCHER, ModelTier::MEDIUM},
            {"Phi-4 14B", "phi4:14b", "14B", 9.0, 9.5, ModelTier::MEDIUM, 8, 7}},
        {{AgentRole::RESEARCHER, ModelTier::LARGE},
            {"Command-R 35B", "command-r:35b", "35B", 20.0, 21.5, ModelTier::LARGE, 10, 5}},

        {{AgentRole::VISION, ModelTier::SMALL},
            {"Qwen2.5-VL 7B", "qwen2.5vl:7b", "7B", 4.5, 5.0, ModelTier::SMALL, 6, 9}},
        {{AgentRole::VISION, ModelTier::MEDIUM},
            {"Llama 3.2 Vision 11B", "llama3.2-vision:11b", "11B", 7.8, 8.5, ModelTier::MEDIUM, 8, 7}},
        {{AgentRole::VISION, ModelTier::LARGE},
            {"Qwen2.5-VL 32B", "qwen2.5vl:32b", "32B", 21.0, 22.0, ModelTier::LARGE, 10, 5}}
    };
    return table;
}

} // namespace

const ModelVariant& ModelCatalog::getVariant(AgentRole role, ModelTier tier) {
    const auto& table = variantTable();
    auto it = table.find({role, tier});
    if (it == table.end()) {
        throw std::invalid_argument("No catalog entry for " +
            AgentCapabilityUtils::roleToString(role) + "/" + tierToString(tier));
    }
    return it->second;
}

std::vector<std::pair<ModelTier, ModelVariant>> ModelCatalog::getOptions(AgentRole role) {
    std::vector<std::pair<ModelTier, ModelVariant>> options;
    for (ModelTier tier : allTiers()) {
        options.emplace_back(tier, getVariant(role, tier));
    }

    std::stable_sort(options.begin(), options.end(),
        [](const auto& a, const auto& b) {
            return a.second.disk_size_gb < b.second.disk_size_gb;
        });

    return options;
}

const std::vector<ModelTier>& ModelCatalog::allTiers() {
    static const std::vector<ModelTier> tiers = {
        ModelTier::SMALL, ModelTier::MEDIUM, ModelTier::LARGE
    };
    return tiers;
}

std::string ModelCatalog::tierToString(ModelTier tier) {
    switch (tier) {
        case ModelTier::SMALL: return "small";
        case ModelTier::MEDIUM: return "medium";
        case ModelTier::LARGE: return "large";
        default:
            throw std::invalid_argument("Unknown ModelTier value");
    }
}

ModelTier ModelCatalog::stringToTier(const std::string& str) {
    if (str == "small") return ModelTier::SMALL;
    if (str == "medium") return ModelTier::MEDIUM;
    if (str == "large") return ModelTier::LARGE;
    throw std::invalid_argument("Unknown tier: " + str);
}

int ModelCatalog::tierRank(ModelTier tier) {
    return static_cast<int>(tier);
}

} // namespace Tandem
