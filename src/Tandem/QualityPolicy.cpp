// =================================================================
// src/Tandem/QualityPolicy.cpp
// =================================================================
// Preset table and preset suggestion heuristics.

#include "Tandem/QualityPolicy.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace Tandem {

namespace {

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

const ExecutionPolicy& QualityPolicy::forPreset(QualityPreset preset) {
    static const ExecutionPolicy fast = {
        QualityPreset::FAST, false, VerificationLevel::NONE, 0, 30,
        "Single-pass execution with no verification. Optimized for speed and simple tasks."
    };
    static const ExecutionPolicy balanced = {
        QualityPreset::BALANCED, true, VerificationLevel::LLM_REVIEW, 1, 180,
        "Plan, execute and review. Standard LLM verification. Best for most coding tasks."
    };
    static const ExecutionPolicy thorough = {
        QualityPreset::THOROUGH, true, VerificationLevel::EXPERT_JUDGE, 3, 600,
        "Plan, execute, review and revise with a multi-expert judge. For critical, complex changes."
    };

    switch (preset) {
        case QualityPreset::FAST: return fast;
        case QualityPreset::BALANCED: return balanced;
        case QualityPreset::THOROUGH: return thorough;
    }
    throw std::invalid_argument("Unknown QualityPreset value");
}

QualityPreset QualityPolicy::suggestPreset(const std::string& prompt) {
    static const std::vector<std::string> critical_keywords = {
        "security", "production", "refactor", "migrate", "critical", "performance"
    };
    static const std::vector<std::string> simple_keywords = {
        "tell me", "explain", "how do i", "list", "read", "check"
    };

    std::string lower = toLower(prompt);

    for (const auto& keyword : critical_keywords) {
        if (lower.find(keyword) != std::string::npos) {
            return QualityPreset::THOROUGH;
        }
    }
    for (const auto& keyword : simple_keywords) {
        if (lower.find(keyword) != std::string::npos) {
            return QualityPreset::FAST;
        }
    }
    return QualityPreset::BALANCED;
}

QualityPreset QualityPolicy::presetForComplexity(int complexity) {
    if (complexity > 8) {
        return QualityPreset::THOROUGH;
    }
    if (complexity < 3) {
        return QualityPreset::FAST;
    }
    return QualityPreset::BALANCED;
}

std::string QualityPolicy::presetToString(QualityPreset preset) {
    switch (preset) {
        case QualityPreset::FAST: return "fast";
        case QualityPreset::BALANCED: return "balanced";
        case QualityPreset::THOROUGH: return "thorough";
    }
    throw std::invalid_argument("Unknown QualityPreset value");
}

QualityPreset QualityPolicy::stringToPreset(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "fast") return QualityPreset::FAST;
    if (lower == "balanced") return QualityPreset::BALANCED;
    if (lower == "thorough") return QualityPreset::THOROUGH;
    throw std::invalid_argument("Unknown quality preset: " + str);
}

std::string QualityPolicy::verificationToString(VerificationLevel level) {
    switch (level) {
        case VerificationLevel::NONE: return "none";
        case VerificationLevel::LLM_REVIEW: return "llmReview";
        case VerificationLevel::EXPERT_JUDGE: return "expertJudge";
    }
    return "unknown";
}

} // namespace Tandem
