// =================================================================
// include/Tandem/QualityPolicy.hpp
// =================================================================
// Quality presets and the execution policy each one selects.

#pragma once

#include <string>
#include <vector>

namespace Tandem {

enum class QualityPreset {
    FAST,       ///< Single pass, no verification
    BALANCED,   ///< Plan, execute, review
    THOROUGH    ///< Plan, execute, multi-judge review, revise
};

/**
 * @brief How outputs are checked after a step
 */
enum class VerificationLevel {
    NONE,           ///< Output is accepted as is
    LLM_REVIEW,     ///< Orchestrator reviews the output
    EXPERT_JUDGE    ///< Orchestrator and the producing specialist both review
};

/**
 * @brief Behaviour selected by a preset
 */
struct ExecutionPolicy {
    QualityPreset preset = QualityPreset::BALANCED;
    bool requires_planning = true;          ///< Run a planning pre-step
    VerificationLevel verification_level = VerificationLevel::LLM_REVIEW;
    int retry_limit = 1;                    ///< Extra attempts after a failed step
    int target_time_seconds = 180;          ///< Expected wall time for a task
    std::string description;
};

class QualityPolicy {
public:
    /**
     * @brief Look up the fixed policy of a preset
     */
    static const ExecutionPolicy& forPreset(QualityPreset preset);

    /**
     * @brief Suggest a preset from the wording of a prompt
     * @param prompt User request
     * @return THOROUGH for critical work, FAST for simple questions,
     *         BALANCED otherwise
     */
    static QualityPreset suggestPreset(const std::string& prompt);

    /**
     * @brief Pick a preset from a 0-10 complexity estimate
     */
    static QualityPreset presetForComplexity(int complexity);

    static std::string presetToString(QualityPreset preset);

    /**
     * @brief Convert a preset name to the enum
     * @return QualityPreset or throws std::invalid_argument if unknown
     */
    static QualityPreset stringToPreset(const std::string& str);

    static std::string verificationToString(VerificationLevel level);
};

} // namespace Tandem
