// =================================================================
// include/Tandem/CapabilityClassifier.hpp
// =================================================================
// Infers the capabilities a free-text task requires.

#pragma once

#include "Tandem/AgentCapabilities.hpp"
#include <map>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Tandem {

/**
 * @brief Capabilities inferred for a task
 */
struct CapabilityClassification {
    CapabilitySet capabilities;                     ///< Capabilities at or above the threshold
    std::map<TaskCapability, double> scores;        ///< Raw score per capability
    double confidence = 0.0;                        ///< Share of the total score held by the top capability
    long classification_time_ms = 0;

    /**
     * @brief True when no capability could be inferred
     */
    bool isAmbiguous() const { return capabilities.empty(); }
};

/**
 * @brief Pluggable task classifier
 */
class CapabilityClassifier {
public:
    virtual ~CapabilityClassifier() = default;

    /**
     * @brief Classify a task
     * @param task Task text
     * @param file_paths Paths of files in the task context
     * @return Inferred capabilities; empty when ambiguous
     */
    virtual CapabilityClassification classify(const std::string& task,
                                              const std::vector<std::string>& file_paths = {}) = 0;
};

/**
 * @brief Configuration of the keyword classifier
 */
struct KeywordClassifierConfig {
    double min_score = 1.0;             ///< Score needed to include a capability
    double keyword_weight = 1.0;        ///< Score per matched keyword
    double pattern_weight = 1.5;        ///< Score per matched pattern
    double context_weight = 0.5;        ///< Score per context hint
    bool enable_pattern_matching = true;
    bool enable_context_analysis = true;
};

/**
 * @brief Keyword, pattern and file-context heuristics
 *
 * Keywords match on word boundaries in the lowercased task. Context
 * hints alone never reach the default threshold; they only reinforce
 * evidence found in the text.
 */
class KeywordCapabilityClassifier : public CapabilityClassifier {
public:
    explicit KeywordCapabilityClassifier(const KeywordClassifierConfig& config = KeywordClassifierConfig());

    CapabilityClassification classify(const std::string& task,
                                      const std::vector<std::string>& file_paths = {}) override;

    /**
     * @brief Add keyword rules from a YAML file
     * @param config_path File with a "capabilities" map of
     *        capability name -> {keywords: [..], patterns: [..]}
     * @return True if loaded successfully
     */
    bool loadRulesFromFile(const std::string& config_path);

    /**
     * @brief Add a keyword for a capability
     */
    void addKeyword(TaskCapability capability, const std::string& keyword);

    const KeywordClassifierConfig& getConfig() const { return m_config; }

    /**
     * @brief Number of classifications per inferred capability
     */
    std::unordered_map<std::string, size_t> getClassificationStats() const;

    void resetStats();

private:
    KeywordClassifierConfig m_config;

    std::map<TaskCapability, std::vector<std::string>> m_keywords;
    std::map<TaskCapability, std::vector<std::regex>> m_patterns;

    mutable std::mutex m_stats_mutex;
    std::unordered_map<std::string, size_t> m_classification_counts;

    void initializeDefaultRules();

    std::map<TaskCapability, double> analyzeKeywords(const std::string& normalized_task) const;
    std::map<TaskCapability, double> analyzePatterns(const std::string& task) const;
    std::map<TaskCapability, double> analyzeContext(const std::vector<std::string>& file_paths) const;

    static std::string normalizeText(const std::string& text);
    static bool containsWord(const std::string& haystack, const std::string& needle);
};

} // namespace Tandem
