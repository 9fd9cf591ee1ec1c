// =================================================================
// src/Tandem/CapabilityClassifier.cpp
// =================================================================
// Implementation of the keyword capability classifier.

#include "Tandem/CapabilityClassifier.hpp"
#include "Tandem/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace Tandem {

KeywordCapabilityClassifier::KeywordCapabilityClassifier(const KeywordClassifierConfig& config)
    : m_config(config) {
    initializeDefaultRules();
}

CapabilityClassification KeywordCapabilityClassifier::classify(const std::string& task,
                                                               const std::vector<std::string>& file_paths) {
    auto start_time = std::chrono::steady_clock::now();
    CapabilityClassification result;

    std::string normalized = normalizeText(task);
    if (normalized.empty()) {
        return result;
    }

    std::map<TaskCapability, double> combined = analyzeKeywords(normalized);

    if (m_config.enable_pattern_matching) {
        for (const auto& [capability, score] : analyzePatterns(task)) {
            combined[capability] += score;
        }
    }

    if (m_config.enable_context_analysis && !file_paths.empty()) {
        for (const auto& [capability, score] : analyzeContext(file_paths)) {
            // Context only reinforces capabilities the text already hints at
            if (combined.count(capability) && combined[capability] > 0.0) {
                combined[capability] += score;
            }
        }
    }

    double total = 0.0;
    double top = 0.0;
    for (const auto& [capability, score] : combined) {
        if (score <= 0.0) {
            continue;
        }
        result.scores[capability] = score;
        total += score;
        top = std::max(top, score);
        if (score >= m_config.min_score) {
            result.capabilities.insert(capability);
        }
    }

    if (!result.capabilities.empty() && total > 0.0) {
        result.confidence = top / total;
    }

    auto end_time = std::chrono::steady_clock::now();
    result.classification_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time).count();

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        if (result.capabilities.empty()) {
            m_classification_counts["ambiguous"]++;
        }
        for (TaskCapability capability : result.capabilities) {
            m_classification_counts[AgentCapabilityUtils::capabilityToString(capability)]++;
        }
    }

    return result;
}

bool KeywordCapabilityClassifier::loadRulesFromFile(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        Logger::getInstance().warning("CapabilityClassifier", "Rules file not found", config_path);
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        YAML::Node capabilities = root["capabilities"];
        if (!capabilities || !capabilities.IsMap()) {
            Logger::getInstance().warning("CapabilityClassifier",
                "No 'capabilities' section in rules file", config_path);
            return false;
        }

        for (YAML::const_iterator it = capabilities.begin(); it != capabilities.end(); ++it) {
            TaskCapability capability = AgentCapabilityUtils::stringToCapability(it->first.as<std::string>());
            const YAML::Node& rules = it->second;

            if (rules["keywords"]) {
                for (const auto& keyword : rules["keywords"]) {
                    addKeyword(capability, keyword.as<std::string>());
                }
            }
            if (rules["patterns"]) {
                for (const auto& pattern : rules["patterns"]) {
                    m_patterns[capability].emplace_back(pattern.as<std::string>(), std::regex_constants::icase);
                }
            }
        }
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("CapabilityClassifier", "Failed to parse rules file", e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        Logger::getInstance().error("CapabilityClassifier", "Invalid capability in rules file", e.what());
        return false;
    } catch (const std::regex_error& e) {
        Logger::getInstance().error("CapabilityClassifier", "Invalid pattern in rules file", e.what());
        return false;
    }

    Logger::getInstance().info("CapabilityClassifier", "Loaded classification rules", config_path);
    return true;
}

void KeywordCapabilityClassifier::addKeyword(TaskCapability capability, const std::string& keyword) {
    std::string normalized = normalizeText(keyword);
    if (!normalized.empty()) {
        m_keywords[capability].push_back(normalized);
    }
}

std::unordered_map<std::string, size_t> KeywordCapabilityClassifier::getClassificationStats() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_classification_counts;
}

void KeywordCapabilityClassifier::resetStats() {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    m_classification_counts.clear();
}

void KeywordCapabilityClassifier::initializeDefaultRules() {
    m_keywords[TaskCapability::CODE_GENERATION] = {
        "implement", "code", "function", "class", "struct", "method", "api", "endpoint",
        "algorithm", "script", "program", "module", "compile", "unit test", "data structure"
    };

    m_keywords[TaskCapability::CODE_REVIEW] = {
        "review", "refactor", "optimize", "clean up", "audit", "readability",
        "code quality", "code smell", "simplify"
    };

    m_keywords[TaskCapability::DEBUGGING] = {
        "bug", "fix", "error", "crash", "debug", "exception", "stack trace",
        "failing", "broken", "not working", "segfault", "regression"
    };

    m_keywords[TaskCapability::RESEARCH] = {
        "what is", "who is", "how does", "explain", "search", "look up", "research",
        "compare", "difference between", "pros and cons", "alternatives",
        "best practices", "overview", "background", "information"
    };

    m_keywords[TaskCapability::DOCUMENTATION] = {
        "document", "documentation", "docs", "readme", "docstring", "tutorial",
        "guide", "summarize", "summary", "report", "article", "changelog"
    };

    m_keywords[TaskCapability::IMAGE_ANALYSIS] = {
        "image", "screenshot", "picture", "photo", "diagram", "mockup", "visual", "screen"
    };

    m_keywords[TaskCapability::PLANNING] = {
        "plan", "roadmap", "strategy", "break down", "architecture", "milestone", "design"
    };

    m_keywords[TaskCapability::SYNTHESIS] = {
        "synthesize", "consolidate", "combine", "merge results", "integrate findings"
    };

    m_patterns[TaskCapability::CODE_GENERATION] = {
        std::regex(R"(\b(write|create|implement|generate|build|add)\s+(a\s+|an\s+|the\s+)?(new\s+)?(function|class|method|component|module|feature|script|test))",
                   std::regex_constants::icase),
        std::regex(R"(\.(cpp|hpp|c|h|py|js|ts|rs|go|swift|java)\b)", std::regex_constants::icase)
    };

    m_patterns[TaskCapability::CODE_REVIEW] = {
        std::regex(R"(\b(review|audit|refactor)\s+(this\s+|the\s+|my\s+)?(code|pr|pull request|diff|change))",
                   std::regex_constants::icase)
    };

    m_patterns[TaskCapability::DEBUGGING] = {
        std::regex(R"(\b(fix|debug|solve|resolve)\s+(this\s+|the\s+|a\s+)?(bug|error|issue|problem|crash))",
                   std::regex_constants::icase),
        std::regex(R"(\b(doesn'?t|does not|won'?t|isn'?t)\s+(work|compile|run|build))", std::regex_constants::icase)
    };

    m_patterns[TaskCapability::RESEARCH] = {
        std::regex(R"(^\s*(what|who|why|when|where|which)\s+)", std::regex_constants::icase),
        std::regex(R"(\bhow\s+(does|do|is|are)\b)", std::regex_constants::icase)
    };

    m_patterns[TaskCapability::DOCUMENTATION] = {
        std::regex(R"(\b(write|add|create|update)\s+(the\s+)?(docs?|documentation|comments?|readme))",
                   std::regex_constants::icase)
    };

    m_patterns[TaskCapability::IMAGE_ANALYSIS] = {
        std::regex(R"(\.(png|jpe?g|gif|bmp|webp)\b)", std::regex_constants::icase),
        std::regex(R"(\b(look at|describe|analy[sz]e)\s+(this\s+|the\s+)?(image|screenshot|picture|ui))",
                   std::regex_constants::icase)
    };

    m_patterns[TaskCapability::PLANNING] = {
        std::regex(R"(\b(step[- ]by[- ]step|multi[- ]step|phases?)\b)", std::regex_constants::icase)
    };
}

std::map<TaskCapability, double> KeywordCapabilityClassifier::analyzeKeywords(const std::string& normalized_task) const {
    std::map<TaskCapability, double> scores;

    for (const auto& [capability, keywords] : m_keywords) {
        double score = 0.0;
        for (const auto& keyword : keywords) {
            if (containsWord(normalized_task, keyword)) {
                score += m_config.keyword_weight;
            }
        }
        if (score > 0.0) {
            scores[capability] = score;
        }
    }

    return scores;
}

std::map<TaskCapability, double> KeywordCapabilityClassifier::analyzePatterns(const std::string& task) const {
    std::map<TaskCapability, double> scores;

    for (const auto& [capability, patterns] : m_patterns) {
        double score = 0.0;
        for (const auto& pattern : patterns) {
            if (std::regex_search(task, pattern)) {
                score += m_config.pattern_weight;
            }
        }
        if (score > 0.0) {
            scores[capability] = score;
        }
    }

    return scores;
}

std::map<TaskCapability, double> KeywordCapabilityClassifier::analyzeContext(
    const std::vector<std::string>& file_paths) const {
    std::map<TaskCapability, double> scores;

    for (const auto& path : file_paths) {
        std::string extension = std::filesystem::path(path).extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::string lower_path = normalizeText(path);

        if (extension == ".png" || extension == ".jpg" || extension == ".jpeg" || extension == ".gif") {
            scores[TaskCapability::IMAGE_ANALYSIS] = m_config.context_weight;
        }
        if (extension == ".md" || extension == ".rst" || extension == ".txt") {
            scores[TaskCapability::DOCUMENTATION] = m_config.context_weight;
        }
        if (lower_path.find("test") != std::string::npos) {
            scores[TaskCapability::DEBUGGING] = m_config.context_weight;
        }
    }

    return scores;
}

std::string KeywordCapabilityClassifier::normalizeText(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());

    bool last_space = true;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '\'' || c == '.' || c == '-') {
            normalized.push_back(static_cast<char>(std::tolower(c)));
            last_space = false;
        } else if (!last_space) {
            normalized.push_back(' ');
            last_space = true;
        }
    }

    while (!normalized.empty() && normalized.back() == ' ') {
        normalized.pop_back();
    }
    return normalized;
}

bool KeywordCapabilityClassifier::containsWord(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return false;
    }

    // Simple plural and verb forms ("bugs", "fixed", "planning")
    static const std::vector<std::string> suffixes = {
        "", "s", "es", "d", "ed", "ing", "ged", "ging", "ned", "ning"
    };

    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        bool start_ok = pos == 0 || !std::isalnum(static_cast<unsigned char>(haystack[pos - 1]));
        if (start_ok) {
            size_t end = pos + needle.size();
            for (const auto& suffix : suffixes) {
                if (haystack.compare(end, suffix.size(), suffix) != 0) {
                    continue;
                }
                size_t after = end + suffix.size();
                if (after >= haystack.size() || !std::isalnum(static_cast<unsigned char>(haystack[after]))) {
                    return true;
                }
            }
        }
        pos = haystack.find(needle, pos + 1);
    }
    return false;
}

} // namespace Tandem
