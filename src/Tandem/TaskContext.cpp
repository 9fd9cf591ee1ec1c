// =================================================================
// src/Tandem/TaskContext.cpp
// =================================================================
// Prompt rendering for task contexts.

#include "Tandem/TaskContext.hpp"
#include "Tandem/TextUtils.hpp"
#include <sstream>

namespace Tandem {

std::string TaskContext::render(size_t max_chars) const {
    std::ostringstream out;

    if (!files.empty()) {
        out << "=== FILES ===\n";
        for (const auto& [path, content] : files) {
            out << "--- " << path << " ---\n" << content << "\n";
        }
    }

    if (!previous_results.empty()) {
        out << "=== PREVIOUS RESULTS ===\n";
        for (size_t i = 0; i < previous_results.size(); ++i) {
            out << "[" << (i + 1) << "] " << previous_results[i] << "\n";
        }
    }

    std::string rendered = out.str();
    if (rendered.size() > max_chars) {
        rendered = TextUtils::truncateUtf8(rendered, max_chars) + "\n[context truncated]\n";
    }
    return rendered;
}

std::vector<std::string> TaskContext::filePaths() const {
    std::vector<std::string> paths;
    paths.reserve(files.size());
    for (const auto& entry : files) {
        paths.push_back(entry.first);
    }
    return paths;
}

} // namespace Tandem
