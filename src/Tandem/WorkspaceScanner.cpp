// =================================================================
// src/Tandem/WorkspaceScanner.cpp
// =================================================================
// Implementation for workspace file discovery.

#include "Tandem/WorkspaceScanner.hpp"
#include "Tandem/Logger.hpp"
#include "Tandem/SysInteraction.hpp"
#include "Tandem/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Tandem {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

WorkspaceScanner::WorkspaceScanner(const std::string& root_path, const WorkspaceScanConfig& config)
    : m_root_path(std::filesystem::weakly_canonical(std::filesystem::absolute(root_path)).string()),
      m_config(config) {
    initializeDefaults();
}

std::vector<std::string> WorkspaceScanner::scanFiles() const {
    std::vector<std::string> discovered_files;
    std::error_code ec;

    auto it = std::filesystem::recursive_directory_iterator(
        m_root_path, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::getInstance().warning("WorkspaceScanner", "Cannot scan directory", m_root_path + ": " + ec.message());
        return discovered_files;
    }

    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            Logger::getInstance().warning("WorkspaceScanner", "Filesystem error while scanning", ec.message());
            break;
        }

        const auto& entry = *it;
        if (entry.is_directory()) {
            if (isIgnoredDirectory(entry.path())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file()) {
            continue;
        }

        std::string extension = toLower(entry.path().extension().string());
        if (m_include_extensions.find(extension) == m_include_extensions.end()) {
            continue;
        }
        if (entry.file_size() > m_config.max_file_size) {
            continue;
        }
        if (!isTextFile(entry.path().string())) {
            continue;
        }

        discovered_files.push_back(std::filesystem::relative(entry.path(), m_root_path).generic_string());
    }

    std::sort(discovered_files.begin(), discovered_files.end());
    return discovered_files;
}

size_t WorkspaceScanner::populate(TaskContext& context) const {
    context.working_directory = m_root_path;

    std::vector<std::string> files = scanFiles();
    size_t total_bytes = 0;
    size_t loaded = 0;

    for (const auto& relative_path : files) {
        if (loaded >= m_config.max_files) {
            break;
        }

        std::string content;
        try {
            content = SysInteraction::readFile((std::filesystem::path(m_root_path) / relative_path).string());
        } catch (const std::runtime_error& e) {
            Logger::getInstance().debug("WorkspaceScanner", "Skipping unreadable file", e.what());
            continue;
        }

        if (total_bytes + content.size() > m_config.max_total_bytes) {
            continue;
        }

        total_bytes += content.size();
        context.files[relative_path] = TextUtils::sanitizeUtf8(content);
        loaded++;
    }

    Logger::getInstance().logWorkspaceScan(files.size(), loaded, total_bytes);
    return loaded;
}

std::vector<std::string> WorkspaceScanner::listDirectory(const std::string& relative_dir) const {
    std::filesystem::path directory;
    if (!resolveInside(relative_dir, directory)) {
        throw std::invalid_argument("Path escapes the working directory: " + relative_dir);
    }
    if (!std::filesystem::is_directory(directory)) {
        throw std::invalid_argument("Not a directory: " + relative_dir);
    }

    std::vector<std::string> entries;
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        std::string name = entry.path().filename().string();
        entries.push_back(entry.is_directory() ? name + "/" : name);
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

std::vector<std::string> WorkspaceScanner::search(const std::string& needle, size_t max_matches) const {
    std::vector<std::string> matches;
    if (needle.empty()) {
        return matches;
    }
    std::string lower_needle = toLower(needle);

    for (const auto& relative_path : scanFiles()) {
        std::ifstream file(std::filesystem::path(m_root_path) / relative_path);
        std::string line;
        size_t line_number = 0;
        while (std::getline(file, line)) {
            line_number++;
            if (toLower(line).find(lower_needle) != std::string::npos) {
                matches.push_back(relative_path + ":" + std::to_string(line_number) + ": " + line);
                if (matches.size() >= max_matches) {
                    return matches;
                }
            }
        }
    }

    return matches;
}

bool WorkspaceScanner::resolveInside(const std::string& relative_path, std::filesystem::path& resolved) const {
    std::filesystem::path root(m_root_path);
    std::filesystem::path candidate = std::filesystem::path(relative_path).is_absolute()
        ? std::filesystem::path(relative_path)
        : root / relative_path;
    candidate = std::filesystem::weakly_canonical(candidate);

    auto relative = candidate.lexically_relative(root);
    if (relative.empty() && candidate != root) {
        return false;
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return false;
        }
    }

    resolved = candidate;
    return true;
}

bool WorkspaceScanner::isTextFile(const std::string& file_path) const {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    // Read first 512 bytes to check for null bytes (binary indicator)
    constexpr size_t sample_size = 512;
    char buffer[sample_size];
    file.read(buffer, sample_size);
    size_t bytes_read = file.gcount();

    if (bytes_read == 0) {
        return true;
    }

    size_t printable_chars = 0;
    for (size_t i = 0; i < bytes_read; ++i) {
        unsigned char c = static_cast<unsigned char>(buffer[i]);
        if (c == '\0') {
            return false;
        }
        if (std::isprint(c) || std::isspace(c) || c >= 0x80) {
            printable_chars++;
        }
    }

    return (static_cast<double>(printable_chars) / bytes_read) > 0.95;
}

void WorkspaceScanner::initializeDefaults() {
    m_ignored_directories = {
        ".git", ".hg", ".svn", ".tandem", "build", "dist", "out", "target",
        "node_modules", "__pycache__", ".venv", "venv", ".idea", ".vscode", ".build"
    };

    m_include_extensions = {
        ".cpp", ".hpp", ".h", ".c", ".cc", ".cxx", ".hxx",
        ".py", ".js", ".jsx", ".ts", ".tsx", ".mjs",
        ".java", ".kt", ".rs", ".go", ".rb", ".php", ".swift",
        ".md", ".txt", ".rst",
        ".yml", ".yaml", ".json", ".toml", ".ini", ".cfg",
        ".html", ".css", ".sh", ".cmake"
    };
}

bool WorkspaceScanner::isIgnoredDirectory(const std::filesystem::path& path) const {
    std::string name = path.filename().string();
    if (m_ignored_directories.count(name)) {
        return true;
    }
    return name.rfind("cmake-build-", 0) == 0;
}

} // namespace Tandem
