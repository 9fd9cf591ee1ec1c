// =================================================================
// include/Tandem/WorkspaceScanner.hpp
// =================================================================
// Discovers text files in a working directory for task context.

#pragma once

#include "Tandem/TaskContext.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace Tandem {

struct WorkspaceScanConfig {
    size_t max_files = 40;                      ///< Files loaded into a context
    size_t max_file_size = 256 * 1024;          ///< Larger files are skipped
    size_t max_total_bytes = 48 * 1024;         ///< Content budget for one context
};

/**
 * @brief Walks a directory tree and loads text files
 *
 * Build output, VCS metadata and binary files are skipped. Results are
 * sorted so repeated scans produce the same context.
 */
class WorkspaceScanner {
public:
    /**
     * @brief Construct a scanner for a directory
     * @param root_path Directory to scan
     * @param config Size budgets
     */
    explicit WorkspaceScanner(const std::string& root_path,
                              const WorkspaceScanConfig& config = WorkspaceScanConfig());

    /**
     * @brief Relative paths of all eligible text files, sorted
     */
    std::vector<std::string> scanFiles() const;

    /**
     * @brief Load eligible files into a context within the byte budget
     * @param context Context whose working_directory and files are set
     * @return Number of files loaded
     */
    size_t populate(TaskContext& context) const;

    /**
     * @brief Immediate children of a directory inside the root
     * @param relative_dir Directory relative to the root, empty for the root
     * @return Entry names, directories suffixed with '/'
     */
    std::vector<std::string> listDirectory(const std::string& relative_dir) const;

    /**
     * @brief Find lines containing a string
     * @param needle Case-insensitive text to find
     * @param max_matches Stop after this many matches
     * @return "path:line: text" entries
     */
    std::vector<std::string> search(const std::string& needle, size_t max_matches = 50) const;

    /**
     * @brief Resolve a path and ensure it stays inside the root
     * @param relative_path Path relative to the root
     * @param resolved Receives the absolute path
     * @return False if the path escapes the root
     */
    bool resolveInside(const std::string& relative_path, std::filesystem::path& resolved) const;

    const std::string& getRootPath() const { return m_root_path; }

    bool isTextFile(const std::string& file_path) const;

private:
    std::string m_root_path;
    WorkspaceScanConfig m_config;
    std::set<std::string> m_ignored_directories;
    std::unordered_set<std::string> m_include_extensions;

    void initializeDefaults();
    bool isIgnoredDirectory(const std::filesystem::path& path) const;
};

} // namespace Tandem
