// =================================================================
// include/Tandem/SysInteraction.hpp
// =================================================================
// File I/O and shell execution used by the agent tools.

#pragma once

#include <string>
#include <utility>

namespace Tandem {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    static std::string readFile(const std::string& file_path);

    /**
     * @brief Writes content to a file, creating parent directories.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return True on success, false on failure.
     */
    static bool writeFile(const std::string& file_path, const std::string& content);

    static bool fileExists(const std::string& file_path);

    static bool directoryExists(const std::string& dir_path);

    /**
     * @brief Runs a shell command and captures stdout and stderr.
     * @param command Command line passed to /bin/sh.
     * @param working_dir Directory the command runs in, empty for the current one.
     * @param max_output Output beyond this many bytes is discarded.
     * @return The combined output and the exit code (-1 on abnormal exit).
     */
    static std::pair<std::string, int> executeShell(const std::string& command,
                                                    const std::string& working_dir = "",
                                                    size_t max_output = 64 * 1024);

    /**
     * @brief Quote a string for safe use as one shell word.
     */
    static std::string shellQuote(const std::string& value);
};

} // namespace Tandem
