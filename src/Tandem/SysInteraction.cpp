// =================================================================
// src/Tandem/SysInteraction.cpp
// =================================================================
// Implementation for file I/O and shell execution.

#include "Tandem/SysInteraction.hpp"
#include "Tandem/TextUtils.hpp"
#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/wait.h>

namespace Tandem {

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) {
    std::error_code ec;
    auto parent = std::filesystem::path(file_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file_stream(file_path);
    if (!file_stream) {
        return false;
    }
    file_stream << content;
    return file_stream.good();
}

bool SysInteraction::fileExists(const std::string& file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

bool SysInteraction::directoryExists(const std::string& dir_path) {
    struct stat buffer;
    return (stat(dir_path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

std::pair<std::string, int> SysInteraction::executeShell(const std::string& command,
                                                         const std::string& working_dir,
                                                         size_t max_output) {
    std::string full_command;
    if (!working_dir.empty()) {
        full_command = "cd " + shellQuote(working_dir) + " && ";
    }
    // Redirect stderr to stdout to capture all output
    full_command += "(" + command + ") 2>&1";

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_command.c_str(), "r"), pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to execute command: " + command);
    }

    std::array<char, 256> buffer;
    std::string result;
    bool truncated = false;
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        if (result.size() < max_output) {
            result += buffer.data();
        } else {
            truncated = true;
        }
    }
    if (result.size() > max_output) {
        result = TextUtils::truncateUtf8(result, max_output);
        truncated = true;
    }
    if (truncated) {
        result += "\n[output truncated]";
    }

    int exit_status = pclose(pipe.release());
    if (WIFEXITED(exit_status)) {
        exit_status = WEXITSTATUS(exit_status);
    } else {
        exit_status = -1;
    }

    return {result, exit_status};
}

std::string SysInteraction::shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace Tandem
