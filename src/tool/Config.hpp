#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace issues {
namespace tool {

/**
 * Settings of the tool front end
 *
 * Built from defaults, then an optional key=value file, then command-line
 * flags (each layer overrides the previous one).
 */
struct ToolConfig {
    std::optional<std::string> dataDir;        // Explicit data directory, bypasses slug resolution
    std::string baseDir = "~/.issuequeue/projects";
    std::string projectPath;                   // Empty = current directory
    std::string actor = "assistant";
    std::optional<std::string> sessionId;
    int64_t lockTimeoutMs = 10000;
    std::string logLevel = "info";
    std::string logFile;                       // Empty = stderr
    bool autoCreateDir = true;
};

/**
 * Directory-safe slug for a project path
 *
 * The absolute path with every '/' or '\' replaced by '-', without a
 * leading '-': "/home/me/proj" -> "home-me-proj".
 */
std::string projectSlug(const std::filesystem::path& projectPath);

/**
 * Expand a leading "~" to $HOME
 */
std::filesystem::path expandHome(const std::string& path);

/**
 * dataDir if set, else baseDir/<projectSlug(projectPath)>/issues
 */
std::filesystem::path resolveDataDir(const ToolConfig& config);

/**
 * Apply one setting by key
 * Returns false for an unknown key; throws std::invalid_argument on a bad value
 */
bool applyConfigValue(ToolConfig& config, const std::string& key, const std::string& value);

/**
 * Read key=value lines ('#' comments, blank lines skipped, whitespace
 * trimmed). A leading '@' on the path is ignored. Unknown keys are logged
 * and skipped.
 * Throws std::runtime_error if the file cannot be opened.
 */
void loadConfigFile(ToolConfig& config, const std::string& path);

} // namespace tool
} // namespace issues
