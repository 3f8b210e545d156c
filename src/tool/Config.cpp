#include "tool/Config.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace issues {
namespace tool {

namespace fs = std::filesystem;

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw std::invalid_argument("Invalid boolean for " + key + ": " + value);
}

} // anonymous namespace

std::string projectSlug(const fs::path& projectPath) {
    std::string slug = fs::absolute(projectPath).lexically_normal().string();
    for (char& c : slug) {
        if (c == '/' || c == '\\') c = '-';
    }
    while (!slug.empty() && slug.back() == '-') slug.pop_back();
    if (!slug.empty() && slug.front() == '-') slug.erase(slug.begin());
    return slug;
}

fs::path expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return fs::path(path);
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        throw std::runtime_error("Cannot expand '~': HOME is not set");
    }
    if (path.size() == 1) {
        return fs::path(home);
    }
    if (path[1] != '/') {
        // ~user forms are not supported
        return fs::path(path);
    }
    return fs::path(home) / path.substr(2);
}

fs::path resolveDataDir(const ToolConfig& config) {
    if (config.dataDir && !config.dataDir->empty()) {
        return expandHome(*config.dataDir);
    }
    fs::path project = config.projectPath.empty() ? fs::current_path() : fs::path(config.projectPath);
    return expandHome(config.baseDir) / projectSlug(project) / "issues";
}

bool applyConfigValue(ToolConfig& config, const std::string& key, const std::string& value) {
    if (key == "data_dir") {
        config.dataDir = value;
    } else if (key == "base_dir") {
        config.baseDir = value;
    } else if (key == "project_path") {
        config.projectPath = value;
    } else if (key == "actor") {
        config.actor = value;
    } else if (key == "session_id") {
        if (value.empty()) {
            config.sessionId.reset();
        } else {
            config.sessionId = value;
        }
    } else if (key == "lock_timeout_ms") {
        size_t pos = 0;
        int64_t timeout = std::stoll(value, &pos);
        if (pos != value.size() || timeout < 0) {
            throw std::invalid_argument("Invalid lock_timeout_ms: " + value);
        }
        config.lockTimeoutMs = timeout;
    } else if (key == "log_level") {
        util::Logger::parseLevel(value);
        config.logLevel = value;
    } else if (key == "log_file") {
        config.logFile = value;
    } else if (key == "auto_create_dir") {
        config.autoCreateDir = parseBool(key, value);
    } else {
        return false;
    }
    return true;
}

void loadConfigFile(ToolConfig& config, const std::string& path) {
    std::string filePath = path;
    if (!filePath.empty() && filePath[0] == '@') filePath = filePath.substr(1);

    std::ifstream in(filePath);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filePath);
    }

    std::string line;
    size_t loaded = 0;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("Ignoring config line without '=': " + line);
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (applyConfigValue(config, key, val)) {
            ++loaded;
        } else {
            LOG_WARN("Unknown config key: " + key);
        }
    }
    LOG_DEBUG("Loaded " + std::to_string(loaded) + " settings from " + filePath);
}

} // namespace tool
} // namespace issues
