#pragma once

#include "issues/IssueManager.hpp"
#include "tool/Config.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace issues {
namespace tool {

using json = nlohmann::json;

/**
 * JSON front end over IssueManager
 *
 * Request:  {"operation": "create", "params": {"title": "...", "priority": "high"}}
 * Success:  {"success": true, "output": {...}}
 * Failure:  {"success": false, "error": {"kind": "not_found", "message": "..."}}
 *
 * handle() never throws; every failure becomes an error response.
 */
class RequestHandler {
public:
    explicit RequestHandler(const ToolConfig& config);

    json handle(const json& request);

    IssueManager& getManager() { return m_manager; }
    const std::filesystem::path& getDataDir() const { return m_dataDir; }

    /**
     * Priority from an integer, a numeric string, or one of
     * critical(0) high(1) medium(2) normal(2) low(3) deferred(4)
     * Throws ValidationError on anything else
     */
    static int parsePriority(const json& value);

private:
    json dispatch(const std::string& operation, const json& params);

    // Handlers
    json handleCreate(const json& params);
    json handleList(const json& params);
    json handleGet(const json& params);
    json handleUpdate(const json& params);
    json handleClose(const json& params);
    json handleAddDependency(const json& params);
    json handleRemoveDependency(const json& params);
    json handleGetDependencies(const json& params);
    json handleGetDependents(const json& params);
    json handleGetReady(const json& params);
    json handleGetBlocked(const json& params);
    json handleGetEvents(const json& params);
    json handleGetSessions(const json& params);

    /**
     * Emit session_ended on every in-progress issue the session touched
     */
    json handleSessionEnd(const json& params);

    static json errorResponse(const std::string& kind, const std::string& message);

    ToolConfig m_config;
    std::filesystem::path m_dataDir;
    IssueManager m_manager;
};

} // namespace tool
} // namespace issues
