#include "tool/RequestHandler.hpp"
#include "issues/Errors.hpp"
#include "issues/IssueSerializer.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>

namespace issues {
namespace tool {

namespace {

std::filesystem::path prepareDataDir(const ToolConfig& config) {
    auto dataDir = resolveDataDir(config);
    if (!config.autoCreateDir && !std::filesystem::is_directory(dataDir)) {
        throw std::runtime_error("Data directory does not exist: " + dataDir.string());
    }
    return dataDir;
}

ManagerOptions managerOptions(const ToolConfig& config) {
    return ManagerOptions{
        .actor = config.actor,
        .sessionId = config.sessionId,
        .lockTimeout = std::chrono::milliseconds(config.lockTimeoutMs)
    };
}

std::string requireString(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        throw ValidationError(std::string(key) + " is required");
    }
    if (!it->is_string() || it->get<std::string>().empty()) {
        throw ValidationError(std::string(key) + " must be a non-empty string");
    }
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

json issuesToJson(const std::vector<Issue>& list) {
    json array = json::array();
    for (const auto& issue : list) {
        array.push_back(IssueSerializer::issueToJson(issue));
    }
    return array;
}

} // anonymous namespace

RequestHandler::RequestHandler(const ToolConfig& config)
    : m_config(config),
      m_dataDir(prepareDataDir(config)),
      m_manager(m_dataDir, managerOptions(config)) {
    LOG_DEBUG("Issue store at " + m_dataDir.string() + " (actor=" + config.actor + ")");
}

int RequestHandler::parsePriority(const json& value) {
    if (value.is_number_integer()) {
        return priorityFromJson(value);
    }
    if (!value.is_string()) {
        throw ValidationError("Invalid priority value: " + value.dump());
    }

    static const std::map<std::string, int> names = {
        {"critical", 0}, {"high", 1}, {"medium", 2}, {"normal", 2}, {"low", 3}, {"deferred", 4}
    };

    std::string text = value.get<std::string>();
    std::string lower;
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto it = names.find(lower);
    if (it != names.end()) {
        return it->second;
    }

    try {
        size_t pos = 0;
        int priority = std::stoi(text, &pos);
        if (pos == text.size()) {
            return priority;
        }
    } catch (const std::logic_error&) {
        // fall through to the validation error below
    }
    throw ValidationError("Invalid priority value: " + text);
}

json RequestHandler::errorResponse(const std::string& kind, const std::string& message) {
    return json{
        {"success", false},
        {"error", {{"kind", kind}, {"message", message}}}
    };
}

json RequestHandler::handle(const json& request) {
    if (!request.is_object() || !request.contains("operation") || !request["operation"].is_string()) {
        return errorResponse("validation", "Operation is required");
    }

    const std::string operation = request["operation"].get<std::string>();
    const json params = request.contains("params") && request["params"].is_object()
        ? request["params"] : json::object();

    uint64_t requestId = util::Logger::instance().logRequest(operation, params.dump());

    json response;
    try {
        response = json{{"success", true}, {"output", dispatch(operation, params)}};
    } catch (const IssueError& e) {
        response = errorResponse(e.kind(), e.what());
    } catch (const json::exception& e) {
        response = errorResponse("validation", std::string("Invalid parameter: ") + e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Issue operation '" + operation + "' failed: " + e.what());
        response = errorResponse("internal", std::string("Operation failed: ") + e.what());
    }

    util::Logger::instance().logResponse(requestId, response["success"].get<bool>(), response.dump());
    return response;
}

json RequestHandler::dispatch(const std::string& operation, const json& params) {
    if (operation == "create")            return handleCreate(params);
    if (operation == "list")              return handleList(params);
    if (operation == "get")               return handleGet(params);
    if (operation == "update")            return handleUpdate(params);
    if (operation == "close")             return handleClose(params);
    if (operation == "add_dependency")    return handleAddDependency(params);
    if (operation == "remove_dependency") return handleRemoveDependency(params);
    if (operation == "get_dependencies")  return handleGetDependencies(params);
    if (operation == "get_dependents")    return handleGetDependents(params);
    if (operation == "get_ready")         return handleGetReady(params);
    if (operation == "get_blocked")       return handleGetBlocked(params);
    if (operation == "get_events")        return handleGetEvents(params);
    if (operation == "get_sessions")      return handleGetSessions(params);
    if (operation == "session_end")       return handleSessionEnd(params);
    throw ValidationError("Unknown operation: " + operation);
}

// =============================================================================
// Issue CRUD
// =============================================================================

json RequestHandler::handleCreate(const json& params) {
    NewIssue request;
    request.title = requireString(params, "title");
    request.description = params.value("description", "");
    if (params.contains("priority") && !params["priority"].is_null()) {
        request.priority = parsePriority(params["priority"]);
    }
    request.issueType = params.value("issue_type", "task");
    request.assignee = optionalString(params, "assignee");
    request.parentId = optionalString(params, "parent_id");
    request.discoveredFrom = optionalString(params, "discovered_from");
    if (params.contains("metadata") && !params["metadata"].is_null()) {
        request.metadata = params["metadata"];
    }

    Issue issue = m_manager.createIssue(request);
    return json{{"issue", IssueSerializer::issueToJson(issue)}};
}

json RequestHandler::handleList(const json& params) {
    IssueFilter filter;
    if (auto status = optionalString(params, "status")) {
        filter.status = parseStatus(*status);
    }
    if (params.contains("priority") && !params["priority"].is_null()) {
        filter.priority = parsePriority(params["priority"]);
    }
    if (auto type = optionalString(params, "issue_type")) {
        filter.issueType = parseIssueType(*type);
    }
    filter.assignee = optionalString(params, "assignee");

    auto found = m_manager.listIssues(filter);
    return json{{"issues", issuesToJson(found)}, {"count", found.size()}};
}

json RequestHandler::handleGet(const json& params) {
    const std::string issueId = requireString(params, "issue_id");
    auto issue = m_manager.getIssue(issueId);
    if (!issue) {
        throw NotFoundError("Issue " + issueId + " not found");
    }
    return json{{"issue", IssueSerializer::issueToJson(*issue)}};
}

json RequestHandler::handleUpdate(const json& params) {
    const std::string issueId = requireString(params, "issue_id");

    IssueUpdate update;
    update.title = optionalString(params, "title");
    update.description = optionalString(params, "description");
    update.status = optionalString(params, "status");
    if (params.contains("priority") && !params["priority"].is_null()) {
        update.priority = parsePriority(params["priority"]);
    }
    update.assignee = optionalString(params, "assignee");
    update.blockingNotes = optionalString(params, "blocking_notes");
    if (params.contains("metadata") && !params["metadata"].is_null()) {
        update.metadata = params["metadata"];
    }

    Issue issue = m_manager.updateIssue(issueId, update);
    return json{{"issue", IssueSerializer::issueToJson(issue)}};
}

json RequestHandler::handleClose(const json& params) {
    const std::string issueId = requireString(params, "issue_id");
    const std::string reason = params.value("reason", "Completed");
    Issue issue = m_manager.closeIssue(issueId, reason);
    return json{{"issue", IssueSerializer::issueToJson(issue)}};
}

// =============================================================================
// Dependencies
// =============================================================================

json RequestHandler::handleAddDependency(const json& params) {
    Dependency dep = m_manager.addDependency(requireString(params, "from_id"),
                                             requireString(params, "to_id"),
                                             params.value("dep_type", "blocks"));
    return json{{"dependency", IssueSerializer::dependencyToJson(dep)}};
}

json RequestHandler::handleRemoveDependency(const json& params) {
    const std::string fromId = requireString(params, "from_id");
    const std::string toId = requireString(params, "to_id");
    m_manager.removeDependency(fromId, toId);
    return json{{"removed", true}, {"from_id", fromId}, {"to_id", toId}};
}

json RequestHandler::handleGetDependencies(const json& params) {
    auto found = m_manager.getDependencies(requireString(params, "issue_id"));
    return json{{"issues", issuesToJson(found)}, {"count", found.size()}};
}

json RequestHandler::handleGetDependents(const json& params) {
    auto found = m_manager.getDependents(requireString(params, "issue_id"));
    return json{{"issues", issuesToJson(found)}, {"count", found.size()}};
}

// =============================================================================
// Scheduling
// =============================================================================

json RequestHandler::handleGetReady(const json& params) {
    std::optional<size_t> limit;
    if (params.contains("limit") && !params["limit"].is_null()) {
        const json& value = params["limit"];
        if (!value.is_number_integer()) {
            throw ValidationError("limit must be an integer, got " + value.dump());
        }
        if (!value.is_number_unsigned() && value.get<int64_t>() < 0) {
            throw ValidationError("limit must not be negative");
        }
        limit = static_cast<size_t>(value.get<uint64_t>());
    }

    auto found = m_manager.getReadyIssues(limit);
    return json{{"ready_issues", issuesToJson(found)}, {"count", found.size()}};
}

json RequestHandler::handleGetBlocked(const json& /*params*/) {
    auto blocked = m_manager.getBlockedIssues();

    json entries = json::array();
    for (const auto& entry : blocked) {
        entries.push_back({
            {"issue", IssueSerializer::issueToJson(entry.issue)},
            {"blockers", issuesToJson(entry.blockers)}
        });
    }
    return json{{"blocked_issues", entries}, {"count", blocked.size()}};
}

// =============================================================================
// Events and sessions
// =============================================================================

json RequestHandler::handleGetEvents(const json& params) {
    auto events = m_manager.getIssueEvents(requireString(params, "issue_id"));

    json entries = json::array();
    for (const auto& event : events) {
        entries.push_back(IssueSerializer::eventToJson(event));
    }
    return json{{"events", entries}, {"count", events.size()}};
}

json RequestHandler::handleGetSessions(const json& params) {
    IssueSessions report = m_manager.getIssueSessions(requireString(params, "issue_id"));
    return json{
        {"issue_id", report.issueId},
        {"linked_sessions", report.linkedSessions},
        {"session_count", report.sessionCount},
        {"events_by_session", report.eventsBySession},
        {"hint", report.hint}
    };
}

json RequestHandler::handleSessionEnd(const json& params) {
    const std::string sessionId = requireString(params, "session_id");

    // Events must carry the ending session, not this handler's own
    ManagerOptions options = managerOptions(m_config);
    options.sessionId = sessionId;
    IssueManager observer(m_dataDir, options);

    IssueFilter inProgress;
    inProgress.status = IssueStatus::InProgress;

    size_t marked = 0;
    for (const auto& issue : observer.listIssues(inProgress)) {
        auto events = observer.getIssueEvents(issue.id);
        bool touched = std::any_of(events.begin(), events.end(), [&](const IssueEvent& e) {
            return e.sessionId == sessionId;
        });
        if (touched) {
            observer.emitSessionEnded(issue.id);
            ++marked;
        }
    }

    if (marked > 0) {
        LOG_INFO("Marked session end on " + std::to_string(marked) + " issues for session " + sessionId);
    }
    return json{{"session_id", sessionId}, {"marked", marked}};
}

} // namespace tool
} // namespace issues
