#include <catch2/catch.hpp>
#include "issues/Errors.hpp"
#include "issues/IssueManager.hpp"
#include "TestHelpers.hpp"

using namespace issues;

TEST_CASE("Sessions that touched an issue are linked", "[Sessions]") {
    TempDirectory temp;
    IssueManager first(temp.path(), {.actor = "agent", .sessionId = "s1"});
    IssueManager second(temp.path(), {.actor = "agent", .sessionId = "s2"});

    auto issue = first.createIssue({.title = "Investigate"});
    second.updateIssue(issue.id, {.status = "in_progress"});
    second.closeIssue(issue.id);

    auto report = first.getIssueSessions(issue.id);
    REQUIRE(report.issueId == issue.id);
    REQUIRE(report.sessionCount == 2);
    REQUIRE(report.linkedSessions == std::vector<std::string>{"s1", "s2"});
    REQUIRE(report.eventsBySession.at("s1") == std::vector<std::string>{"created"});
    REQUIRE(report.eventsBySession.at("s2") == std::vector<std::string>{"updated", "closed"});
    REQUIRE_FALSE(report.hint.empty());
}

TEST_CASE("Issue without session events has no links", "[Sessions]") {
    TempDirectory temp;
    IssueManager manager(temp.path());

    auto issue = manager.createIssue({.title = "Local"});
    auto report = manager.getIssueSessions(issue.id);

    REQUIRE(report.sessionCount == 0);
    REQUIRE(report.linkedSessions.empty());
    REQUIRE(report.eventsBySession.empty());
}

TEST_CASE("Session report for an unknown issue", "[Sessions]") {
    TempDirectory temp;
    IssueManager manager(temp.path());

    REQUIRE_THROWS_AS(manager.getIssueSessions("missing"), NotFoundError);
}

TEST_CASE("Session end is stamped with the session", "[Sessions]") {
    TempDirectory temp;
    IssueManager worker(temp.path(), {.sessionId = "s1"});
    auto issue = worker.createIssue({.title = "Long task"});

    worker.emitSessionEnded(issue.id);

    auto events = worker.getIssueEvents(issue.id);
    REQUIRE(events.size() == 2);
    REQUIRE(events[1].eventType == "session_ended");
    REQUIRE(events[1].sessionId == std::optional<std::string>("s1"));
    REQUIRE(std::get<ReasonChange>(events[1].changes).reason == "session terminated");

    auto report = worker.getIssueSessions(issue.id);
    REQUIRE(report.eventsBySession.at("s1") == std::vector<std::string>{"created", "session_ended"});
}

TEST_CASE("Session end for an unknown issue is a no-op", "[Sessions]") {
    TempDirectory temp;
    IssueManager manager(temp.path(), {.sessionId = "s1"});

    REQUIRE_NOTHROW(manager.emitSessionEnded("missing"));
    REQUIRE_NOTHROW(manager.emitSessionEnded(""));
    REQUIRE(manager.getStorage().loadEvents().empty());
}
