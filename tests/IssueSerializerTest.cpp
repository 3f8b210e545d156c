#include <catch2/catch.hpp>
#include "issues/Errors.hpp"
#include "issues/IssueSerializer.hpp"
#include "TestHelpers.hpp"
#include <variant>

using namespace issues;

// =============================================================================
// Issue encoding
// =============================================================================

TEST_CASE("Serialize issue with optional fields unset", "[IssueSerializer]") {
    Issue issue = makeIssue("abc", 1);

    auto j = IssueSerializer::issueToJson(issue);

    REQUIRE(j["id"] == "abc");
    REQUIRE(j["status"] == "open");
    REQUIRE(j["priority"] == 1);
    REQUIRE(j["issue_type"] == "task");
    REQUIRE(j["created_at"] == "2026-01-01T00:00:00.000000Z");
    REQUIRE(j["assignee"].is_null());
    REQUIRE(j["closed_at"].is_null());
    REQUIRE(j["parent_id"].is_null());
    REQUIRE(j["discovered_from"].is_null());
    REQUIRE(j["blocking_notes"].is_null());
    REQUIRE(j["metadata"].is_object());
    REQUIRE(j["metadata"].empty());
}

TEST_CASE("Issue with every field survives encoding", "[IssueSerializer]") {
    Issue issue = makeIssue("full", 0, IssueStatus::Closed, 10);
    issue.description = "Multi\nline";
    issue.issueType = IssueType::Epic;
    issue.assignee = "alice";
    issue.closedAt = testTime(20);
    issue.parentId = "parent";
    issue.discoveredFrom = "origin";
    issue.blockingNotes = "waiting on review";
    issue.metadata = json{{"labels", {"a", "b"}}, {"estimate", 3}};

    Issue decoded = IssueSerializer::issueFromJson(IssueSerializer::issueToJson(issue));
    REQUIRE(decoded == issue);
}

TEST_CASE("Deserialize issue normalizes legacy status", "[IssueSerializer]") {
    auto j = IssueSerializer::issueToJson(makeIssue("x"));
    j["status"] = "done";

    REQUIRE(IssueSerializer::issueFromJson(j).status == IssueStatus::Completed);
}

TEST_CASE("Deserialize issue tolerates missing optional keys", "[IssueSerializer]") {
    json j = {
        {"id", "min"},
        {"title", "Minimal"},
        {"status", "open"},
        {"priority", 3},
        {"issue_type", "bug"},
        {"created_at", "2026-01-01T00:00:00"},
        {"updated_at", "2026-01-01T00:00:00"}
    };

    Issue issue = IssueSerializer::issueFromJson(j);
    REQUIRE(issue.description.empty());
    REQUIRE_FALSE(issue.assignee.has_value());
    REQUIRE(issue.metadata.is_object());
}

TEST_CASE("Deserialize issue rejects malformed records", "[IssueSerializer]") {
    auto valid = IssueSerializer::issueToJson(makeIssue("x"));

    SECTION("not an object") {
        REQUIRE_THROWS(IssueSerializer::issueFromJson(json::array()));
    }

    SECTION("missing id") {
        valid.erase("id");
        REQUIRE_THROWS(IssueSerializer::issueFromJson(valid));
    }

    SECTION("unknown status") {
        valid["status"] = "paused";
        REQUIRE_THROWS_AS(IssueSerializer::issueFromJson(valid), ValidationError);
    }

    SECTION("priority out of range") {
        valid["priority"] = 9;
        REQUIRE_THROWS_AS(IssueSerializer::issueFromJson(valid), ValidationError);

        valid["priority"] = 4294967297LL;
        REQUIRE_THROWS_AS(IssueSerializer::issueFromJson(valid), ValidationError);

        valid["priority"] = 1.5;
        REQUIRE_THROWS_AS(IssueSerializer::issueFromJson(valid), ValidationError);
    }

    SECTION("bad timestamp") {
        valid["created_at"] = "soon";
        REQUIRE_THROWS(IssueSerializer::issueFromJson(valid));
    }
}

// =============================================================================
// Dependency encoding
// =============================================================================

TEST_CASE("Serialize dependency", "[IssueSerializer]") {
    auto j = IssueSerializer::dependencyToJson(makeDependency("a", "b", DependencyType::ParentChild));

    REQUIRE(j["from_id"] == "a");
    REQUIRE(j["to_id"] == "b");
    REQUIRE(j["dep_type"] == "parent-child");

    REQUIRE(IssueSerializer::dependencyFromJson(j) == makeDependency("a", "b", DependencyType::ParentChild));
}

// =============================================================================
// Event payloads
// =============================================================================

TEST_CASE("Updated payload keeps old/new shape", "[IssueSerializer][Event]") {
    UpdatedChange change;
    change.fields["status"] = {"open", "in_progress"};
    change.fields["priority"] = {2, 0};

    auto j = IssueSerializer::changeToJson(change);
    REQUIRE(j["status"]["old"] == "open");
    REQUIRE(j["status"]["new"] == "in_progress");
    REQUIRE(j["priority"]["new"] == 0);

    auto decoded = IssueSerializer::changeFromJson("updated", j);
    REQUIRE(std::holds_alternative<UpdatedChange>(decoded));
    REQUIRE(std::get<UpdatedChange>(decoded).fields.at("priority").oldValue == 2);
}

TEST_CASE("Payload alternative follows event type", "[IssueSerializer][Event]") {
    SECTION("created carries the issue") {
        auto j = IssueSerializer::changeToJson(CreatedChange{makeIssue("c")});
        REQUIRE(j["issue"]["id"] == "c");
        auto decoded = IssueSerializer::changeFromJson("created", j);
        REQUIRE(std::get<CreatedChange>(decoded).issue.id == "c");
    }

    SECTION("closed carries a reason") {
        auto j = IssueSerializer::changeToJson(ReasonChange{"Duplicate"});
        REQUIRE(j == json{{"reason", "Duplicate"}});
        REQUIRE(std::get<ReasonChange>(IssueSerializer::changeFromJson("closed", j)).reason == "Duplicate");
    }

    SECTION("dependency_removed omits dep_type") {
        auto j = IssueSerializer::changeToJson(DependencyChange{"a", "b", std::nullopt});
        REQUIRE(j == json{{"from_id", "a"}, {"to_id", "b"}});

        auto added = IssueSerializer::changeToJson(DependencyChange{"a", "b", DependencyType::Blocks});
        REQUIRE(added["dep_type"] == "blocks");
    }

    SECTION("unknown event types stay opaque") {
        json payload = {{"anything", {1, 2, 3}}};
        auto decoded = IssueSerializer::changeFromJson("claimed", payload);
        REQUIRE(std::holds_alternative<OpaqueChange>(decoded));
        REQUIRE(IssueSerializer::changeToJson(decoded) == payload);
    }
}

TEST_CASE("Event record encoding", "[IssueSerializer][Event]") {
    IssueEvent event{
        .id = "e1",
        .issueId = "i1",
        .eventType = "session_ended",
        .actor = "tester",
        .changes = ReasonChange{"session terminated"},
        .timestamp = testTime(5),
        .sessionId = "s1"
    };

    auto j = IssueSerializer::eventToJson(event);
    REQUIRE(j["issue_id"] == "i1");
    REQUIRE(j["session_id"] == "s1");
    REQUIRE(j["changes"]["reason"] == "session terminated");

    event.sessionId.reset();
    j = IssueSerializer::eventToJson(event);
    REQUIRE(j["session_id"].is_null());

    IssueEvent decoded = IssueSerializer::eventFromJson(j);
    REQUIRE(decoded.id == "e1");
    REQUIRE(decoded.actor == "tester");
    REQUIRE(decoded.timestamp == testTime(5));
    REQUIRE_FALSE(decoded.sessionId.has_value());
}
