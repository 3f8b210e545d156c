#include <catch2/catch.hpp>
#include "issues/Errors.hpp"
#include "storage/IssueStorage.hpp"
#include "TestHelpers.hpp"
#include <fstream>

using namespace issues;
using storage::IssueStorage;

namespace {

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

IssueEvent makeEvent(const std::string& id, const std::string& issueId, std::optional<std::string> sessionId) {
    return IssueEvent{
        .id = id,
        .issueId = issueId,
        .eventType = event_types::kClosed,
        .actor = "tester",
        .changes = ReasonChange{"Completed"},
        .timestamp = testTime(1),
        .sessionId = std::move(sessionId)
    };
}

} // anonymous namespace

TEST_CASE("IssueStorage creates its data directory", "[IssueStorage]") {
    TempDirectory temp;
    auto dir = temp.path() / "nested" / "issues";

    IssueStorage store(dir);

    REQUIRE(std::filesystem::is_directory(dir));
    REQUIRE(store.issuesPath() == dir / "issues.jsonl");
    REQUIRE(store.dependenciesPath() == dir / "dependencies.jsonl");
    REQUIRE(store.eventsPath() == dir / "events.jsonl");
}

TEST_CASE("IssueStorage loads absent files as empty", "[IssueStorage]") {
    TempDirectory temp;
    IssueStorage store(temp.path());

    REQUIRE(store.loadIssues().empty());
    REQUIRE(store.loadDependencies().empty());
    REQUIRE(store.loadEvents().empty());
}

TEST_CASE("IssueStorage snapshot preserves records and order", "[IssueStorage]") {
    TempDirectory temp;
    IssueStorage store(temp.path());

    std::vector<Issue> snapshot;
    for (int i = 0; i < 5; ++i) {
        snapshot.push_back(makeIssue("issue-" + std::to_string(4 - i), i % 5, IssueStatus::Open, i));
    }
    snapshot[2].metadata = json{{"labels", {"ui"}}};
    snapshot[3].assignee = "bob";

    std::vector<Dependency> deps = {
        makeDependency("issue-0", "issue-1"),
        makeDependency("issue-1", "issue-2", DependencyType::DiscoveredFrom),
        makeDependency("issue-3", "issue-4", DependencyType::Related)
    };

    store.saveIssues(snapshot);
    store.saveDependencies(deps);

    REQUIRE(store.loadIssues() == snapshot);
    REQUIRE(store.loadDependencies() == deps);
}

TEST_CASE("IssueStorage save replaces the previous snapshot", "[IssueStorage]") {
    TempDirectory temp;
    IssueStorage store(temp.path());

    store.saveIssues({makeIssue("a"), makeIssue("b")});
    store.saveIssues({makeIssue("c")});

    auto loaded = store.loadIssues();
    REQUIRE(loaded.size() == 1);
    REQUIRE(loaded[0].id == "c");

    // No temp files left behind
    size_t fileCount = 0;
    for (const auto& entry : std::filesystem::directory_iterator(temp.path())) {
        (void)entry;
        ++fileCount;
    }
    REQUIRE(fileCount == 1);
}

TEST_CASE("IssueStorage skips blank lines", "[IssueStorage]") {
    TempDirectory temp;
    IssueStorage store(temp.path());
    store.saveIssues({makeIssue("a"), makeIssue("b")});

    std::ifstream in(store.issuesPath());
    std::string first, second;
    std::getline(in, first);
    std::getline(in, second);
    in.close();

    writeFile(store.issuesPath(), "\n" + first + "\n   \n" + second + "\n\n");

    auto loaded = store.loadIssues();
    REQUIRE(loaded.size() == 2);
    REQUIRE(loaded[0].id == "a");
    REQUIRE(loaded[1].id == "b");
}

TEST_CASE("IssueStorage reports malformed lines", "[IssueStorage]") {
    TempDirectory temp;
    IssueStorage store(temp.path());

    SECTION("invalid JSON") {
        writeFile(store.issuesPath(), "{\"id\": \"a\"\n");
        REQUIRE_THROWS_AS(store.loadIssues(), StorageError);
    }

    SECTION("valid JSON with a bad record") {
        writeFile(store.dependenciesPath(), "{\"from_id\": \"a\"}\n");
        REQUIRE_THROWS_AS(store.loadDependencies(), StorageError);
    }

    SECTION("invalid event line") {
        writeFile(store.eventsPath(), "not json\n");
        REQUIRE_THROWS_AS(store.loadEvents(), StorageError);
    }
}

TEST_CASE("IssueStorage appends events in order", "[IssueStorage]") {
    TempDirectory temp;
    IssueStorage store(temp.path());

    store.appendEvent(makeEvent("e1", "a", "s1"));
    store.appendEvent(makeEvent("e2", "b", std::nullopt));
    store.appendEvent(makeEvent("e3", "a", "s2"));

    auto events = store.loadEvents();
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].id == "e1");
    REQUIRE(events[1].id == "e2");
    REQUIRE(events[2].id == "e3");
    REQUIRE(events[0].sessionId == std::optional<std::string>("s1"));
    REQUIRE_FALSE(events[1].sessionId.has_value());
    REQUIRE(std::get<ReasonChange>(events[2].changes).reason == "Completed");
}

TEST_CASE("IssueStorage reports records it cannot encode", "[IssueStorage]") {
    TempDirectory temp;
    IssueStorage store(temp.path());
    store.saveIssues({makeIssue("a")});

    Issue bad = makeIssue("b");
    bad.title = "broken \xff title";

    REQUIRE_THROWS_AS(store.saveIssues({makeIssue("a"), bad}), StorageError);
    REQUIRE(store.loadIssues().size() == 1);

    IssueEvent event = makeEvent("e1", "a", std::nullopt);
    event.changes = ReasonChange{"bad\xff"};
    REQUIRE_THROWS_AS(store.appendEvent(event), StorageError);
    REQUIRE(store.loadEvents().empty());
}
