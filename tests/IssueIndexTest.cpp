#include <catch2/catch.hpp>
#include "issues/IssueIndex.hpp"
#include "TestHelpers.hpp"

using namespace issues;

TEST_CASE("IssueIndex stores issues in insertion order", "[IssueIndex]") {
    IssueIndex index;
    index.addIssue(makeIssue("c"));
    index.addIssue(makeIssue("a"));
    index.addIssue(makeIssue("b"));

    REQUIRE(index.issueCount() == 3);
    const auto& all = index.getAllIssues();
    REQUIRE(all[0].id == "c");
    REQUIRE(all[1].id == "a");
    REQUIRE(all[2].id == "b");
}

TEST_CASE("IssueIndex replaces an issue with the same id", "[IssueIndex]") {
    IssueIndex index;
    index.addIssue(makeIssue("a", 2));
    index.addIssue(makeIssue("b", 2));
    index.addIssue(makeIssue("a", 0));

    REQUIRE(index.issueCount() == 2);
    REQUIRE(index.getAllIssues()[0].id == "a");
    REQUIRE(index.getIssue("a")->priority == 0);
}

TEST_CASE("IssueIndex lookups", "[IssueIndex]") {
    IssueIndex index;
    index.addIssue(makeIssue("a"));

    REQUIRE(index.hasIssue("a"));
    REQUIRE_FALSE(index.hasIssue("z"));
    REQUIRE(index.findIssue("z") == nullptr);
    REQUIRE_FALSE(index.getIssue("z").has_value());

    SECTION("mutable lookup edits in place") {
        Issue* issue = index.findIssue("a");
        REQUIRE(issue != nullptr);
        issue->title = "Renamed";
        REQUIRE(index.getIssue("a")->title == "Renamed");
    }
}

TEST_CASE("IssueIndex filters issues", "[IssueIndex]") {
    IssueIndex index;
    Issue bug = makeIssue("bug", 1);
    bug.issueType = IssueType::Bug;
    bug.assignee = "alice";
    Issue feature = makeIssue("feature", 1, IssueStatus::InProgress);
    feature.issueType = IssueType::Feature;
    Issue chore = makeIssue("chore", 3);
    chore.issueType = IssueType::Chore;
    chore.assignee = "bob";

    index.addIssue(bug);
    index.addIssue(feature);
    index.addIssue(chore);

    REQUIRE(index.listIssues().size() == 3);
    REQUIRE(index.listIssues({.status = IssueStatus::Open}).size() == 2);
    REQUIRE(index.listIssues({.priority = 1}).size() == 2);
    REQUIRE(index.listIssues({.issueType = IssueType::Chore})[0].id == "chore");
    REQUIRE(index.listIssues({.assignee = "alice"})[0].id == "bug");

    auto combined = index.listIssues({.status = IssueStatus::Open, .priority = 1});
    REQUIRE(combined.size() == 1);
    REQUIRE(combined[0].id == "bug");

    REQUIRE(index.listIssues({.status = IssueStatus::Closed}).empty());
}

TEST_CASE("IssueIndex tracks dependency adjacency", "[IssueIndex]") {
    IssueIndex index;
    for (const auto* id : {"a", "b", "c"}) {
        index.addIssue(makeIssue(id));
    }

    index.addDependency(makeDependency("a", "c"));
    index.addDependency(makeDependency("a", "b"));
    index.addDependency(makeDependency("b", "c", DependencyType::Related));

    REQUIRE(index.dependencyCount() == 3);
    REQUIRE(index.hasDependency("a", "b"));
    REQUIRE_FALSE(index.hasDependency("b", "a"));

    REQUIRE(index.getBlockers("a") == std::vector<std::string>{"b", "c"});
    REQUIRE(index.getDependents("c") == std::vector<std::string>{"a", "b"});
    REQUIRE(index.getBlockers("c").empty());
    REQUIRE(index.getDependents("unknown").empty());

    const Dependency* dep = index.findDependency("b", "c");
    REQUIRE(dep != nullptr);
    REQUIRE(dep->depType == DependencyType::Related);

    auto all = index.getAllDependencies();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].toId == "b");
    REQUIRE(all[1].toId == "c");
    REQUIRE(all[2].fromId == "b");
}

TEST_CASE("IssueIndex removes dependencies", "[IssueIndex]") {
    IssueIndex index;
    index.addDependency(makeDependency("a", "b"));
    index.addDependency(makeDependency("a", "c"));

    REQUIRE(index.removeDependency("a", "b"));
    REQUIRE_FALSE(index.removeDependency("a", "b"));
    REQUIRE_FALSE(index.removeDependency("b", "a"));

    REQUIRE(index.dependencyCount() == 1);
    REQUIRE(index.getBlockers("a") == std::vector<std::string>{"c"});
    REQUIRE(index.getDependents("b").empty());
}

TEST_CASE("IssueIndex replaces an edge for the same pair", "[IssueIndex]") {
    IssueIndex index;
    index.addDependency(makeDependency("a", "b"));
    index.addDependency(makeDependency("a", "b", DependencyType::ParentChild));

    REQUIRE(index.dependencyCount() == 1);
    REQUIRE(index.findDependency("a", "b")->depType == DependencyType::ParentChild);
}
