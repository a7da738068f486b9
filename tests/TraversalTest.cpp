#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>

#include "Fakes.hpp"

using Order = std::vector<std::string>;

namespace {

// A -> {B, C}, B -> {D}
FakeLinkSource sampleGraph() {
    return FakeLinkSource { { "A", { "B", "C" } }, { "B", { "D" } } };
}

}

TEST(TraversalTest, BreadthFirstVisitsLevelByLevel) {
    auto source = sampleGraph();
    Traversal traversal(source, "A", Strategy::BreadthFirst);
    EXPECT_EQ(drain(traversal), (Order { "A", "B", "C", "D" }));
}

TEST(TraversalTest, DepthFirstExploresMostRecentlyPushedFirst) {
    auto source = sampleGraph();
    Traversal traversal(source, "A", Strategy::DepthFirst);
    EXPECT_EQ(drain(traversal), (Order { "A", "C", "B", "D" }));
}

TEST(TraversalTest, CreateResolvesStrategyByName) {
    auto source = sampleGraph();
    auto traversal = Traversal::create(source, "A", "depth-first");
    EXPECT_EQ(traversal.strategy(), Strategy::DepthFirst);
    EXPECT_EQ(drain(traversal), (Order { "A", "C", "B", "D" }));
}

TEST(TraversalTest, DefaultStrategyIsBreadthFirst) {
    auto source = sampleGraph();
    Traversal traversal(source, "A");
    EXPECT_EQ(traversal.strategy(), Strategy::BreadthFirst);
    EXPECT_EQ(drain(traversal), (Order { "A", "B", "C", "D" }));
}

TEST(TraversalTest, UnknownStrategyFailsBeforeAnyWork) {
    auto source = sampleGraph();
    EXPECT_THROW(Traversal::create(source, "A", "XYZ"), UnknownStrategy);
    EXPECT_TRUE(source.calls.empty());
}

TEST(TraversalTest, EachUrlIsEmittedOnceDespiteManyPaths) {
    FakeLinkSource source {
        { "A", { "B", "C", "B" } },
        { "B", { "C", "A" } },
        { "C", { "B", "A", "C" } },
    };
    Traversal traversal(source, "A", Strategy::BreadthFirst);

    EXPECT_EQ(drain(traversal), (Order { "A", "B", "C" }));
    EXPECT_EQ(traversal.stats().visited, 3u);
    EXPECT_GT(traversal.stats().duplicatesSkipped, 0u);
    EXPECT_EQ(source.calls, (Order { "A", "B", "C" }));
}

TEST(TraversalTest, CyclesTerminate) {
    FakeLinkSource source {
        { "A", { "B" } },
        { "B", { "C" } },
        { "C", { "A", "B", "C" } },
    };
    for (const auto strategy : { Strategy::DepthFirst, Strategy::BreadthFirst }) {
        source.calls.clear();
        Traversal traversal(source, "A", strategy);
        const auto order = drain(traversal);
        EXPECT_EQ(order.size(), 3u);
        EXPECT_LE(traversal.stats().visited, source.graph.size());
        EXPECT_EQ(traversal.state(), Traversal::State::Done);
    }
}

TEST(TraversalTest, VisitedSetMatchesEmittedUrls) {
    FakeLinkSource source {
        { "A", { "B", "C" } },
        { "B", { "D", "E" } },
        { "C", { "E", "F" } },
        { "E", { "A" } },
    };
    Traversal traversal(source, "A", Strategy::DepthFirst);

    std::set<std::string> emitted;
    while (auto url = traversal.next()) {
        EXPECT_FALSE(emitted.count(*url)) << *url;
        emitted.insert(*url);
        EXPECT_EQ(traversal.visited().size(), emitted.size());
        for (const auto& seen : emitted) EXPECT_TRUE(traversal.visited().contains(seen));
    }
    EXPECT_EQ(emitted.size(), 6u);
}

TEST(TraversalTest, FetchFailureIsAbsorbedAndReported) {
    FakeLinkSource source {
        { "A", { "B", "X" } },
        { "B", { "C" } },
        { "X", { "Y" } },
    };
    source.failing.insert("X");

    std::ostringstream log;
    std::vector<std::pair<std::string, std::string>> failures;
    Traversal traversal(source, "A", Strategy::BreadthFirst);
    traversal.setLogStream(log);
    traversal.onFetchFailure([&](const std::string& url, const std::string& error) {
        failures.emplace_back(url, error);
    });

    EXPECT_EQ(drain(traversal), (Order { "A", "B", "X", "C" }));
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].first, "X");
    EXPECT_EQ(failures[0].second, "connection refused");
    EXPECT_EQ(traversal.stats().fetchFailures, 1u);
    EXPECT_NE(log.str().find("Fetch failure (connection refused): X"), std::string::npos);
    EXPECT_EQ(traversal.state(), Traversal::State::Done);
}

TEST(TraversalTest, FailingStartPageStillEmitsIt) {
    FakeLinkSource source { { "A", { "B" } } };
    source.failing.insert("A");
    std::ostringstream log;
    Traversal traversal(source, "A");
    traversal.setLogStream(log);
    EXPECT_EQ(drain(traversal), (Order { "A" }));
}

TEST(TraversalTest, ConsecutiveFailureLimitAbortsWhenEnabled) {
    FakeLinkSource source { { "A", { "B", "C", "D" } } };
    source.failing = { "B", "C", "D" };
    std::ostringstream log;
    Traversal traversal(source, "A", Strategy::BreadthFirst);
    traversal.setLogStream(log);
    traversal.setMaxConsecutiveFailures(2);

    EXPECT_EQ(traversal.next(), std::optional<std::string>("A"));
    EXPECT_EQ(traversal.next(), std::optional<std::string>("B"));
    EXPECT_EQ(traversal.next(), std::optional<std::string>("C"));
    EXPECT_THROW(traversal.next(), TraversalAborted);
    EXPECT_EQ(traversal.state(), Traversal::State::Failed);
    EXPECT_FALSE(traversal.next().has_value());
    EXPECT_NE(log.str().find("Aborting traversal"), std::string::npos);
}

TEST(TraversalTest, SuccessResetsConsecutiveFailureCount) {
    FakeLinkSource source {
        { "A", { "B", "C", "D", "E" } },
        { "C", {} },
    };
    source.failing = { "B", "D", "E" };
    std::ostringstream log;
    Traversal traversal(source, "A", Strategy::BreadthFirst);
    traversal.setLogStream(log);
    traversal.setMaxConsecutiveFailures(2);

    // B fails, C succeeds, D fails, E fails -> abort only after E
    EXPECT_EQ(traversal.next(), std::optional<std::string>("A"));
    EXPECT_EQ(traversal.next(), std::optional<std::string>("B"));
    EXPECT_EQ(traversal.next(), std::optional<std::string>("C"));
    EXPECT_EQ(traversal.next(), std::optional<std::string>("D"));
    EXPECT_EQ(traversal.next(), std::optional<std::string>("E"));
    EXPECT_THROW(traversal.next(), TraversalAborted);
}

TEST(TraversalTest, LinksAreRequestedOnlyWhenTheNextPageIsAskedFor) {
    auto source = sampleGraph();
    Traversal traversal(source, "A");
    EXPECT_EQ(traversal.state(), Traversal::State::Init);

    EXPECT_EQ(traversal.next(), std::optional<std::string>("A"));
    EXPECT_EQ(traversal.state(), Traversal::State::Running);
    EXPECT_TRUE(source.calls.empty());

    EXPECT_EQ(traversal.next(), std::optional<std::string>("B"));
    EXPECT_EQ(source.calls, (Order { "A" }));
}

TEST(TraversalTest, PageLimitStopsWithoutExpandingTheLastPage) {
    auto source = sampleGraph();
    Traversal traversal(source, "A", Strategy::BreadthFirst);
    traversal.setMaxPages(2);

    EXPECT_EQ(drain(traversal), (Order { "A", "B" }));
    EXPECT_EQ(source.calls, (Order { "A" }));
    EXPECT_EQ(traversal.pending(), 0u);
    EXPECT_EQ(traversal.state(), Traversal::State::Done);
}

TEST(TraversalTest, DepthLimitStopsExpansion) {
    FakeLinkSource source {
        { "A", { "B" } },
        { "B", { "C" } },
        { "C", { "D" } },
    };
    std::vector<std::pair<std::string, std::size_t>> depths;
    Traversal traversal(source, "A", Strategy::DepthFirst);
    traversal.setMaxDepth(1);
    traversal.onVisit([&](const std::string& url, std::size_t depth) { depths.emplace_back(url, depth); });

    EXPECT_EQ(drain(traversal), (Order { "A", "B" }));
    EXPECT_EQ(source.calls, (Order { "A" }));
    ASSERT_EQ(depths.size(), 2u);
    EXPECT_EQ(depths[0].second, 0u);
    EXPECT_EQ(depths[1].second, 1u);
}

TEST(TraversalTest, DisallowedPagesAreSkippedNotEmitted) {
    auto source = sampleGraph();
    DenyList robots({ "B" });
    std::ostringstream log;
    std::vector<std::string> skipped;

    Traversal traversal(source, "A", Strategy::BreadthFirst);
    traversal.setLogStream(log);
    traversal.setPermissionCheck(robots, "SiteWalker");
    traversal.onDisallowed([&](const std::string& url) { skipped.push_back(url); });

    EXPECT_EQ(drain(traversal), (Order { "A", "C" }));
    EXPECT_EQ(skipped, (Order { "B" }));
    EXPECT_EQ(traversal.stats().disallowed, 1u);
    EXPECT_FALSE(traversal.visited().contains("B"));
    EXPECT_EQ(source.calls, (Order { "A", "C" }));
    EXPECT_EQ(robots.queries.front().second, "SiteWalker");
    EXPECT_NE(log.str().find("Disallowed by robots.txt: B"), std::string::npos);
}

TEST(TraversalTest, DisallowedUrlIsReportedOnceWhateverLinksToIt) {
    FakeLinkSource source {
        { "A", { "X", "B", "C" } },
        { "B", { "X" } },
        { "C", { "X", "B" } },
    };
    DenyList robots({ "X" });
    std::ostringstream log;
    std::vector<std::string> skipped;

    Traversal traversal(source, "A", Strategy::DepthFirst);
    traversal.setLogStream(log);
    traversal.setPermissionCheck(robots);
    traversal.onDisallowed([&](const std::string& url) { skipped.push_back(url); });

    EXPECT_EQ(drain(traversal), (Order { "A", "C", "B" }));
    EXPECT_EQ(skipped, (Order { "X" }));
    EXPECT_EQ(traversal.stats().disallowed, 1u);
    const auto asked = std::count_if(robots.queries.begin(), robots.queries.end(),
        [](const std::pair<std::string, std::string>& q) { return q.first == "X"; });
    EXPECT_EQ(asked, 1);
    EXPECT_EQ(log.str().find("Disallowed by robots.txt: X"), log.str().rfind("Disallowed by robots.txt: X"));
}

TEST(TraversalTest, FinishedTraversalStaysFinished) {
    FakeLinkSource source;
    Traversal traversal(source, "only");
    EXPECT_EQ(drain(traversal), (Order { "only" }));
    EXPECT_FALSE(traversal.next().has_value());
    EXPECT_EQ(source.calls, (Order { "only" }));
}

TEST(TraversalTest, RunDrainsThroughCallbacks) {
    auto source = sampleGraph();
    Order visited;
    Traversal traversal(source, "A", Strategy::DepthFirst);
    traversal.onVisit([&](const std::string& url, std::size_t) { visited.push_back(url); });

    const TraversalStats& stats = traversal.run();
    EXPECT_EQ(visited, (Order { "A", "C", "B", "D" }));
    EXPECT_EQ(stats.visited, 4u);
    EXPECT_EQ(stats.fetchFailures, 0u);
}

TEST(TraversalTest, FreshInstancesDoNotShareState) {
    auto source = sampleGraph();
    Traversal first(source, "A");
    Traversal second(source, "A");
    EXPECT_EQ(drain(first), drain(second));
}
