#include <gtest/gtest.h>
#include "../src/cycle_detector.hpp"
#include "../src/exception.hpp"
#include "test_support.hpp"

using Cycles = std::vector<Cycle>;

class CycleDetectorTest : public ::testing::Test {
protected:
    StubProvider provider;

    void SetUp() override {
        init_test_localization();
    }

    // Every reported cycle must be a closed walk over real edges.
    void expect_well_formed(const CycleReport& report) {
        for (const auto& cycle : report.cycles) {
            ASSERT_GE(cycle.size(), 2u);
            EXPECT_EQ(cycle.front(), cycle.back());
            for (size_t i = 0; i + 1 < cycle.size(); ++i) {
                EXPECT_TRUE(provider.has_edge(cycle[i], cycle[i + 1])) << cycle[i] << " -> " << cycle[i + 1];
                EXPECT_TRUE(report.graph.has_edge(cycle[i], cycle[i + 1]));
            }
        }
    }
};

TEST_F(CycleDetectorTest, FindsSimpleCycle) {
    provider.set_dependencies("a", {"b", "c"});
    provider.set_dependencies("b", {"a"});

    CycleDetector detector(provider);
    auto report = detector.find_cycles("a");

    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.cycles, (Cycles{{"a", "b", "a"}}));
    EXPECT_TRUE(report.failed_lookups.empty());
    expect_well_formed(report);
}

TEST_F(CycleDetectorTest, SelfDependency) {
    provider.set_dependencies("a", {"a"});

    CycleDetector detector(provider);
    auto report = detector.find_cycles("a");

    EXPECT_EQ(report.cycles, (Cycles{{"a", "a"}}));
    expect_well_formed(report);
}

TEST_F(CycleDetectorTest, AcyclicGraph) {
    provider.set_dependencies("app", {"lib1", "lib2"});
    provider.set_dependencies("lib1", {"libc"});
    provider.set_dependencies("lib2", {"libc"});

    CycleDetector detector(provider);
    auto report = detector.find_cycles("app");

    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.cycles.empty());
    EXPECT_EQ(provider.calls("libc"), 1u);
}

TEST_F(CycleDetectorTest, BreadthLimitCapsChildren) {
    std::vector<std::string> deps;
    for (int i = 0; i < 15; ++i) deps.push_back("dep" + std::to_string(i));
    provider.set_dependencies("root", deps);

    CycleDetector detector(provider);
    auto report = detector.find_cycles("root");

    for (int i = 0; i < 10; ++i) EXPECT_EQ(provider.calls(deps[i]), 1u) << deps[i];
    for (int i = 10; i < 15; ++i) EXPECT_EQ(provider.calls(deps[i]), 0u) << deps[i];
    EXPECT_EQ(report.provider_calls, 11u);
}

TEST_F(CycleDetectorTest, CustomBreadthLimit) {
    provider.set_dependencies("a", {"x", "b"});
    provider.set_dependencies("b", {"a"});

    CycleDetector detector(provider, CycleSearchOptions{.breadth_limit = 1});
    auto report = detector.find_cycles("a");

    EXPECT_TRUE(report.cycles.empty());
    EXPECT_EQ(provider.calls("b"), 0u);
}

TEST_F(CycleDetectorTest, CyclesMatchProviderEdges) {
    provider.set_dependencies("a", {"b", "c", "d"});
    provider.set_dependencies("b", {"c", "a"});
    provider.set_dependencies("c", {"d", "b"});
    provider.set_dependencies("d", {"a", "d"});

    CycleDetector detector(provider);
    auto report = detector.find_cycles("a");

    EXPECT_FALSE(report.cycles.empty());
    expect_well_formed(report);
}

TEST_F(CycleDetectorTest, MemoizedSkipsClearedSubtrees) {
    provider.set_dependencies("a", {"b", "c"});
    provider.set_dependencies("b", {"c"});
    provider.set_dependencies("c", {"a"});

    CycleDetector detector(provider);
    auto report = detector.find_cycles("a");

    EXPECT_EQ(report.cycles, (Cycles{{"a", "b", "c", "a"}}));
}

TEST_F(CycleDetectorTest, ExhaustiveFollowsEveryPath) {
    provider.set_dependencies("a", {"b", "c"});
    provider.set_dependencies("b", {"c"});
    provider.set_dependencies("c", {"a"});

    CycleDetector detector(provider, CycleSearchOptions{.mode = CycleSearchMode::EXHAUSTIVE});
    auto report = detector.find_cycles("a");

    EXPECT_EQ(report.cycles, (Cycles{{"a", "b", "c", "a"}, {"a", "c", "a"}}));
    expect_well_formed(report);
    // Metadata is still fetched once per package.
    EXPECT_EQ(provider.calls("a"), 1u);
    EXPECT_EQ(provider.calls("b"), 1u);
    EXPECT_EQ(provider.calls("c"), 1u);
}

TEST_F(CycleDetectorTest, ExhaustiveRespectsMaxDepth) {
    provider.set_dependencies("a", {"b", "c"});
    provider.set_dependencies("b", {"c"});
    provider.set_dependencies("c", {"a"});

    CycleDetector detector(provider, CycleSearchOptions{.mode = CycleSearchMode::EXHAUSTIVE, .max_depth = 2});
    auto report = detector.find_cycles("a");

    EXPECT_EQ(report.cycles, (Cycles{{"a", "c", "a"}}));
}

TEST_F(CycleDetectorTest, RootFailureIsNotNoCycles) {
    provider.fail("ghost", QueryStatus::PROVIDER_UNAVAILABLE);

    CycleDetector detector(provider);
    auto report = detector.find_cycles("ghost");

    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.status, QueryStatus::PROVIDER_UNAVAILABLE);
    EXPECT_TRUE(report.cycles.empty());
    EXPECT_EQ(report.provider_calls, 1u);
}

TEST_F(CycleDetectorTest, FailedChildIsRecordedAndSearchContinues) {
    provider.set_dependencies("a", {"broken", "b"});
    provider.set_dependencies("b", {"a"});
    provider.fail("broken", QueryStatus::TIMED_OUT);

    CycleDetector detector(provider);
    auto report = detector.find_cycles("a");

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.failed_lookups, (std::vector<PackageName>{"broken"}));
    EXPECT_EQ(report.cycles, (Cycles{{"a", "b", "a"}}));
}

TEST_F(CycleDetectorTest, CyclesBelowRootInDiscoveryOrder) {
    provider.set_dependencies("a", {"b", "c"});
    provider.set_dependencies("b", {"b"});
    provider.set_dependencies("c", {"c"});

    CycleDetector detector(provider);
    auto report = detector.find_cycles("a");

    EXPECT_EQ(report.cycles, (Cycles{{"b", "b"}, {"c", "c"}}));
}

TEST_F(CycleDetectorTest, BlankRootThrows) {
    CycleDetector detector(provider);
    EXPECT_THROW(detector.find_cycles("  "), DepviewException);
    EXPECT_EQ(provider.total_calls(), 0u);
}
