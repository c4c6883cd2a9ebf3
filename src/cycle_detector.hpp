#pragma once

#include "graph.hpp"
#include "provider.hpp"

#include <string>
#include <unordered_set>
#include <vector>

// Path that returns to its origin: first and last elements are equal.
using Cycle = std::vector<PackageName>;

enum class CycleSearchMode {
    // Each package is expanded at most once per search. Cycles that loop back
    // into an already cleared subtree through another parent are not reported.
    MEMOIZED,
    // Follows every simple path from the root. Cost grows with the number of
    // paths; bound it with max_depth on large graphs.
    EXHAUSTIVE
};

struct CycleSearchOptions {
    size_t breadth_limit = 10;
    CycleSearchMode mode = CycleSearchMode::MEMOIZED;
    // Longest path followed in exhaustive mode, 0 for no limit.
    size_t max_depth = 0;
};

struct CycleReport {
    PackageName root;
    QueryStatus status = QueryStatus::OK;
    std::string detail;
    std::vector<Cycle> cycles;
    // Packages below the root whose lookup failed; treated as leaves.
    std::vector<PackageName> failed_lookups;
    size_t provider_calls = 0;
    DependencyGraph graph;

    bool ok() const { return status == QueryStatus::OK; }
};

class CycleDetector {
public:
    explicit CycleDetector(MetadataProvider& provider, CycleSearchOptions options = {});

    CycleReport find_cycles(const std::string& root);

private:
    struct TraversalState {
        std::unordered_set<PackageName> visited;
        std::vector<PackageName> path;
    };

    void visit(const PackageName& pkg, TraversalState& state, CycleReport& report);
    const std::vector<PackageName>& fetch(const PackageName& pkg, CycleReport& report);

    MetadataProvider& provider_;
    CycleSearchOptions options_;
};
