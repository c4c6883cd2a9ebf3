#include "cycle_detector.hpp"

#include "graph_builder.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>

CycleDetector::CycleDetector(MetadataProvider& provider, CycleSearchOptions options)
    : provider_(provider), options_(options) {
    if (options_.breadth_limit == 0) options_.breadth_limit = 1;
}

CycleReport CycleDetector::find_cycles(const std::string& root) {
    CycleReport report;
    report.root = require_package_name(root);

    // The root is fetched up front so a failed root lookup is reported as an
    // error instead of "no cycles".
    QueryResult first = provider_.get_direct_dependencies(report.root);
    ++report.provider_calls;
    report.status = first.status;
    report.detail = first.detail;
    if (!first.ok()) {
        log_debug(string_format("debug.root_lookup_failed", report.root, describe_status(first.status)));
        return report;
    }
    report.graph.add_record({report.root, std::move(first.packages)});

    TraversalState state;
    visit(report.root, state, report);

    log_debug(string_format("debug.cycle_search_done", report.root, report.cycles.size(), report.provider_calls));
    return report;
}

const std::vector<PackageName>& CycleDetector::fetch(const PackageName& pkg, CycleReport& report) {
    if (!report.graph.is_expanded(pkg)) {
        QueryResult result = provider_.get_direct_dependencies(pkg);
        ++report.provider_calls;
        if (!result.ok()) {
            report.failed_lookups.push_back(pkg);
            log_debug(string_format("debug.lookup_failed", pkg, describe_status(result.status)));
        }
        report.graph.add_record({pkg, std::move(result.packages)});
    }
    return report.graph.dependencies_of(pkg);
}

void CycleDetector::visit(const PackageName& pkg, TraversalState& state, CycleReport& report) {
    if (auto it = std::ranges::find(state.path, pkg); it != state.path.end()) {
        Cycle cycle(it, state.path.end());
        cycle.push_back(pkg);
        log_debug(string_format("debug.cycle_found", join(cycle, " -> ")));
        report.cycles.push_back(std::move(cycle));
        return;
    }

    if (options_.mode == CycleSearchMode::MEMOIZED) {
        if (state.visited.contains(pkg)) return;
        state.visited.insert(pkg);
    } else if (options_.max_depth > 0 && state.path.size() >= options_.max_depth) {
        return;
    }

    state.path.push_back(pkg);
    const std::vector<PackageName>& deps = fetch(pkg, report);
    const size_t limit = std::min(deps.size(), options_.breadth_limit);
    for (size_t i = 0; i < limit; ++i) {
        visit(deps[i], state, report);
    }
    state.path.pop_back();
}
