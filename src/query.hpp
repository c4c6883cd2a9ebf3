#pragma once

#include "cycle_detector.hpp"
#include "graph_builder.hpp"
#include "provider.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class QueryKind {
    DEPENDENCIES,
    REVERSE_DEPENDENCIES,
    CYCLES
};

struct QueryRequest {
    uint64_t id = 0;
    QueryKind kind = QueryKind::DEPENDENCIES;
    PackageName package;
};

struct QueryOutcome {
    QueryRequest request;
    std::variant<std::monostate, DependencyView, CycleReport> result;
    // Set when the query threw instead of producing a result.
    std::string error;

    bool failed() const { return !error.empty(); }
};

// Hands finished outcomes from worker threads to the presentation thread.
class ResultQueue {
public:
    void push(QueryOutcome outcome);
    QueryOutcome wait_pop();
    std::optional<QueryOutcome> try_pop();

private:
    std::mutex mtx;
    std::condition_variable cv;
    std::deque<QueryOutcome> outcomes;
};

// Runs every submitted query on its own asynchronous task. Results arrive in
// completion order; nothing is cancelled or superseded.
class QueryDispatcher {
public:
    QueryDispatcher(MetadataProvider& provider, ViewOptions view_options, CycleSearchOptions cycle_options);
    ~QueryDispatcher();

    QueryDispatcher(const QueryDispatcher&) = delete;
    QueryDispatcher& operator=(const QueryDispatcher&) = delete;

    // Throws DepviewException for a blank package name, before any work starts.
    uint64_t submit(QueryKind kind, const std::string& package);

    // Blocks until the next query finishes.
    QueryOutcome wait_next();

    size_t in_flight() const;

private:
    QueryOutcome execute(const QueryRequest& request);

    MetadataProvider& provider_;
    const ViewOptions view_options_;
    const CycleSearchOptions cycle_options_;

    ResultQueue results_;
    std::vector<std::future<void>> tasks_;
    uint64_t next_id_ = 1;
    size_t submitted_ = 0;
    size_t delivered_ = 0;
};
