#include "query.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

void ResultQueue::push(QueryOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        outcomes.push_back(std::move(outcome));
    }
    cv.notify_one();
}

QueryOutcome ResultQueue::wait_pop() {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !outcomes.empty(); });
    QueryOutcome outcome = std::move(outcomes.front());
    outcomes.pop_front();
    return outcome;
}

std::optional<QueryOutcome> ResultQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mtx);
    if (outcomes.empty()) return std::nullopt;
    QueryOutcome outcome = std::move(outcomes.front());
    outcomes.pop_front();
    return outcome;
}

QueryDispatcher::QueryDispatcher(MetadataProvider& provider, ViewOptions view_options, CycleSearchOptions cycle_options)
    : provider_(provider), view_options_(view_options), cycle_options_(cycle_options) {}

QueryDispatcher::~QueryDispatcher() {
    for (auto& task : tasks_) {
        if (task.valid()) task.wait();
    }
}

uint64_t QueryDispatcher::submit(QueryKind kind, const std::string& package) {
    QueryRequest request{.id = next_id_++, .kind = kind, .package = require_package_name(package)};
    log_debug(string_format("debug.query_submitted", request.id, request.package));

    tasks_.push_back(std::async(std::launch::async, [this, request] {
        results_.push(execute(request));
    }));
    ++submitted_;
    return request.id;
}

QueryOutcome QueryDispatcher::wait_next() {
    if (delivered_ >= submitted_) {
        throw DepviewException(get_string("error.no_pending_queries"));
    }
    QueryOutcome outcome = results_.wait_pop();
    ++delivered_;
    return outcome;
}

size_t QueryDispatcher::in_flight() const {
    return submitted_ - delivered_;
}

QueryOutcome QueryDispatcher::execute(const QueryRequest& request) {
    QueryOutcome outcome{.request = request};
    try {
        switch (request.kind) {
            case QueryKind::DEPENDENCIES: {
                GraphBuilder builder(provider_, view_options_);
                outcome.result = builder.build_dependency_view(request.package);
                break;
            }
            case QueryKind::REVERSE_DEPENDENCIES: {
                GraphBuilder builder(provider_, view_options_);
                outcome.result = builder.build_reverse_view(request.package);
                break;
            }
            case QueryKind::CYCLES: {
                CycleDetector detector(provider_, cycle_options_);
                outcome.result = detector.find_cycles(request.package);
                break;
            }
        }
    } catch (const std::exception& e) {
        outcome.error = e.what();
        log_debug(string_format("debug.query_failed", request.id, e.what()));
    }
    return outcome;
}
