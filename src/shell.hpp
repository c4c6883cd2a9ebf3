#pragma once

#include "config.hpp"
#include "provider.hpp"
#include "query.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

ViewOptions view_options_from(const Settings& settings);
CycleSearchOptions cycle_options_from(const Settings& settings);

// Terminal front end over the query interface. Queries run on worker tasks;
// all rendering happens on the thread calling run().
class Shell {
public:
    Shell(Settings settings, SessionState session, MetadataProvider& provider, std::ostream& out);

    // Prints the welcome text on first run and persists that it was shown.
    void show_welcome_if_needed();

    // Submits one query per package and renders each result as it completes.
    // Returns the number of queries that ended in a lookup error.
    size_t run(QueryKind kind, const std::vector<std::string>& packages);

    void print_debug_info(std::string_view version);

    const SessionState& session() const { return session_; }

private:
    bool render(const QueryOutcome& outcome);

    const Settings settings_;
    SessionState session_;
    MetadataProvider& provider_;
    std::ostream& out_;
};
