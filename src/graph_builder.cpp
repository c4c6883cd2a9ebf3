#include "graph_builder.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <unordered_set>

PackageName require_package_name(const std::string& raw) {
    PackageName name = normalize_package_name(raw);
    if (name.empty()) {
        throw DepviewException(get_string("error.empty_package_name"));
    }
    return name;
}

GraphBuilder::GraphBuilder(MetadataProvider& provider, ViewOptions options)
    : provider_(provider), options_(options) {}

std::vector<PackageName> GraphBuilder::prepare(std::vector<PackageName> names) const {
    if (!options_.deduplicate) return names;
    std::vector<PackageName> unique;
    std::unordered_set<PackageName> seen;
    for (auto& name : names) {
        if (seen.insert(name).second) unique.push_back(std::move(name));
    }
    return unique;
}

DependencyView GraphBuilder::build_dependency_view(const std::string& root) {
    DependencyView view;
    view.kind = ViewKind::DEPENDENCIES;
    view.root = require_package_name(root);

    QueryResult direct = provider_.get_direct_dependencies(view.root);
    view.status = direct.status;
    view.detail = direct.detail;
    if (!direct.ok()) {
        log_debug(string_format("debug.root_lookup_failed", view.root, describe_status(direct.status)));
        return view;
    }

    view.graph.add_record({view.root, direct.packages});

    for (auto& name : prepare(std::move(direct.packages))) {
        ViewEntry entry{.name = std::move(name)};
        if (options_.lookahead) {
            QueryResult sub = provider_.get_direct_dependencies(entry.name);
            entry.lookup_status = sub.status;
            if (sub.ok()) {
                entry.dependency_count = sub.packages.size();
                entry.annotated = true;
                view.graph.add_record({entry.name, std::move(sub.packages)});
            }
        }
        view.entries.push_back(std::move(entry));
    }
    log_debug(string_format("debug.view_built", view.root, view.entries.size()));
    return view;
}

DependencyView GraphBuilder::build_reverse_view(const std::string& root) {
    DependencyView view;
    view.kind = ViewKind::REVERSE_DEPENDENCIES;
    view.root = require_package_name(root);

    QueryResult reverse = provider_.get_reverse_dependencies(view.root);
    view.status = reverse.status;
    view.detail = reverse.detail;
    if (!reverse.ok()) {
        log_debug(string_format("debug.root_lookup_failed", view.root, describe_status(reverse.status)));
        return view;
    }

    view.graph.add_reverse_record({view.root, reverse.packages});
    for (auto& name : prepare(std::move(reverse.packages))) {
        view.entries.push_back(ViewEntry{.name = std::move(name)});
    }
    log_debug(string_format("debug.view_built", view.root, view.entries.size()));
    return view;
}
