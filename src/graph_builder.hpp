#pragma once

#include "graph.hpp"
#include "provider.hpp"

#include <string>
#include <vector>

enum class ViewKind {
    DEPENDENCIES,
    REVERSE_DEPENDENCIES
};

struct ViewEntry {
    PackageName name;
    // Direct dependency count of this entry; set only by the lookahead pass.
    size_t dependency_count = 0;
    bool annotated = false;
    QueryStatus lookup_status = QueryStatus::OK;
};

// Flat, ordered result of a forward or reverse query: a header for the root
// followed by one entry per related package.
struct DependencyView {
    ViewKind kind = ViewKind::DEPENDENCIES;
    PackageName root;
    QueryStatus status = QueryStatus::OK;
    std::string detail;
    std::vector<ViewEntry> entries;
    DependencyGraph graph;

    bool ok() const { return status == QueryStatus::OK; }
    size_t total() const { return entries.size(); }
};

struct ViewOptions {
    bool deduplicate = false;
    bool lookahead = true;
};

class GraphBuilder {
public:
    explicit GraphBuilder(MetadataProvider& provider, ViewOptions options = {});

    // Direct dependencies of root, each annotated with its own dependency
    // count (one provider call per entry, in order).
    DependencyView build_dependency_view(const std::string& root);
    // Packages declaring a dependency on root. No lookahead.
    DependencyView build_reverse_view(const std::string& root);

private:
    std::vector<PackageName> prepare(std::vector<PackageName> names) const;

    MetadataProvider& provider_;
    ViewOptions options_;
};

// Validates and normalizes a package name supplied by a caller.
// Throws DepviewException for blank input.
PackageName require_package_name(const std::string& raw);
