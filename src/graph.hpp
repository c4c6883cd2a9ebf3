#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

using PackageName = std::string;

// "from depends on to"
struct DependencyEdge {
    PackageName from;
    PackageName to;

    bool operator==(const DependencyEdge&) const = default;
};

struct DependencyRecord {
    PackageName name;
    std::vector<PackageName> dependencies;
};

struct ReverseDependencyRecord {
    PackageName name;
    std::vector<PackageName> dependents;
};

// Adjacency structure filled incrementally from provider records during a
// single query. Edge lists keep provider order, duplicates included.
class DependencyGraph {
public:
    // Records the full direct dependency list of record.name. Loading the same
    // package twice replaces the earlier list.
    void add_record(const DependencyRecord& record);
    // Adds one edge dependent -> record.name per listed dependent.
    void add_reverse_record(const ReverseDependencyRecord& record);

    bool contains(std::string_view name) const;
    // True once a forward record for name has been loaded.
    bool is_expanded(std::string_view name) const;
    bool has_edge(std::string_view from, std::string_view to) const;

    const std::vector<PackageName>& dependencies_of(std::string_view name) const;
    // Dependents known from the loaded edges, in order of first appearance.
    std::vector<PackageName> dependents_of(std::string_view name) const;

    std::vector<DependencyEdge> edges() const;
    size_t package_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }

private:
    struct Node {
        std::vector<PackageName> dependencies;
        bool expanded = false;
    };

    Node& node(const PackageName& name);

    std::map<PackageName, Node, std::less<>> nodes_;
    std::vector<DependencyEdge> edges_;
};
