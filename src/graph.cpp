#include "graph.hpp"

#include <algorithm>
#include <unordered_set>

DependencyGraph::Node& DependencyGraph::node(const PackageName& name) {
    return nodes_[name];
}

void DependencyGraph::add_record(const DependencyRecord& record) {
    Node& n = node(record.name);
    if (n.expanded) {
        std::erase_if(edges_, [&](const DependencyEdge& e) { return e.from == record.name; });
    }
    n.dependencies = record.dependencies;
    n.expanded = true;
    for (const auto& dep : record.dependencies) {
        node(dep);
        edges_.push_back({record.name, dep});
    }
}

void DependencyGraph::add_reverse_record(const ReverseDependencyRecord& record) {
    node(record.name);
    for (const auto& dependent : record.dependents) {
        node(dependent);
        edges_.push_back({dependent, record.name});
    }
}

bool DependencyGraph::contains(std::string_view name) const {
    return nodes_.find(name) != nodes_.end();
}

bool DependencyGraph::is_expanded(std::string_view name) const {
    auto it = nodes_.find(name);
    return it != nodes_.end() && it->second.expanded;
}

bool DependencyGraph::has_edge(std::string_view from, std::string_view to) const {
    return std::ranges::any_of(edges_, [&](const DependencyEdge& e) {
        return e.from == from && e.to == to;
    });
}

const std::vector<PackageName>& DependencyGraph::dependencies_of(std::string_view name) const {
    static const std::vector<PackageName> empty;
    auto it = nodes_.find(name);
    return (it != nodes_.end()) ? it->second.dependencies : empty;
}

std::vector<PackageName> DependencyGraph::dependents_of(std::string_view name) const {
    std::vector<PackageName> result;
    std::unordered_set<std::string_view> seen;
    for (const auto& e : edges_) {
        if (e.to == name && seen.insert(e.from).second) {
            result.push_back(e.from);
        }
    }
    return result;
}

std::vector<DependencyEdge> DependencyGraph::edges() const {
    return edges_;
}
