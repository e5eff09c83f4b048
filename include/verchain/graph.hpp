#pragma once

#include <verchain/result.hpp>
#include <verchain/manifest.hpp>
#include <string>
#include <vector>
#include <map>
#include <set>

namespace verchain {

// ---------------------------------------------------------------------------
// DependencyGraph: component names as nodes, edge A -> B when A requires B
// ---------------------------------------------------------------------------
//
// Nodes are addressed by name; the graph holds no references into the
// manifest it was built from.

class DependencyGraph {
public:
    using NameSet = std::set<std::string>;

    // Validate every requirement of `manifest` and build the graph.
    // Fails with UnknownDependency or VersionMismatch.
    static Result<DependencyGraph> build(const VersionsManifest& manifest);

    void add_node(const std::string& name);
    // Adds both endpoints if missing; repeated edges collapse
    void add_edge(const std::string& from, const std::string& to);

    bool has_node(const std::string& name) const;
    bool has_edge(const std::string& from, const std::string& to) const;

    size_t node_count() const { return deps_.size(); }
    size_t edge_count() const;

    // Names sorted ascending
    std::vector<std::string> nodes() const;

    // What `name` requires (must be built before it)
    const NameSet& dependencies(const std::string& name) const;
    // What requires `name`
    const NameSet& dependents(const std::string& name) const;

    // Sub-graph of `roots` plus everything they transitively require.
    Result<DependencyGraph> closure(const std::vector<std::string>& roots) const;

    // Tree display of `root` and its requirements; repeated subtrees are
    // printed once and marked "(*)".
    std::string tree_display(const std::string& root) const;

private:
    std::map<std::string, NameSet> deps_;
    std::map<std::string, NameSet> rdeps_;
};

} // namespace verchain
