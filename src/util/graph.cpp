#include <verchain/graph.hpp>
#include <verchain/log.hpp>
#include <queue>
#include <sstream>

namespace verchain {

static const DependencyGraph::NameSet& empty_set() {
    static const DependencyGraph::NameSet empty;
    return empty;
}

// ---------------------------------------------------------------------------
// build()
// ---------------------------------------------------------------------------

Result<DependencyGraph> DependencyGraph::build(const VersionsManifest& manifest) {
    DependencyGraph graph;

    for (const auto& [name, comp] : manifest) {
        graph.add_node(name);
    }

    for (const auto& [name, comp] : manifest) {
        for (const auto& req : comp.requirements) {
            const Component* dep = manifest.find(req.name);
            if (!dep) {
                return VerchainError{VerchainError::UnknownDependency,
                    "component '" + name + "' requires unknown component '" +
                    req.name + "'",
                    "add '" + req.name + "' to [versions] or remove the requirement"}
                    .with_names({name, req.name});
            }
            if (dep->version != req.version) {
                return VerchainError{VerchainError::VersionMismatch,
                    "component '" + name + "' requires " + req.name + " " +
                    req.version + ", but the manifest declares " + req.name +
                    " " + dep->version,
                    "update the requirement to \"" + req.name + "=" +
                    dep->version + "\""}
                    .with_names({name, req.name});
            }
            graph.add_edge(name, req.name);
        }
    }

    log::debug("dependency graph: %zu components, %zu edges",
               graph.node_count(), graph.edge_count());
    return Result<DependencyGraph>::ok(std::move(graph));
}

// ---------------------------------------------------------------------------
// Mutation and queries
// ---------------------------------------------------------------------------

void DependencyGraph::add_node(const std::string& name) {
    deps_[name];
    rdeps_[name];
}

void DependencyGraph::add_edge(const std::string& from, const std::string& to) {
    add_node(from);
    add_node(to);
    deps_[from].insert(to);
    rdeps_[to].insert(from);
}

bool DependencyGraph::has_node(const std::string& name) const {
    return deps_.count(name) > 0;
}

bool DependencyGraph::has_edge(const std::string& from, const std::string& to) const {
    auto it = deps_.find(from);
    return it != deps_.end() && it->second.count(to) > 0;
}

size_t DependencyGraph::edge_count() const {
    size_t n = 0;
    for (const auto& [name, deps] : deps_) n += deps.size();
    return n;
}

std::vector<std::string> DependencyGraph::nodes() const {
    std::vector<std::string> names;
    names.reserve(deps_.size());
    for (const auto& [name, deps] : deps_) names.push_back(name);
    return names;
}

const DependencyGraph::NameSet& DependencyGraph::dependencies(const std::string& name) const {
    auto it = deps_.find(name);
    return it == deps_.end() ? empty_set() : it->second;
}

const DependencyGraph::NameSet& DependencyGraph::dependents(const std::string& name) const {
    auto it = rdeps_.find(name);
    return it == rdeps_.end() ? empty_set() : it->second;
}

// ---------------------------------------------------------------------------
// closure()
// ---------------------------------------------------------------------------

Result<DependencyGraph> DependencyGraph::closure(const std::vector<std::string>& roots) const {
    NameSet reachable;
    std::queue<std::string> bfs;
    for (const auto& root : roots) {
        if (!has_node(root)) {
            return VerchainError{VerchainError::NotFound,
                "component '" + root + "' is not in the manifest"}
                .with_names({root});
        }
        if (reachable.insert(root).second) bfs.push(root);
    }

    while (!bfs.empty()) {
        std::string u = bfs.front();
        bfs.pop();
        for (const auto& dep : dependencies(u)) {
            if (reachable.insert(dep).second) bfs.push(dep);
        }
    }

    DependencyGraph sub;
    for (const auto& name : reachable) {
        sub.add_node(name);
        for (const auto& dep : dependencies(name)) {
            sub.add_edge(name, dep);
        }
    }
    return Result<DependencyGraph>::ok(std::move(sub));
}

// ---------------------------------------------------------------------------
// tree_display()
// ---------------------------------------------------------------------------

static void tree_display_impl(const DependencyGraph& g,
                              const std::string& u,
                              const std::string& prefix,
                              bool is_root,
                              bool is_last,
                              DependencyGraph::NameSet& visited,
                              std::ostringstream& out) {
    out << prefix;
    if (!is_root) {
        out << (is_last ? "└── " : "├── ");
    }
    out << u;

    const auto& deps = g.dependencies(u);
    if (!visited.insert(u).second) {
        out << (deps.empty() ? "\n" : " (*)\n");
        return;
    }
    out << "\n";

    std::string child_prefix = prefix;
    if (!is_root) {
        child_prefix += (is_last ? "    " : "│   ");
    }
    size_t i = 0;
    for (const auto& dep : deps) {
        ++i;
        tree_display_impl(g, dep, child_prefix, false, i == deps.size(),
                          visited, out);
    }
}

std::string DependencyGraph::tree_display(const std::string& root) const {
    if (!has_node(root)) return "";
    std::ostringstream out;
    NameSet visited;
    tree_display_impl(*this, root, "", true, true, visited, out);
    return out.str();
}

} // namespace verchain
