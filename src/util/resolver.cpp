#include <verchain/resolver.hpp>
#include <verchain/log.hpp>

#include <algorithm>
#include <map>
#include <set>

namespace verchain {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Unresolved-requirement count per component
using PendingMap = std::map<std::string, size_t>;

static PendingMap initial_pending(const DependencyGraph& graph) {
    PendingMap pending;
    for (const auto& name : graph.nodes()) {
        pending[name] = graph.dependencies(name).size();
    }
    return pending;
}

static VerchainError cycle_error(const PendingMap& pending) {
    std::vector<std::string> members;
    for (const auto& [name, count] : pending) {
        if (count > 0) members.push_back(name);
    }

    std::string list;
    for (size_t i = 0; i < members.size(); ++i) {
        if (i > 0) list += ", ";
        list += members[i];
    }

    log::debug("resolution stalled with %zu unresolved components", members.size());
    return VerchainError{VerchainError::Cycle,
        "Circular dependency detected among: " + list,
        "break the cycle by removing one of the requirements between these components"}
        .with_names(std::move(members));
}

// ---------------------------------------------------------------------------
// build_order()
// ---------------------------------------------------------------------------

Result<std::vector<std::string>> build_order(const DependencyGraph& graph) {
    PendingMap pending = initial_pending(graph);

    // std::set keeps the ready set sorted, so begin() is the tie-break winner
    std::set<std::string> ready;
    for (const auto& [name, count] : pending) {
        if (count == 0) ready.insert(name);
    }

    std::vector<std::string> order;
    order.reserve(graph.node_count());
    while (!ready.empty()) {
        std::string u = *ready.begin();
        ready.erase(ready.begin());
        log::trace("build %s", u.c_str());

        for (const auto& dependent : graph.dependents(u)) {
            if (--pending[dependent] == 0) {
                ready.insert(dependent);
            }
        }
        order.push_back(std::move(u));
    }

    if (order.size() != graph.node_count()) {
        return cycle_error(pending);
    }
    return Result<std::vector<std::string>>::ok(std::move(order));
}

// ---------------------------------------------------------------------------
// build_levels()
// ---------------------------------------------------------------------------

Result<std::vector<std::vector<std::string>>> build_levels(const DependencyGraph& graph) {
    PendingMap pending = initial_pending(graph);

    std::vector<std::string> current;
    for (const auto& [name, count] : pending) {
        if (count == 0) current.push_back(name);
    }

    std::vector<std::vector<std::string>> levels;
    size_t emitted = 0;
    while (!current.empty()) {
        std::set<std::string> next;
        for (const auto& u : current) {
            for (const auto& dependent : graph.dependents(u)) {
                if (--pending[dependent] == 0) {
                    next.insert(dependent);
                }
            }
        }
        emitted += current.size();
        log::trace("level %zu: %zu components", levels.size(), current.size());
        levels.push_back(std::move(current));
        current.assign(next.begin(), next.end());
    }

    if (emitted != graph.node_count()) {
        return cycle_error(pending);
    }
    return Result<std::vector<std::vector<std::string>>>::ok(std::move(levels));
}

// ---------------------------------------------------------------------------
// Manifest entry points
// ---------------------------------------------------------------------------

Result<std::vector<std::string>> build_order(const VersionsManifest& manifest) {
    VERCHAIN_TRY_ASSIGN(auto graph, DependencyGraph::build(manifest));
    return build_order(graph);
}

Result<std::vector<std::vector<std::string>>> build_levels(const VersionsManifest& manifest) {
    VERCHAIN_TRY_ASSIGN(auto graph, DependencyGraph::build(manifest));
    return build_levels(graph);
}

Result<std::vector<std::string>> build_order_for(const VersionsManifest& manifest,
                                                 const std::vector<std::string>& targets) {
    VERCHAIN_TRY_ASSIGN(auto graph, DependencyGraph::build(manifest));
    VERCHAIN_TRY_ASSIGN(auto sub, graph.closure(targets));
    log::debug("selected %zu of %zu components", sub.node_count(), graph.node_count());
    return build_order(sub);
}

// ---------------------------------------------------------------------------
// Skip list
// ---------------------------------------------------------------------------

Status check_skip(const VersionsManifest& manifest,
                  const std::vector<std::string>& skip) {
    for (const auto& name : skip) {
        if (!manifest.contains(name)) {
            return VerchainError{VerchainError::InvalidArg,
                "cannot skip '" + name + "': not in the manifest",
                "skip entries must name components declared in [versions]"}
                .with_names({name});
        }
    }
    return ok_status();
}

std::vector<std::string> without_skipped(const std::vector<std::string>& order,
                                         const std::vector<std::string>& skip) {
    std::vector<std::string> kept;
    kept.reserve(order.size());
    for (const auto& name : order) {
        if (std::find(skip.begin(), skip.end(), name) != skip.end()) {
            log::info("skipping %s (pre-built)", name.c_str());
            continue;
        }
        kept.push_back(name);
    }
    return kept;
}

} // namespace verchain
