#pragma once

#include <verchain/result.hpp>
#include <verchain/manifest.hpp>
#include <verchain/graph.hpp>

#include <string>
#include <vector>

namespace verchain {

// Build order over `graph` using Kahn's algorithm. Every component comes
// after everything it requires; among components that are ready at the
// same time the smallest name (byte-wise ascending) is emitted first.
// Fails with Cycle ("Circular dependency ...") naming every component left
// unresolved. No partial order is returned on failure.
Result<std::vector<std::string>> build_order(const DependencyGraph& graph);

// Same traversal grouped by round: level 0 holds components with no
// requirements, level k those whose last requirement sits in level k-1.
// Components within a level have no ordering constraint between them.
Result<std::vector<std::vector<std::string>>> build_levels(const DependencyGraph& graph);

// Build a fresh graph from `manifest` and resolve it.
Result<std::vector<std::string>> build_order(const VersionsManifest& manifest);
Result<std::vector<std::vector<std::string>>> build_levels(const VersionsManifest& manifest);

// Order for `targets` and their transitive requirements only.
Result<std::vector<std::string>> build_order_for(const VersionsManifest& manifest,
                                                 const std::vector<std::string>& targets);

// Every name in `skip` must be a component of `manifest`; InvalidArg
// names the first one that is not.
Status check_skip(const VersionsManifest& manifest,
                  const std::vector<std::string>& skip);

// `order` minus the skipped components, relative order kept. Skipped
// components are still part of resolution; their artifacts are pre-built.
std::vector<std::string> without_skipped(const std::vector<std::string>& order,
                                         const std::vector<std::string>& skip);

} // namespace verchain
