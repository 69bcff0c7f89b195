// lineage/resolve/chain_resolver.hpp - Version lookup over linear chains
//
// A chain is a hierarchy whose nodes have at most one child, each child
// carrying a newer version than its parent. Lookups are pure traversals
// of a frozen registry and may run concurrently.
//
#pragma once

#include <string_view>

#include "lineage/registry/error.hpp"
#include "lineage/registry/type_registry.hpp"
#include "lineage/resolve/resolve_options.hpp"

namespace lineage
{

/**
 * Find the most specific version not newer than `version`.
 *
 * Walks down from `start`, following the single child while the child's
 * version is <= `version`, and returns the last node visited. A query
 * newer than every known version yields the newest node.
 *
 * Errors:
 * - VersionNotFound: `start` itself is newer than `version` (unless a
 *   fallback is configured)
 * - InvalidVersion: `version` or a visited tag is not a version
 * - AmbiguousChain: a visited node has two or more children
 * - InvalidNode: `start` is not a node of `registry`
 */
[[nodiscard]] NodeResult find_version(
  const TypeRegistry & registry, NodeRef start, std::string_view version,
  const ResolveOptions & options = {});

/**
 * Return the parent of `node`, i.e. the version it directly supersedes.
 *
 * Errors: NoPreviousVersion if `node` is a root, InvalidNode.
 */
[[nodiscard]] NodeResult find_previous_version(const TypeRegistry & registry, NodeRef node);

/**
 * Climb the ancestors of `node` for the one whose version equals `version`.
 *
 * The node itself is not considered. Errors: NoPreviousVersion if the top
 * of the chain is reached without a match, InvalidVersion, InvalidNode.
 */
[[nodiscard]] NodeResult find_previous_version(
  const TypeRegistry & registry, NodeRef node, std::string_view version);

/**
 * Return the newest (deepest) node reachable from `start`.
 *
 * Errors: AmbiguousChain, InvalidNode.
 */
[[nodiscard]] NodeResult find_latest_version(const TypeRegistry & registry, NodeRef start);

}  // namespace lineage
