// lineage/resolve/tree_resolver.hpp - Model lookup over branching hierarchies
#pragma once

#include <string_view>

#include "lineage/registry/error.hpp"
#include "lineage/registry/type_registry.hpp"
#include "lineage/resolve/resolve_options.hpp"

namespace lineage
{

/**
 * Find the first node under `start` whose tag or alias equals `model`.
 *
 * Depth-first, pre-order: a node is checked before its children and
 * children are visited in declaration order. `start` is checked first.
 * When several nodes share the tag, the first one in this order wins.
 *
 * Fallbacks on a miss: Fallback::Base returns `start`; Fallback::Latest
 * returns `start` only if it has no children.
 *
 * Errors: ModelNotFound, InvalidNode.
 */
[[nodiscard]] NodeResult find_model(
  const TypeRegistry & registry, NodeRef start, std::string_view model,
  const ResolveOptions & options = {});

}  // namespace lineage
