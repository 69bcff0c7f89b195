// lineage/dump/json_dump.hpp - JSON export of registered hierarchies
#pragma once

#include <nlohmann/json.hpp>

#include "lineage/registry/node_ref.hpp"
#include "lineage/registry/type_registry.hpp"

namespace lineage
{

/**
 * Serialize the subtree rooted at `node`.
 *
 * Shape: {"tag", "name"?, "aliases"?, "children": [...]}. Children appear
 * in declaration order.
 */
[[nodiscard]] nlohmann::json to_json(const TypeRegistry & registry, NodeRef node);

/**
 * Serialize every hierarchy:
 * {"hierarchies": [{"name", "topology", "root": {...}}, ...]}
 */
[[nodiscard]] nlohmann::json to_json(const TypeRegistry & registry);

}  // namespace lineage
