// lineage/registry/type_node.hpp - Declared specialization nodes
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lineage/registry/node_ref.hpp"
#include "lineage/version/version_tag.hpp"

namespace lineage
{

// ============================================================================
// Topology
// ============================================================================

/**
 * Shape of a hierarchy, fixed when its root is registered.
 */
enum class Topology : uint8_t {
  Chain,  // At most one child per node; tags are ordered versions
  Tree,   // Unrestricted branching; tags compared for equality
};

/**
 * Convert string ("chain" / "tree") to Topology.
 * @return std::nullopt if string is not a valid topology
 */
std::optional<Topology> topology_from_string(std::string_view name);

std::string_view topology_to_string(Topology topology);

// ============================================================================
// TypeNode
// ============================================================================

/**
 * One declared specialization of an abstract entity.
 *
 * Nodes are owned by the TypeRegistry. `parent` and `children` are
 * handles into the same registry.
 */
struct TypeNode
{
  std::string tag;
  // Additional tags matched by the tree resolver
  std::vector<std::string> aliases;
  // Opaque payload label (handler type name); never inspected by resolvers
  std::string name;

  NodeRef parent;
  std::vector<NodeRef> children;  // declaration order
  NodeRef root;
  uint32_t hierarchy = 0;
  uint32_t depth = 0;
  Topology topology = Topology::Tree;

  // Parsed form of `tag`, present for chain nodes
  std::optional<VersionTag> version;

  [[nodiscard]] bool is_root() const noexcept { return !parent.is_valid(); }

  [[nodiscard]] bool is_leaf() const noexcept { return children.empty(); }

  [[nodiscard]] gsl::span<const NodeRef> child_refs() const noexcept
  {
    return gsl::span<const NodeRef>(children.data(), children.size());
  }

  /**
   * Check the primary tag and the aliases for an exact match.
   */
  [[nodiscard]] bool has_tag(std::string_view query) const;

  /**
   * Name if one was declared, the tag otherwise.
   */
  [[nodiscard]] const std::string & display_name() const noexcept
  {
    return name.empty() ? tag : name;
  }
};

}  // namespace lineage
