// lineage/registry/type_registry.hpp - Process-wide store of declared nodes
//
// The registry has a two-phase lifecycle:
// 1. Initialization: hierarchies are declared with register_root(),
//    register_node() and add_alias(). Single-threaded.
// 2. Frozen: after freeze(), the node table is immutable and every
//    mutating call fails with RegistryFrozen. Lookups may then run from
//    any number of threads without locking, provided the caller
//    establishes a happens-before edge between freeze() and the first
//    lookup (e.g. std::call_once or thread start).
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lineage/registry/error.hpp"
#include "lineage/registry/node_ref.hpp"
#include "lineage/registry/type_node.hpp"

namespace lineage
{

/**
 * A named hierarchy and its root node.
 */
struct HierarchyInfo
{
  std::string name;
  Topology topology;
  NodeRef root;
};

/**
 * Append-only table of TypeNodes grouped into named hierarchies.
 *
 * Nodes are stored in one growable table and refer to each other by
 * NodeRef index, so the graph carries no owning pointers. Pointers
 * returned by get_node() stay valid until the next registration.
 */
class TypeRegistry
{
public:
  TypeRegistry() = default;

  TypeRegistry(const TypeRegistry &) = delete;
  TypeRegistry & operator=(const TypeRegistry &) = delete;
  TypeRegistry(TypeRegistry &&) = default;
  TypeRegistry & operator=(TypeRegistry &&) = default;

  /**
   * The process-wide registry, torn down at process exit.
   */
  static TypeRegistry & global();

  // ===========================================================================
  // Registration (initialization phase)
  // ===========================================================================

  /**
   * Register the root of a new hierarchy.
   *
   * Fails with DuplicateRoot if `hierarchy` already has a root,
   * InvalidVersion if a chain root's tag is not a version.
   */
  NodeResult register_root(
    std::string hierarchy, Topology topology, std::string tag, std::string name = {});

  /**
   * Register a node specializing `parent`, appended to its children.
   *
   * Chain hierarchies additionally reject a second child (NonLinearChain),
   * a tag that is not a version (InvalidVersion) and a tag that is not
   * newer than the parent's (VersionOrder).
   */
  NodeResult register_node(NodeRef parent, std::string tag, std::string name = {});

  /**
   * Attach an extra tag to a tree node. Fails with AliasOnChain for chain
   * nodes.
   */
  NodeResult add_alias(NodeRef node, std::string tag);

  /**
   * End the initialization phase.
   */
  void freeze() noexcept { frozen_ = true; }

  [[nodiscard]] bool is_frozen() const noexcept { return frozen_; }

  // ===========================================================================
  // Lookup
  // ===========================================================================

  [[nodiscard]] bool contains(NodeRef ref) const noexcept
  {
    return ref.is_valid() && ref.get_index() < nodes_.size();
  }

  /**
   * Get a node by reference.
   * @return nullptr if ref does not belong to this registry
   */
  [[nodiscard]] const TypeNode * get_node(NodeRef ref) const noexcept
  {
    return contains(ref) ? &nodes_[ref.get_index()] : nullptr;
  }

  [[nodiscard]] std::optional<NodeRef> find_root(std::string_view hierarchy) const;

  [[nodiscard]] const HierarchyInfo * find_hierarchy(std::string_view hierarchy) const;

  /// Hierarchy the node belongs to; nullptr for an invalid ref.
  [[nodiscard]] const HierarchyInfo * hierarchy_of(NodeRef ref) const;

  /// All hierarchies in registration order.
  [[nodiscard]] const std::vector<HierarchyInfo> & hierarchies() const noexcept
  {
    return hierarchies_;
  }

  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }

  /**
   * Human-readable description for messages, e.g. "'1.1' (Ver2) in 'firmware'".
   */
  [[nodiscard]] std::string describe(NodeRef ref) const;

private:
  std::optional<NodeResult> reject_if_frozen(std::string_view action) const;

  NodeRef append(TypeNode node);

  std::vector<TypeNode> nodes_;
  std::vector<HierarchyInfo> hierarchies_;
  std::unordered_map<std::string, uint32_t> hierarchy_index_;
  bool frozen_ = false;
};

}  // namespace lineage
