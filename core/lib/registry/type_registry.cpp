// lineage/registry/type_registry.cpp - Node registration and validation
#include "lineage/registry/type_registry.hpp"

#include <fmt/core.h>

#include <utility>

namespace lineage
{

TypeRegistry & TypeRegistry::global()
{
  static TypeRegistry instance;
  return instance;
}

// ============================================================================
// Registration
// ============================================================================

std::optional<NodeResult> TypeRegistry::reject_if_frozen(std::string_view action) const
{
  if (frozen_) {
    return NodeResult::fail(
      ErrorKind::RegistryFrozen, fmt::format("cannot {}: the registry is frozen", action));
  }
  return std::nullopt;
}

NodeRef TypeRegistry::append(TypeNode node)
{
  const NodeRef ref(static_cast<uint32_t>(nodes_.size()));
  nodes_.push_back(std::move(node));
  return ref;
}

NodeResult TypeRegistry::register_root(
  std::string hierarchy, Topology topology, std::string tag, std::string name)
{
  if (auto rejected = reject_if_frozen("register root '" + tag + "'")) {
    return *rejected;
  }

  if (hierarchy_index_.count(hierarchy) > 0) {
    const HierarchyInfo & existing = hierarchies_[hierarchy_index_.at(hierarchy)];
    return NodeResult::fail(
      ErrorKind::DuplicateRoot,
      fmt::format(
        "hierarchy '{}' already has root {}; cannot register '{}' as a second root", hierarchy,
        describe(existing.root), tag));
  }

  TypeNode node;
  node.topology = topology;
  if (topology == Topology::Chain) {
    node.version = VersionTag::parse(tag);
    if (!node.version) {
      return NodeResult::fail(
        ErrorKind::InvalidVersion,
        fmt::format("root tag '{}' of chain hierarchy '{}' is not a valid version", tag, hierarchy));
    }
  }

  const auto hierarchy_id = static_cast<uint32_t>(hierarchies_.size());
  node.tag = std::move(tag);
  node.name = std::move(name);
  node.hierarchy = hierarchy_id;

  const NodeRef ref = append(std::move(node));
  nodes_[ref.get_index()].root = ref;

  hierarchy_index_.emplace(hierarchy, hierarchy_id);
  hierarchies_.push_back(HierarchyInfo{std::move(hierarchy), topology, ref});
  return NodeResult::ok(ref);
}

NodeResult TypeRegistry::register_node(NodeRef parent, std::string tag, std::string name)
{
  if (auto rejected = reject_if_frozen("register '" + tag + "'")) {
    return *rejected;
  }

  const TypeNode * parent_node = get_node(parent);
  if (parent_node == nullptr) {
    return NodeResult::fail(
      ErrorKind::InvalidNode,
      fmt::format("parent of '{}' is not a node of this registry", tag));
  }

  TypeNode node;
  node.topology = parent_node->topology;

  if (parent_node->topology == Topology::Chain) {
    if (!parent_node->children.empty()) {
      return NodeResult::fail(
        ErrorKind::NonLinearChain,
        fmt::format(
          "cannot register '{}' under {}: it already has child {}", tag, describe(parent),
          describe(parent_node->children.front())));
    }
    node.version = VersionTag::parse(tag);
    if (!node.version) {
      return NodeResult::fail(
        ErrorKind::InvalidVersion,
        fmt::format("tag '{}' under {} is not a valid version", tag, describe(parent)));
    }
    if (*node.version <= *parent_node->version) {
      return NodeResult::fail(
        ErrorKind::VersionOrder,
        fmt::format(
          "version '{}' must be newer than its parent {}", tag, describe(parent)));
    }
  }

  node.tag = std::move(tag);
  node.name = std::move(name);
  node.parent = parent;
  node.root = parent_node->root;
  node.hierarchy = parent_node->hierarchy;
  node.depth = parent_node->depth + 1;

  // append() may reallocate; parent_node is not used past this point
  const NodeRef ref = append(std::move(node));
  nodes_[parent.get_index()].children.push_back(ref);
  return NodeResult::ok(ref);
}

NodeResult TypeRegistry::add_alias(NodeRef ref, std::string tag)
{
  if (auto rejected = reject_if_frozen("add alias '" + tag + "'")) {
    return *rejected;
  }

  if (!contains(ref)) {
    return NodeResult::fail(
      ErrorKind::InvalidNode, fmt::format("alias '{}' targets a node outside this registry", tag));
  }

  TypeNode & node = nodes_[ref.get_index()];
  if (node.topology == Topology::Chain) {
    return NodeResult::fail(
      ErrorKind::AliasOnChain,
      fmt::format("cannot add alias '{}' to chain node {}", tag, describe(ref)));
  }

  node.aliases.push_back(std::move(tag));
  return NodeResult::ok(ref);
}

// ============================================================================
// Lookup
// ============================================================================

std::optional<NodeRef> TypeRegistry::find_root(std::string_view hierarchy) const
{
  const HierarchyInfo * info = find_hierarchy(hierarchy);
  if (info == nullptr) {
    return std::nullopt;
  }
  return info->root;
}

const HierarchyInfo * TypeRegistry::find_hierarchy(std::string_view hierarchy) const
{
  auto it = hierarchy_index_.find(std::string(hierarchy));
  if (it == hierarchy_index_.end()) {
    return nullptr;
  }
  return &hierarchies_[it->second];
}

const HierarchyInfo * TypeRegistry::hierarchy_of(NodeRef ref) const
{
  const TypeNode * node = get_node(ref);
  if (node == nullptr) {
    return nullptr;
  }
  return &hierarchies_[node->hierarchy];
}

std::string TypeRegistry::describe(NodeRef ref) const
{
  const TypeNode * node = get_node(ref);
  if (node == nullptr) {
    return "<invalid node>";
  }
  const std::string & hierarchy = hierarchies_[node->hierarchy].name;
  if (node->name.empty()) {
    return fmt::format("'{}' in '{}'", node->tag, hierarchy);
  }
  return fmt::format("'{}' ({}) in '{}'", node->tag, node->name, hierarchy);
}

}  // namespace lineage
