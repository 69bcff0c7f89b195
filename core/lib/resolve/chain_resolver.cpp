// lineage/resolve/chain_resolver.cpp - Version lookup over linear chains
#include "lineage/resolve/chain_resolver.hpp"

#include <fmt/core.h>

#include <optional>

#include "lineage/version/version_tag.hpp"

namespace lineage
{

namespace
{

// Chain nodes carry a pre-parsed version; nodes of tree hierarchies do not.
std::optional<VersionTag> version_of(const TypeNode & node)
{
  if (node.version) {
    return node.version;
  }
  return VersionTag::parse(node.tag);
}

NodeResult invalid_node(NodeRef ref)
{
  return NodeResult::fail(
    ErrorKind::InvalidNode,
    fmt::format("node #{} is not a node of this registry", ref.get_index()));
}

NodeResult tag_not_a_version(const TypeRegistry & registry, NodeRef ref)
{
  return NodeResult::fail(
    ErrorKind::InvalidVersion,
    fmt::format("tag of {} is not a valid version", registry.describe(ref)));
}

NodeResult ambiguous_chain(const TypeRegistry & registry, NodeRef ref, size_t child_count)
{
  return NodeResult::fail(
    ErrorKind::AmbiguousChain,
    fmt::format(
      "{} has {} children; version lookup requires a linear chain", registry.describe(ref),
      child_count));
}

NodeResult version_not_found(
  const TypeRegistry & registry, NodeRef start, std::string_view version,
  const ResolveOptions & options)
{
  switch (options.fallback) {
    case Fallback::None:
      break;
    case Fallback::Base:
      if (options.diagnostics != nullptr) {
        options.diagnostics
          ->report_warning(fmt::format(
            "version '{}' not found; falling back to base {}", version, registry.describe(start)))
          .with_code("W201");
      }
      return NodeResult::ok(start);
    case Fallback::Latest: {
      NodeResult latest = find_latest_version(registry, start);
      if (latest.success() && options.diagnostics != nullptr) {
        options.diagnostics
          ->report_warning(fmt::format(
            "version '{}' not found; falling back to latest {}", version,
            registry.describe(latest.node)))
          .with_code("W202");
      }
      return latest;
    }
  }

  return NodeResult::fail(
    ErrorKind::VersionNotFound,
    fmt::format(
      "no version at or below '{}' starting from {}", version, registry.describe(start)));
}

}  // namespace

NodeResult find_version(
  const TypeRegistry & registry, NodeRef start, std::string_view version,
  const ResolveOptions & options)
{
  const TypeNode * start_node = registry.get_node(start);
  if (start_node == nullptr) {
    return invalid_node(start);
  }

  const auto query = VersionTag::parse(version);
  if (!query) {
    return NodeResult::fail(
      ErrorKind::InvalidVersion, fmt::format("query '{}' is not a valid version", version));
  }

  const auto start_version = version_of(*start_node);
  if (!start_version) {
    return tag_not_a_version(registry, start);
  }
  if (*start_version > *query) {
    return version_not_found(registry, start, version, options);
  }

  NodeRef current = start;
  while (true) {
    const TypeNode * node = registry.get_node(current);
    if (node->children.empty()) {
      break;
    }
    if (node->children.size() > 1) {
      return ambiguous_chain(registry, current, node->children.size());
    }

    const NodeRef child = node->children.front();
    const auto child_version = version_of(*registry.get_node(child));
    if (!child_version) {
      return tag_not_a_version(registry, child);
    }
    if (*child_version > *query) {
      break;
    }
    current = child;
  }

  return NodeResult::ok(current);
}

NodeResult find_previous_version(const TypeRegistry & registry, NodeRef node)
{
  const TypeNode * n = registry.get_node(node);
  if (n == nullptr) {
    return invalid_node(node);
  }
  if (n->is_root()) {
    return NodeResult::fail(
      ErrorKind::NoPreviousVersion,
      fmt::format("{} is the first version of its chain", registry.describe(node)));
  }
  return NodeResult::ok(n->parent);
}

NodeResult find_previous_version(
  const TypeRegistry & registry, NodeRef node, std::string_view version)
{
  const TypeNode * n = registry.get_node(node);
  if (n == nullptr) {
    return invalid_node(node);
  }

  const auto query = VersionTag::parse(version);
  if (!query) {
    return NodeResult::fail(
      ErrorKind::InvalidVersion, fmt::format("query '{}' is not a valid version", version));
  }

  for (NodeRef ancestor = n->parent; ancestor.is_valid();
       ancestor = registry.get_node(ancestor)->parent) {
    const auto ancestor_version = version_of(*registry.get_node(ancestor));
    if (!ancestor_version) {
      return tag_not_a_version(registry, ancestor);
    }
    if (*ancestor_version == *query) {
      return NodeResult::ok(ancestor);
    }
  }

  return NodeResult::fail(
    ErrorKind::NoPreviousVersion,
    fmt::format(
      "reached the top of the chain above {} without finding version '{}'",
      registry.describe(node), version));
}

NodeResult find_latest_version(const TypeRegistry & registry, NodeRef start)
{
  const TypeNode * node = registry.get_node(start);
  if (node == nullptr) {
    return invalid_node(start);
  }

  NodeRef current = start;
  while (!node->children.empty()) {
    if (node->children.size() > 1) {
      return ambiguous_chain(registry, current, node->children.size());
    }
    current = node->children.front();
    node = registry.get_node(current);
  }
  return NodeResult::ok(current);
}

}  // namespace lineage
