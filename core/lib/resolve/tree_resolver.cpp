// lineage/resolve/tree_resolver.cpp - Model lookup over branching hierarchies
#include "lineage/resolve/tree_resolver.hpp"

#include <fmt/core.h>

#include <vector>

namespace lineage
{

namespace
{

NodeResult model_not_found(
  const TypeRegistry & registry, NodeRef start, std::string_view model,
  const ResolveOptions & options)
{
  const TypeNode * start_node = registry.get_node(start);
  const bool use_base =
    options.fallback == Fallback::Base ||
    (options.fallback == Fallback::Latest && start_node->is_leaf());

  if (use_base) {
    if (options.diagnostics != nullptr) {
      options.diagnostics
        ->report_warning(fmt::format(
          "model '{}' not found; falling back to base {}", model, registry.describe(start)))
        .with_code("W203");
    }
    return NodeResult::ok(start);
  }

  return NodeResult::fail(
    ErrorKind::ModelNotFound,
    fmt::format("model '{}' is not declared under {}", model, registry.describe(start)));
}

}  // namespace

NodeResult find_model(
  const TypeRegistry & registry, NodeRef start, std::string_view model,
  const ResolveOptions & options)
{
  if (!registry.contains(start)) {
    return NodeResult::fail(
      ErrorKind::InvalidNode,
      fmt::format("node #{} is not a node of this registry", start.get_index()));
  }

  // Children are pushed in reverse so the first-declared child pops first
  std::vector<NodeRef> stack;
  stack.push_back(start);
  while (!stack.empty()) {
    const NodeRef current = stack.back();
    stack.pop_back();

    const TypeNode * node = registry.get_node(current);
    if (node->has_tag(model)) {
      return NodeResult::ok(current);
    }
    const auto children = node->child_refs();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.push_back(*it);
    }
  }

  return model_not_found(registry, start, model, options);
}

}  // namespace lineage
