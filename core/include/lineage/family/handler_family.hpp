// lineage/family/handler_family.hpp - Instantiate the handler a tag resolves to
//
// Binds a factory to each node of one hierarchy and constructs the handler
// for an observed version or model, replacing a hand-written if/else
// factory over every known variant.
//
#pragma once

#include <fmt/core.h>

#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "lineage/registry/error.hpp"
#include "lineage/registry/type_registry.hpp"
#include "lineage/resolve/chain_resolver.hpp"
#include "lineage/resolve/resolve_options.hpp"
#include "lineage/resolve/tree_resolver.hpp"

namespace lineage
{

/**
 * Factories for the handlers of one hierarchy.
 *
 * @tparam Base Common interface of all handlers in the hierarchy
 * @tparam Args Constructor arguments forwarded to each handler
 *
 * Example:
 * @code
 *   HandlerFamily<Protocol, Connection &> family(registry, *registry.find_root("firmware"));
 *   family.bind<ProtocolV1>(v1);
 *   family.bind<ProtocolV2>(v2);
 *   auto created = family.create_for_version("2.3", {}, conn);
 * @endcode
 */
template <typename Base, typename... Args>
class HandlerFamily
{
public:
  using Factory = std::function<std::unique_ptr<Base>(Args...)>;

  /**
   * Result of instantiating a handler.
   *
   * On success `handler` is non-null and `node` is the resolved node.
   */
  struct Created
  {
    std::unique_ptr<Base> handler;
    NodeRef node;
    std::optional<ResolveError> error;

    [[nodiscard]] bool success() const { return !error.has_value(); }
  };

  HandlerFamily(const TypeRegistry & registry, NodeRef root) : registry_(registry), root_(root) {}

  /**
   * Bind a factory to a node of this family's hierarchy.
   * @return false if the node is outside the hierarchy or already bound
   */
  bool bind(NodeRef node, Factory factory)
  {
    if (!belongs(node) || !factory) {
      return false;
    }
    auto [it, inserted] = factories_.emplace(node, std::move(factory));
    return inserted;
  }

  template <typename Derived>
  bool bind(NodeRef node)
  {
    return bind(node, [](Args... args) -> std::unique_ptr<Base> {
      return std::make_unique<Derived>(std::forward<Args>(args)...);
    });
  }

  [[nodiscard]] bool is_bound(NodeRef node) const { return factories_.count(node) > 0; }

  [[nodiscard]] NodeRef root() const noexcept { return root_; }

  /**
   * Construct the handler for the newest version not newer than `version`.
   */
  Created create_for_version(
    std::string_view version, const ResolveOptions & options, Args... args) const
  {
    return instantiate(
      find_version(registry_, root_, version, options), std::forward<Args>(args)...);
  }

  /**
   * Construct the handler declared for `model`.
   */
  Created create_for_model(
    std::string_view model, const ResolveOptions & options, Args... args) const
  {
    return instantiate(find_model(registry_, root_, model, options), std::forward<Args>(args)...);
  }

private:
  [[nodiscard]] bool belongs(NodeRef node) const
  {
    const TypeNode * n = registry_.get_node(node);
    const TypeNode * r = registry_.get_node(root_);
    return n != nullptr && r != nullptr && n->root == r->root;
  }

  Created instantiate(NodeResult resolved, Args... args) const
  {
    Created out;
    if (resolved.has_error()) {
      out.error = std::move(resolved.error);
      return out;
    }

    out.node = resolved.node;
    auto it = factories_.find(resolved.node);
    if (it == factories_.end()) {
      out.error = ResolveError{
        ErrorKind::UnboundHandler,
        fmt::format("no handler is bound to {}", registry_.describe(resolved.node))};
      return out;
    }

    out.handler = it->second(std::forward<Args>(args)...);
    return out;
  }

  const TypeRegistry & registry_;
  NodeRef root_;
  std::unordered_map<NodeRef, Factory> factories_;
};

}  // namespace lineage
