// lineage/registry/error.hpp - Typed failures of registration and lookup
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "lineage/basic/diagnostic.hpp"
#include "lineage/registry/node_ref.hpp"

namespace lineage
{

/**
 * Cause of a failed registry or resolver operation.
 *
 * Registration kinds (E1xx) are structural defects in the declared
 * hierarchy. Lookup kinds (E2xx) describe a query that has no answer.
 */
enum class ErrorKind : uint8_t {
  // Registration
  DuplicateRoot,
  NonLinearChain,
  VersionOrder,
  InvalidVersion,
  RegistryFrozen,
  InvalidNode,
  AliasOnChain,
  // Lookup
  VersionNotFound,
  NoPreviousVersion,
  ModelNotFound,
  AmbiguousChain,
  UnboundHandler,
};

/// Name of the error kind, e.g. "NonLinearChainError".
std::string_view error_kind_to_string(ErrorKind kind);

/// Stable diagnostic code, e.g. "E102".
std::string_view error_kind_code(ErrorKind kind);

struct ResolveError
{
  ErrorKind kind;
  std::string message;
};

/**
 * Convert an error into an Error-severity diagnostic carrying its code.
 */
Diagnostic to_diagnostic(const ResolveError & error);

/**
 * Outcome of an operation producing a node reference.
 *
 * Exactly one of `node` (valid) or `error` is set.
 */
struct NodeResult
{
  NodeRef node;
  std::optional<ResolveError> error;

  [[nodiscard]] bool success() const { return !error.has_value(); }
  [[nodiscard]] bool has_error() const { return error.has_value(); }

  /// Error kind, or std::nullopt on success.
  [[nodiscard]] std::optional<ErrorKind> error_kind() const
  {
    if (!error) return std::nullopt;
    return error->kind;
  }

  static NodeResult ok(NodeRef ref)
  {
    NodeResult r;
    r.node = ref;
    return r;
  }

  static NodeResult fail(ErrorKind kind, std::string message)
  {
    NodeResult r;
    r.error = ResolveError{kind, std::move(message)};
    return r;
  }
};

}  // namespace lineage
