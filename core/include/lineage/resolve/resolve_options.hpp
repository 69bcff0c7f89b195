// lineage/resolve/resolve_options.hpp - Lookup policy shared by resolvers
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "lineage/basic/diagnostic.hpp"

namespace lineage
{

/**
 * What a lookup returns instead of a not-found error.
 */
enum class Fallback : uint8_t {
  None,    // Report VersionNotFound / ModelNotFound
  Base,    // Return the node the lookup started from
  Latest,  // Return the newest node of the chain
};

std::optional<Fallback> fallback_from_string(std::string_view name);

std::string_view fallback_to_string(Fallback fallback);

struct ResolveOptions
{
  Fallback fallback = Fallback::None;

  // Receives a warning whenever a fallback is taken. Caller-owned; a bag
  // must not be shared between concurrent lookups.
  DiagnosticBag * diagnostics = nullptr;
};

}  // namespace lineage
