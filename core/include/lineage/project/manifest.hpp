// lineage/project/manifest.hpp - Hierarchy manifest (lineage.yaml)
//
// Declares hierarchies and resolver defaults in YAML and registers them
// into a TypeRegistry. Used by the lineage-resolve tool and by tests.
//
// Example:
//   resolver:
//     fallback: none          # none | base | latest
//   hierarchies:
//     - name: firmware
//       topology: chain
//       versions: ["1.0", "1.1", {tag: "2.0", name: FirmwareV2}]
//     - name: phone
//       topology: tree
//       fallback: base        # overrides resolver.fallback
//       root:
//         tag: Phone
//         children:
//           - tag: iPhone
//             aliases: [iphone]
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lineage/basic/diagnostic.hpp"
#include "lineage/registry/type_registry.hpp"
#include "lineage/resolve/resolve_options.hpp"

namespace lineage
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Per-hierarchy settings.
 */
struct HierarchyConfig
{
  std::string name;
  std::optional<Fallback> fallback;
};

/**
 * Resolver defaults ('resolver' section).
 */
struct ResolverConfig
{
  Fallback fallback = Fallback::None;
};

/**
 * Everything a manifest declares besides the nodes themselves.
 */
struct ManifestConfig
{
  ResolverConfig resolver;
  std::vector<HierarchyConfig> hierarchies;

  /// Manifest file the configuration was read from (empty for strings)
  std::filesystem::path manifest_path;

  /**
   * Lookup options for a hierarchy: its own fallback if set, the resolver
   * default otherwise.
   */
  [[nodiscard]] ResolveOptions options_for(std::string_view hierarchy) const;
};

// ============================================================================
// Manifest Loading Result
// ============================================================================

/**
 * Result of loading a manifest. Details of any failure are reported to the
 * DiagnosticBag passed to the loader.
 */
struct ManifestLoadResult
{
  /// Loaded configuration (only complete if success == true)
  ManifestConfig config;

  bool success = false;

  static ManifestLoadResult ok(ManifestConfig cfg)
  {
    ManifestLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ManifestLoadResult fail(ManifestConfig cfg = {})
  {
    ManifestLoadResult r;
    r.config = std::move(cfg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Manifest Loading API
// ============================================================================

/**
 * Load a manifest file and register its hierarchies into `registry`.
 *
 * Loading continues past registration errors so that every problem is
 * reported; nodes below a rejected node are skipped.
 */
[[nodiscard]] ManifestLoadResult load_manifest(
  const std::filesystem::path & manifest_path, TypeRegistry & registry, DiagnosticBag & diags);

/**
 * Load a manifest from YAML text. `display_name` is used in locations.
 */
[[nodiscard]] ManifestLoadResult load_manifest_from_string(
  std::string_view yaml_text, TypeRegistry & registry, DiagnosticBag & diags,
  std::string display_name = "<string>");

/**
 * Find a manifest by searching upward from a directory.
 *
 * @return Path to lineage.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_manifest(
  const std::filesystem::path & start_dir);

/**
 * Default name of the manifest file.
 */
inline constexpr const char * k_manifest_file_name = "lineage.yaml";

}  // namespace lineage
