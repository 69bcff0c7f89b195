// lineage/project/manifest.cpp - Manifest loading
//
#include "lineage/project/manifest.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

#include "lineage/registry/error.hpp"

namespace lineage
{

namespace
{

constexpr const char * k_code_malformed = "E301";
constexpr const char * k_code_yaml = "E302";
constexpr const char * k_code_io = "E303";

SourceLocation location_from_mark(const std::string & file, const YAML::Mark & mark)
{
  SourceLocation loc;
  loc.file = file;
  if (mark.line >= 0 && mark.column >= 0) {
    loc.line = static_cast<uint32_t>(mark.line) + 1;
    loc.column = static_cast<uint32_t>(mark.column) + 1;
  }
  return loc;
}

/// Walks the YAML document and registers every declared node.
class ManifestReader
{
public:
  ManifestReader(TypeRegistry & registry, DiagnosticBag & diags, std::string file)
  : registry_(registry), diags_(diags), file_(std::move(file))
  {
  }

  void read(const YAML::Node & root, ManifestConfig & config)
  {
    if (!root.IsMap()) {
      error(root, "manifest must be a map with a 'hierarchies' list");
      return;
    }

    if (const YAML::Node resolver = root["resolver"]) {
      if (const YAML::Node fb = resolver["fallback"]) {
        if (auto parsed = read_fallback(fb)) {
          config.resolver.fallback = *parsed;
        }
      }
    }

    const YAML::Node hierarchies = root["hierarchies"];
    if (!hierarchies) {
      error(root, "manifest has no 'hierarchies' section");
      return;
    }
    if (!hierarchies.IsSequence()) {
      error(hierarchies, "hierarchies must be a list");
      return;
    }
    for (const auto & h : hierarchies) {
      read_hierarchy(h, config);
    }
  }

private:
  SourceLocation location_of(const YAML::Node & node) const
  {
    return location_from_mark(file_, node.Mark());
  }

  void error(const YAML::Node & at, std::string message)
  {
    diags_.report_error(std::move(message)).with_code(k_code_malformed).at(location_of(at));
  }

  void report(const YAML::Node & at, const ResolveError & err)
  {
    Diagnostic d = to_diagnostic(err);
    d.location = location_of(at);
    if (err.kind == ErrorKind::NonLinearChain) {
      d.help_message = "chain hierarchies allow one child per version; use topology: tree";
    } else if (err.kind == ErrorKind::VersionOrder) {
      d.help_message = "list chain versions from oldest to newest";
    }
    diags_.add(std::move(d));
  }

  std::optional<Fallback> read_fallback(const YAML::Node & node)
  {
    const auto parsed = fallback_from_string(node.as<std::string>());
    if (!parsed) {
      error(
        node, "invalid fallback '" + node.as<std::string>() +
                "' (must be 'none', 'base' or 'latest')");
    }
    return parsed;
  }

  /// Tag of a declaration given either as a scalar or as a map with 'tag'.
  std::optional<std::string> read_tag(const YAML::Node & decl)
  {
    if (decl.IsScalar()) {
      return decl.as<std::string>();
    }
    if (decl.IsMap() && decl["tag"] && decl["tag"].IsScalar()) {
      return decl["tag"].as<std::string>();
    }
    error(decl, "node declaration needs a scalar 'tag'");
    return std::nullopt;
  }

  static std::string read_name(const YAML::Node & decl)
  {
    if (decl.IsMap() && decl["name"]) {
      return decl["name"].as<std::string>();
    }
    return {};
  }

  void read_hierarchy(const YAML::Node & h, ManifestConfig & config)
  {
    if (!h.IsMap() || !h["name"]) {
      error(h, "hierarchy entry must be a map with a 'name'");
      return;
    }

    HierarchyConfig hc;
    hc.name = h["name"].as<std::string>();

    Topology topology = Topology::Tree;
    if (const YAML::Node t = h["topology"]) {
      const auto parsed = topology_from_string(t.as<std::string>());
      if (!parsed) {
        error(t, "invalid topology '" + t.as<std::string>() + "' (must be 'chain' or 'tree')");
        return;
      }
      topology = *parsed;
    }

    if (const YAML::Node fb = h["fallback"]) {
      hc.fallback = read_fallback(fb);
    }

    const YAML::Node versions = h["versions"];
    const YAML::Node root_decl = h["root"];
    if (versions && root_decl) {
      error(h, "hierarchy '" + hc.name + "' declares both 'root' and 'versions'");
      return;
    }

    if (versions) {
      if (topology != Topology::Chain) {
        error(versions, "'versions' is only valid for chain hierarchies");
        return;
      }
      declare_versions(hc.name, versions);
    } else if (root_decl) {
      declare_root(hc.name, topology, root_decl);
    } else {
      error(h, "hierarchy '" + hc.name + "' needs a 'root' or 'versions'");
      return;
    }

    config.hierarchies.push_back(std::move(hc));
  }

  void declare_versions(const std::string & hierarchy, const YAML::Node & versions)
  {
    if (!versions.IsSequence() || versions.size() == 0) {
      error(versions, "versions must be a non-empty list");
      return;
    }

    NodeRef previous;
    for (const auto & decl : versions) {
      const auto tag = read_tag(decl);
      if (!tag) return;

      const NodeResult r =
        previous.is_valid()
          ? registry_.register_node(previous, *tag, read_name(decl))
          : registry_.register_root(hierarchy, Topology::Chain, *tag, read_name(decl));
      if (r.has_error()) {
        report(decl, *r.error);
        return;
      }
      // Aliases and children go through the registry so chain rules apply
      declare_details(decl, r.node);
      previous = r.node;
    }
  }

  void declare_root(const std::string & hierarchy, Topology topology, const YAML::Node & decl)
  {
    const auto tag = read_tag(decl);
    if (!tag) return;

    const NodeResult r = registry_.register_root(hierarchy, topology, *tag, read_name(decl));
    if (r.has_error()) {
      report(decl, *r.error);
      return;
    }
    declare_details(decl, r.node);
  }

  void declare_child(const YAML::Node & decl, NodeRef parent)
  {
    const auto tag = read_tag(decl);
    if (!tag) return;

    const NodeResult r = registry_.register_node(parent, *tag, read_name(decl));
    if (r.has_error()) {
      report(decl, *r.error);
      return;
    }
    declare_details(decl, r.node);
  }

  // Aliases and children of an already registered node
  void declare_details(const YAML::Node & decl, NodeRef node)
  {
    if (!decl.IsMap()) return;

    if (const YAML::Node aliases = decl["aliases"]) {
      if (!aliases.IsSequence()) {
        error(aliases, "aliases must be a list");
      } else {
        for (const auto & a : aliases) {
          const NodeResult r = registry_.add_alias(node, a.as<std::string>());
          if (r.has_error()) {
            report(a, *r.error);
          }
        }
      }
    }

    if (const YAML::Node children = decl["children"]) {
      if (!children.IsSequence()) {
        error(children, "children must be a list");
        return;
      }
      for (const auto & child : children) {
        declare_child(child, node);
      }
    }
  }

  TypeRegistry & registry_;
  DiagnosticBag & diags_;
  std::string file_;
};

ManifestLoadResult load_document(
  const YAML::Node & root, TypeRegistry & registry, DiagnosticBag & diags, std::string file,
  std::filesystem::path manifest_path)
{
  ManifestConfig config;
  config.manifest_path = std::move(manifest_path);

  const size_t errors_before = diags.errors().size();
  ManifestReader reader(registry, diags, file);
  try {
    reader.read(root, config);
  } catch (const YAML::Exception & e) {
    diags.report_error("invalid manifest value: " + e.msg)
      .with_code(k_code_malformed)
      .at(location_from_mark(file, e.mark));
  }

  if (diags.errors().size() != errors_before) {
    return ManifestLoadResult::fail(std::move(config));
  }
  return ManifestLoadResult::ok(std::move(config));
}

}  // namespace

ResolveOptions ManifestConfig::options_for(std::string_view hierarchy) const
{
  ResolveOptions options;
  options.fallback = resolver.fallback;
  for (const auto & h : hierarchies) {
    if (h.name == hierarchy && h.fallback) {
      options.fallback = *h.fallback;
    }
  }
  return options;
}

ManifestLoadResult load_manifest(
  const std::filesystem::path & manifest_path, TypeRegistry & registry, DiagnosticBag & diags)
{
  namespace fs = std::filesystem;

  const std::string file = manifest_path.string();
  if (!fs::exists(manifest_path)) {
    diags.report_error("manifest not found: " + file).with_code(k_code_io);
    return ManifestLoadResult::fail();
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(file);
  } catch (const YAML::Exception & e) {
    diags.report_error("failed to parse YAML: " + e.msg)
      .with_code(k_code_yaml)
      .at(location_from_mark(file, e.mark));
    return ManifestLoadResult::fail();
  }

  return load_document(root, registry, diags, file, fs::absolute(manifest_path));
}

ManifestLoadResult load_manifest_from_string(
  std::string_view yaml_text, TypeRegistry & registry, DiagnosticBag & diags,
  std::string display_name)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    diags.report_error("failed to parse YAML: " + e.msg)
      .with_code(k_code_yaml)
      .at(location_from_mark(display_name, e.mark));
    return ManifestLoadResult::fail();
  }

  return load_document(root, registry, diags, std::move(display_name), {});
}

std::optional<std::filesystem::path> find_manifest(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_manifest_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace lineage
