// lineage-resolve - Query hierarchies declared in a lineage.yaml manifest
//
// Usage:
//   lineage-resolve check
//   lineage-resolve dump
//   lineage-resolve version <hierarchy> <tag> [--fallback none|base|latest]
//   lineage-resolve previous <hierarchy> <tag> [<ancestor-tag>]
//   lineage-resolve model <hierarchy> <tag> [--fallback none|base|latest]
//
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <fmt/core.h>

#include "lineage/basic/diagnostic_printer.hpp"
#include "lineage/dump/json_dump.hpp"
#include "lineage/project/manifest.hpp"
#include "lineage/registry/type_registry.hpp"
#include "lineage/resolve/chain_resolver.hpp"
#include "lineage/resolve/tree_resolver.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "lineage-resolve v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [arguments] [options]\n\n"
            << "Commands:\n"
            << "  check                              Validate the manifest\n"
            << "  dump                               Print all hierarchies as JSON\n"
            << "  version <hierarchy> <tag>          Newest version not newer than <tag>\n"
            << "  previous <hierarchy> <tag> [<to>]  Version preceding the one <tag> resolves to\n"
            << "  model <hierarchy> <tag>            First node declared for model <tag>\n\n"
            << "Options:\n"
            << "  -m, --manifest <path>    Manifest file (default: search for lineage.yaml)\n"
            << "  --fallback <policy>      none | base | latest (overrides the manifest)\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::string manifest_path;
  std::string fallback;
  bool no_color = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-m" || arg == "--manifest") {
      if (i + 1 < argc) {
        args.manifest_path = argv[++i];
      }
    } else if (arg == "--fallback") {
      if (i + 1 < argc) {
        args.fallback = argv[++i];
      }
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else {
      args.positional.push_back(std::move(arg));
    }
  }

  return args;
}

// ============================================================================
// Manifest Session
// ============================================================================

struct Session
{
  lineage::TypeRegistry registry;
  lineage::ManifestConfig config;
};

bool use_color(const CommandArgs & args) { return !args.no_color && isatty(fileno(stderr)) != 0; }

std::optional<Session> open_manifest(const CommandArgs & args)
{
  fs::path manifest;
  if (!args.manifest_path.empty()) {
    manifest = args.manifest_path;
  } else {
    auto found = lineage::find_manifest(fs::current_path());
    if (!found) {
      std::cerr << "error: no " << lineage::k_manifest_file_name
                << " found in current directory or parents\n";
      return std::nullopt;
    }
    manifest = *found;
  }

  Session session;
  lineage::DiagnosticBag diags;
  auto result = lineage::load_manifest(manifest, session.registry, diags);
  if (!diags.empty()) {
    lineage::DiagnosticPrinter printer(std::cerr, use_color(args));
    printer.print_all(diags);
  }
  if (!result.success) {
    return std::nullopt;
  }

  session.registry.freeze();
  session.config = std::move(result.config);
  return std::optional<Session>(std::move(session));
}

void print_error(const CommandArgs & args, const lineage::ResolveError & error)
{
  lineage::DiagnosticPrinter printer(std::cerr, use_color(args));
  printer.print(lineage::to_diagnostic(error));
}

void print_node(const lineage::TypeRegistry & registry, lineage::NodeRef ref)
{
  const lineage::TypeNode * node = registry.get_node(ref);
  if (node->name.empty()) {
    fmt::print("{}\n", node->tag);
  } else {
    fmt::print("{} ({})\n", node->tag, node->name);
  }
}

/// Lookup options from the manifest, with --fallback taking precedence.
std::optional<lineage::ResolveOptions> options_for(
  const CommandArgs & args, const Session & session, const std::string & hierarchy,
  lineage::DiagnosticBag * diags)
{
  lineage::ResolveOptions options = session.config.options_for(hierarchy);
  if (!args.fallback.empty()) {
    const auto fb = lineage::fallback_from_string(args.fallback);
    if (!fb) {
      std::cerr << "error: invalid --fallback '" << args.fallback
                << "' (must be 'none', 'base' or 'latest')\n";
      return std::nullopt;
    }
    options.fallback = *fb;
  }
  options.diagnostics = diags;
  return options;
}

std::optional<lineage::NodeRef> root_of(const Session & session, const std::string & hierarchy)
{
  auto root = session.registry.find_root(hierarchy);
  if (!root) {
    std::cerr << "error: unknown hierarchy '" << hierarchy << "'\n";
  }
  return root;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  auto session = open_manifest(args);
  if (!session) {
    return 1;
  }

  for (const auto & h : session->registry.hierarchies()) {
    std::cout << h.name << " (" << lineage::topology_to_string(h.topology) << "): OK\n";
  }
  return 0;
}

int cmd_dump(const CommandArgs & args)
{
  auto session = open_manifest(args);
  if (!session) {
    return 1;
  }

  std::cout << lineage::to_json(session->registry).dump(2) << "\n";
  return 0;
}

/// Shared driver for the lookup commands.
template <typename Lookup>
int run_lookup(const CommandArgs & args, size_t min_args, const char * usage, Lookup lookup)
{
  if (args.positional.size() < min_args) {
    std::cerr << "error: missing arguments\n"
              << "usage: lineage-resolve " << usage << "\n";
    return 2;
  }

  auto session = open_manifest(args);
  if (!session) {
    return 1;
  }

  const std::string & hierarchy = args.positional[0];
  const auto root = root_of(*session, hierarchy);
  if (!root) {
    return 1;
  }

  lineage::DiagnosticBag warnings;
  const auto options = options_for(args, *session, hierarchy, &warnings);
  if (!options) {
    return 2;
  }

  const lineage::NodeResult result = lookup(session->registry, *root, *options);
  if (!warnings.empty()) {
    lineage::DiagnosticPrinter printer(std::cerr, use_color(args));
    printer.print_all(warnings);
  }
  if (result.has_error()) {
    print_error(args, *result.error);
    return 1;
  }

  print_node(session->registry, result.node);
  return 0;
}

int cmd_version(const CommandArgs & args)
{
  return run_lookup(
    args, 2, "version <hierarchy> <tag>",
    [&args](
      const lineage::TypeRegistry & registry, lineage::NodeRef root,
      const lineage::ResolveOptions & options) {
      return lineage::find_version(registry, root, args.positional[1], options);
    });
}

int cmd_previous(const CommandArgs & args)
{
  return run_lookup(
    args, 2, "previous <hierarchy> <tag> [<ancestor-tag>]",
    [&args](
      const lineage::TypeRegistry & registry, lineage::NodeRef root,
      const lineage::ResolveOptions & options) {
      const lineage::NodeResult current =
        lineage::find_version(registry, root, args.positional[1], options);
      if (current.has_error()) {
        return current;
      }
      if (args.positional.size() > 2) {
        return lineage::find_previous_version(registry, current.node, args.positional[2]);
      }
      return lineage::find_previous_version(registry, current.node);
    });
}

int cmd_model(const CommandArgs & args)
{
  return run_lookup(
    args, 2, "model <hierarchy> <tag>",
    [&args](
      const lineage::TypeRegistry & registry, lineage::NodeRef root,
      const lineage::ResolveOptions & options) {
      return lineage::find_model(registry, root, args.positional[1], options);
    });
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "dump") {
    return cmd_dump(args);
  }

  if (args.command == "version") {
    return cmd_version(args);
  }

  if (args.command == "previous") {
    return cmd_previous(args);
  }

  if (args.command == "model") {
    return cmd_model(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 2;
}
