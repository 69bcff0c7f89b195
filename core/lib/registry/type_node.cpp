// lineage/registry/type_node.cpp - TypeNode helpers
#include "lineage/registry/type_node.hpp"

#include <algorithm>

namespace lineage
{

std::optional<Topology> topology_from_string(std::string_view name)
{
  if (name == "chain") return Topology::Chain;
  if (name == "tree") return Topology::Tree;
  return std::nullopt;
}

std::string_view topology_to_string(Topology topology)
{
  switch (topology) {
    case Topology::Chain:
      return "chain";
    case Topology::Tree:
      return "tree";
  }
  return "unknown";
}

bool TypeNode::has_tag(std::string_view query) const
{
  if (tag == query) return true;
  return std::any_of(
    aliases.begin(), aliases.end(), [&query](const std::string & a) { return a == query; });
}

}  // namespace lineage
