// lineage/dump/json_dump.cpp - JSON export of registered hierarchies
//
#include "lineage/dump/json_dump.hpp"

#include <string>
#include <utility>
#include <vector>

namespace lineage
{
namespace
{

using nlohmann::json;

json j_node_shallow(const TypeNode & node)
{
  json j{{"tag", node.tag}, {"children", json::array()}};
  if (!node.name.empty()) {
    j["name"] = node.name;
  }
  if (!node.aliases.empty()) {
    j["aliases"] = node.aliases;
  }
  return j;
}

}  // namespace

json to_json(const TypeRegistry & registry, NodeRef node)
{
  const TypeNode * root = registry.get_node(node);
  if (!root) return nullptr;

  // Iterative so that long chains cannot exhaust the stack. Each frame
  // holds the node and a pointer to its already-inserted JSON object.
  json out = j_node_shallow(*root);
  std::vector<std::pair<const TypeNode *, json *>> pending{{root, &out}};
  while (!pending.empty()) {
    auto [current, target] = pending.back();
    pending.pop_back();

    const auto refs = current->child_refs();
    json & children = (*target)["children"];
    for (const NodeRef child : refs) {
      children.push_back(j_node_shallow(*registry.get_node(child)));
    }
    // References into `children` are stable once it is fully populated
    for (size_t i = 0; i < refs.size(); ++i) {
      pending.emplace_back(registry.get_node(refs[i]), &children[i]);
    }
  }
  return out;
}

json to_json(const TypeRegistry & registry)
{
  json hierarchies = json::array();
  for (const auto & h : registry.hierarchies()) {
    hierarchies.push_back(json{
      {"name", h.name},
      {"topology", std::string(topology_to_string(h.topology))},
      {"root", to_json(registry, h.root)}});
  }
  return json{{"hierarchies", hierarchies}};
}

}  // namespace lineage
