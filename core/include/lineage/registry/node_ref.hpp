// lineage/registry/node_ref.hpp - Stable handle into the node table
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace lineage
{

/**
 * A stable, non-owning reference to a registered TypeNode.
 *
 * Internally stores the node's index in the owning TypeRegistry. Handles
 * stay valid for the registry's lifetime because nodes are never removed.
 */
class NodeRef
{
public:
  /// Invalid/unknown node sentinel
  static constexpr uint32_t k_invalid_index = UINT32_MAX;

  /// Create an invalid reference
  constexpr NodeRef() noexcept : index_(k_invalid_index) {}

  constexpr explicit NodeRef(uint32_t index) noexcept : index_(index) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return index_ != k_invalid_index; }

  [[nodiscard]] constexpr uint32_t get_index() const noexcept { return index_; }

  [[nodiscard]] constexpr bool operator==(NodeRef other) const noexcept
  {
    return index_ == other.index_;
  }
  [[nodiscard]] constexpr bool operator!=(NodeRef other) const noexcept
  {
    return index_ != other.index_;
  }

private:
  uint32_t index_;
};

}  // namespace lineage

namespace std
{

template <>
struct hash<lineage::NodeRef>
{
  size_t operator()(lineage::NodeRef ref) const noexcept
  {
    return std::hash<uint32_t>{}(ref.get_index());
  }
};

}  // namespace std
