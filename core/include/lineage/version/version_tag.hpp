// lineage/version/version_tag.hpp - Totally ordered version identifiers
//
// Version tags order the nodes of a chain hierarchy. Only ordering is
// interpreted; there is no notion of compatibility ranges.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lineage
{

/**
 * A parsed version string such as "1.0", "2.10.3" or "2.0-alt".
 *
 * Grammar:
 *   version   := component ('.' component)* ('-' suffix)?
 *   component := [A-Za-z0-9_]+
 *   suffix    := any non-empty run without whitespace
 *
 * Ordering rules:
 * - Components compare left to right.
 * - Numeric components compare by value, numeric sorts before alphanumeric,
 *   alphanumeric components compare lexicographically.
 * - Missing trailing components count as "0", so "1" == "1.0".
 * - A suffixed version sorts after the same version without a suffix.
 */
class VersionTag
{
public:
  /**
   * Parse a version string.
   * @return std::nullopt if text does not follow the grammar
   */
  [[nodiscard]] static std::optional<VersionTag> parse(std::string_view text);

  /// The text this tag was parsed from.
  [[nodiscard]] const std::string & text() const noexcept { return text_; }

  [[nodiscard]] const std::string & suffix() const noexcept { return suffix_; }

  [[nodiscard]] size_t component_count() const noexcept { return components_.size(); }

  /**
   * Three-way comparison.
   * @return negative if *this < other, zero if equal, positive otherwise
   */
  [[nodiscard]] int compare(const VersionTag & other) const;

  [[nodiscard]] bool operator==(const VersionTag & other) const { return compare(other) == 0; }
  [[nodiscard]] bool operator!=(const VersionTag & other) const { return compare(other) != 0; }
  [[nodiscard]] bool operator<(const VersionTag & other) const { return compare(other) < 0; }
  [[nodiscard]] bool operator<=(const VersionTag & other) const { return compare(other) <= 0; }
  [[nodiscard]] bool operator>(const VersionTag & other) const { return compare(other) > 0; }
  [[nodiscard]] bool operator>=(const VersionTag & other) const { return compare(other) >= 0; }

private:
  struct Component
  {
    bool numeric = true;
    // Digits without leading zeros for numeric components ("0" for zero)
    std::string value;
  };

  static int compare_components(const Component & a, const Component & b);

  std::string text_;
  std::vector<Component> components_;
  std::string suffix_;
};

}  // namespace lineage
