// lineage/version/version_tag.cpp - Version parsing and ordering
#include "lineage/version/version_tag.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace lineage
{

namespace
{

bool is_component_char(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_all_digits(std::string_view s)
{
  for (const char c : s) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) return false;
  }
  return true;
}

int sign(int v) { return (v > 0) - (v < 0); }

}  // namespace

std::optional<VersionTag> VersionTag::parse(std::string_view text)
{
  if (text.empty()) {
    return std::nullopt;
  }

  VersionTag tag;
  tag.text_ = std::string(text);

  std::string_view body = text;
  const auto dash = text.find('-');
  if (dash != std::string_view::npos) {
    body = text.substr(0, dash);
    const std::string_view suffix = text.substr(dash + 1);
    if (suffix.empty()) {
      return std::nullopt;
    }
    for (const char c : suffix) {
      if (std::isspace(static_cast<unsigned char>(c)) != 0) return std::nullopt;
    }
    tag.suffix_ = std::string(suffix);
  }

  size_t start = 0;
  while (true) {
    const auto dot = body.find('.', start);
    const std::string_view part =
      body.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    if (part.empty()) {
      return std::nullopt;
    }
    for (const char c : part) {
      if (!is_component_char(c)) return std::nullopt;
    }

    Component comp;
    comp.numeric = is_all_digits(part);
    if (comp.numeric) {
      const auto first = part.find_first_not_of('0');
      comp.value = first == std::string_view::npos ? "0" : std::string(part.substr(first));
    } else {
      comp.value = std::string(part);
    }
    tag.components_.push_back(std::move(comp));

    if (dot == std::string_view::npos) break;
    start = dot + 1;
  }

  return tag;
}

int VersionTag::compare_components(const Component & a, const Component & b)
{
  if (a.numeric && b.numeric) {
    if (a.value.size() != b.value.size()) {
      return a.value.size() < b.value.size() ? -1 : 1;
    }
    return sign(a.value.compare(b.value));
  }
  if (a.numeric != b.numeric) {
    return a.numeric ? -1 : 1;
  }
  return sign(a.value.compare(b.value));
}

int VersionTag::compare(const VersionTag & other) const
{
  static const Component k_zero{true, "0"};

  const size_t n = std::max(components_.size(), other.components_.size());
  for (size_t i = 0; i < n; ++i) {
    const Component & a = i < components_.size() ? components_[i] : k_zero;
    const Component & b = i < other.components_.size() ? other.components_[i] : k_zero;
    const int c = compare_components(a, b);
    if (c != 0) return c;
  }

  if (suffix_.empty() != other.suffix_.empty()) {
    return suffix_.empty() ? -1 : 1;
  }
  return sign(suffix_.compare(other.suffix_));
}

}  // namespace lineage
