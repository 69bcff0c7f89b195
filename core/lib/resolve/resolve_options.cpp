// lineage/resolve/resolve_options.cpp
#include "lineage/resolve/resolve_options.hpp"

namespace lineage
{

std::optional<Fallback> fallback_from_string(std::string_view name)
{
  if (name == "none") return Fallback::None;
  if (name == "base") return Fallback::Base;
  if (name == "latest") return Fallback::Latest;
  return std::nullopt;
}

std::string_view fallback_to_string(Fallback fallback)
{
  switch (fallback) {
    case Fallback::None:
      return "none";
    case Fallback::Base:
      return "base";
    case Fallback::Latest:
      return "latest";
  }
  return "none";
}

}  // namespace lineage
