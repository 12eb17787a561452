#include "ctxerr/model/type_definition.hpp"

#include <algorithm>

namespace ctxerr::model {

auto FindAttribute(
    const std::vector<Attribute>& attributes, std::string_view name)
    -> const Attribute* {
  auto it = std::ranges::find(attributes, name, &Attribute::name);
  return it == attributes.end() ? nullptr : &*it;
}

auto ToString(ItemShape shape) -> const char* {
  switch (shape) {
    case ItemShape::kEnum:
      return "enum";
    case ItemShape::kStruct:
      return "struct";
  }
  return "unknown";
}

}  // namespace ctxerr::model
