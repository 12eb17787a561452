#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ctxerr/common/source_span.hpp"

namespace ctxerr::item {

// Structured view of an annotated item as handed over by a front end.
// Nothing here is validated; the model builder decides what is well formed.

enum class ItemKind : uint8_t {
  kEnum,
  kStruct,
  kOther,  // Anything else the front end saw (union, fn, ...)
};

struct RawAttribute {
  std::string name;
  std::string value;  // Empty for flag attributes
  SourceSpan span;

  auto operator==(const RawAttribute&) const -> bool = default;
};

struct RawField {
  std::optional<std::string> name;  // nullopt for positional fields
  std::string type;
  std::vector<RawAttribute> attributes;
  SourceSpan span;

  auto operator==(const RawField&) const -> bool = default;
};

struct RawCase {
  std::string name;
  std::vector<RawField> fields;
  std::vector<RawAttribute> attributes;
  SourceSpan span;

  auto operator==(const RawCase&) const -> bool = default;
};

struct RawItem {
  ItemKind kind = ItemKind::kOther;
  std::string keyword;  // Kind as spelled in the description
  std::string name;
  std::vector<RawCase> variants;  // Enum items
  std::vector<RawField> fields;   // Struct items
  std::vector<RawAttribute> attributes;
  // Arguments addressed to the generator itself (capability name override)
  std::vector<RawAttribute> arguments;
  SourceSpan span;

  auto operator==(const RawItem&) const -> bool = default;
};

// One item description file: placement options shared by all its items plus
// the items in declaration order.
struct SourceDocument {
  std::string path;
  std::string cpp_namespace;
  std::vector<std::string> includes;
  std::vector<RawItem> items;
};

}  // namespace ctxerr::item
