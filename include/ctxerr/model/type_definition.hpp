#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ctxerr/common/source_span.hpp"

namespace ctxerr::model {

// Attribute names understood downstream of the builder
inline constexpr std::string_view kDisplayAttribute = "display";
inline constexpr std::string_view kSourceAttribute = "source";
inline constexpr std::string_view kDocAttribute = "doc";

// Marker owned by the generator; never survives into a Case's attributes
inline constexpr std::string_view kContextualAttribute = "contextual";

inline constexpr std::string_view kDefaultCapabilityName = "ContextErr";

// Type of the message field injected into contextual cases
inline constexpr std::string_view kMessageFieldType = "std::string";

struct Attribute {
  std::string name;
  std::string value;
  SourceSpan span;

  auto operator==(const Attribute&) const -> bool = default;
};

auto FindAttribute(
    const std::vector<Attribute>& attributes, std::string_view name)
    -> const Attribute*;

struct Field {
  std::optional<std::string> name;
  std::string type;
  std::vector<Attribute> attributes;
  SourceSpan span;

  auto operator==(const Field&) const -> bool = default;

  [[nodiscard]] auto IsSource() const -> bool {
    return FindAttribute(attributes, kSourceAttribute) != nullptr;
  }
};

// Case wraps exactly one failure type and receives a message on conversion
struct Contextual {
  std::string wrapped_type;  // Normalized spelling, the registry key

  auto operator==(const Contextual&) const -> bool = default;
};

// Case stays fully author-controlled
struct Opaque {
  auto operator==(const Opaque&) const -> bool = default;
};

// std::monostate until the classifier has run
using CaseKind = std::variant<std::monostate, Contextual, Opaque>;

struct Case {
  std::string name;
  std::vector<Field> fields;
  std::vector<Attribute> attributes;
  bool contextual = false;
  CaseKind kind;
  SourceSpan span;

  auto operator==(const Case&) const -> bool = default;

  [[nodiscard]] auto DisplayTemplate() const -> std::optional<std::string> {
    if (const auto* attr = FindAttribute(attributes, kDisplayAttribute)) {
      return attr->value;
    }
    return std::nullopt;
  }
};

enum class ItemShape : uint8_t { kEnum, kStruct };

auto ToString(ItemShape shape) -> const char*;

struct TypeDefinition {
  std::string name;
  ItemShape shape = ItemShape::kEnum;
  // A struct holds exactly one case, named after the struct
  std::vector<Case> cases;
  std::vector<Attribute> attributes;
  std::optional<std::string> capability_name;
  SourceSpan span;

  auto operator==(const TypeDefinition&) const -> bool = default;

  // Explicit override if present, else the conventional default
  [[nodiscard]] auto CapabilityName() const -> std::string {
    return capability_name.value_or(std::string(kDefaultCapabilityName));
  }
};

// Synthesizer output. Opaque cases are copies of their input; contextual
// cases carry the wrapped field, the injected message field and a
// synthesized display template.
struct AugmentedCase {
  std::string name;
  std::vector<Field> fields;
  std::vector<Attribute> attributes;
  CaseKind kind;
  // Index into `fields` of the injected message, contextual cases only
  std::optional<std::size_t> message_field;
  SourceSpan span;

  auto operator==(const AugmentedCase&) const -> bool = default;

  [[nodiscard]] auto IsContextual() const -> bool {
    return std::holds_alternative<Contextual>(kind);
  }
};

struct AugmentedDefinition {
  std::string name;
  ItemShape shape = ItemShape::kEnum;
  std::vector<AugmentedCase> cases;
  std::vector<Attribute> attributes;
  SourceSpan span;

  auto operator==(const AugmentedDefinition&) const -> bool = default;
};

}  // namespace ctxerr::model
