#include "ctxerr/model/builder.hpp"

#include <algorithm>
#include <array>
#include <expected>
#include <span>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "ctxerr/common/identifier.hpp"
#include "ctxerr/gen/emitter.hpp"
#include "ctxerr/gen/generation_error.hpp"
#include "ctxerr/item/raw_item.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::model {

namespace {

// Generator arguments: `trait` is kept as an alias of `capability`
constexpr std::string_view kCapabilityArgument = "capability";
constexpr std::string_view kTraitArgument = "trait";

// Members of the rendered enum class that a case name would shadow, and the
// namespaces its generated body names unqualified
constexpr std::array<std::string_view, 12> kReservedCaseNames = {
    "Variant",  "Get",      "Is",     "As", "CaseName", "Display",
    "HasSource", "SourceAs", "value_", "T",  "std",      "fmt"};

// Members of a rendered struct that a field name would shadow
constexpr std::array<std::string_view, 3> kReservedFieldNames = {
    "Display", "HasSource", "SourceAs"};

auto IsReserved(std::span<const std::string_view> names, std::string_view name)
    -> bool {
  return std::ranges::find(names, name) != names.end();
}

// Unqualified names looked up by the field types; a case or field declared
// under one of these names would hide the type inside the rendered class
void TypeNamesOf(
    const std::vector<item::RawField>& fields,
    std::unordered_set<std::string>& names) {
  for (const auto& field : fields) {
    for (auto& name : common::UnqualifiedTypeNames(field.type)) {
      names.insert(std::move(name));
    }
  }
}

class Builder {
 public:
  explicit Builder(const item::RawItem& item) : item_(item) {
  }

  auto Build() -> gen::GenResult<TypeDefinition> {
    if (item_.kind == item::ItemKind::kOther) {
      return std::unexpected(Fail(
          item_.span,
          fmt::format(
              "'{}' items cannot derive a context capability; only structs "
              "and enums can",
              item_.keyword.empty() ? "unknown" : item_.keyword)));
    }
    if (!common::IsIdentifier(item_.name)) {
      return std::unexpected(Fail(
          item_.span,
          fmt::format("'{}' is not a valid identifier", item_.name)));
    }

    TypeDefinition def;
    def.name = item_.name;
    def.span = item_.span;

    auto capability = BuildCapabilityName();
    if (!capability) {
      return std::unexpected(std::move(capability.error()));
    }
    def.capability_name = std::move(*capability);
    if (def.CapabilityName() == item_.name ||
        item_.name == gen::kContextOperation) {
      return std::unexpected(Fail(
          item_.span,
          fmt::format(
              "item name '{}' collides with the generated capability",
              item_.name)));
    }

    std::unordered_set<std::string> type_names;
    TypeNamesOf(item_.fields, type_names);
    for (const auto& variant : item_.variants) {
      TypeNamesOf(variant.fields, type_names);
    }
    if (type_names.contains(item_.name)) {
      return std::unexpected(Fail(
          item_.span,
          fmt::format(
              "item name '{}' collides with a type named by its own fields",
              item_.name)));
    }

    auto cases = item_.kind == item::ItemKind::kEnum ? BuildEnumCases(def)
                                                     : BuildStructCase(def);
    if (!cases) {
      return std::unexpected(std::move(cases.error()));
    }
    def.cases = std::move(*cases);

    spdlog::debug(
        "built {} '{}' with {} case(s), capability '{}'", ToString(def.shape),
        def.name, def.cases.size(), def.CapabilityName());
    return def;
  }

 private:
  auto Fail(SourceSpan span, std::string reason) const
      -> gen::GenerationError {
    return gen::MalformedItem{
        .item_name = item_.name, .reason = std::move(reason), .span = span};
  }

  auto BuildCapabilityName() const
      -> gen::GenResult<std::optional<std::string>> {
    std::optional<std::string> name;
    for (const auto& arg : item_.arguments) {
      if (arg.name != kCapabilityArgument && arg.name != kTraitArgument) {
        return std::unexpected(Fail(
            arg.span,
            fmt::format("unknown generator argument '{}'", arg.name)));
      }
      if (arg.value == gen::kContextOperation) {
        return std::unexpected(Fail(
            arg.span, fmt::format(
                          "capability name '{}' collides with its operation",
                          arg.value)));
      }
      if (name) {
        return std::unexpected(
            Fail(arg.span, "the capability name is given more than once"));
      }
      if (!common::IsIdentifier(arg.value)) {
        return std::unexpected(Fail(
            arg.span, fmt::format(
                          "capability name '{}' is not a valid identifier",
                          arg.value)));
      }
      name = arg.value;
    }
    return name;
  }

  auto BuildEnumCases(TypeDefinition& def) const
      -> gen::GenResult<std::vector<Case>> {
    def.shape = ItemShape::kEnum;
    if (!item_.fields.empty()) {
      return std::unexpected(Fail(
          item_.fields.front().span,
          "an enum declares cases, not fields; move the fields into a case"));
    }
    if (item_.variants.empty()) {
      return std::unexpected(Fail(
          item_.span, fmt::format("enum '{}' declares no cases", item_.name)));
    }

    auto attributes = BuildAttributes(item_.attributes);
    if (!attributes) {
      return std::unexpected(std::move(attributes.error()));
    }
    if (attributes->contextual) {
      return std::unexpected(Fail(
          item_.span,
          "the contextual marker applies to enum cases, not to the enum"));
    }
    def.attributes = std::move(attributes->attributes);

    std::unordered_set<std::string> type_names;
    for (const auto& variant : item_.variants) {
      TypeNamesOf(variant.fields, type_names);
    }

    std::vector<Case> cases;
    std::unordered_set<std::string> seen;
    for (const auto& variant : item_.variants) {
      if (!seen.insert(variant.name).second) {
        return std::unexpected(Fail(
            variant.span,
            fmt::format("case '{}' is declared more than once", variant.name)));
      }
      if (variant.name == item_.name ||
          IsReserved(kReservedCaseNames, variant.name)) {
        return std::unexpected(Fail(
            variant.span,
            fmt::format(
                "case name '{}' collides with a generated member of '{}'",
                variant.name, item_.name)));
      }
      if (type_names.contains(variant.name)) {
        return std::unexpected(Fail(
            variant.span,
            fmt::format(
                "case name '{}' collides with a type named by the fields of "
                "'{}'; qualify the type or rename the case",
                variant.name, item_.name)));
      }
      auto c = BuildCase(
          variant.name, variant.fields, variant.attributes, variant.span);
      if (!c) {
        return std::unexpected(std::move(c.error()));
      }
      cases.push_back(std::move(*c));
    }
    return cases;
  }

  auto BuildStructCase(TypeDefinition& def) const
      -> gen::GenResult<std::vector<Case>> {
    def.shape = ItemShape::kStruct;
    if (!item_.variants.empty()) {
      return std::unexpected(Fail(
          item_.variants.front().span,
          "a struct declares fields, not cases; use an enum instead"));
    }
    auto c = BuildCase(item_.name, item_.fields, item_.attributes, item_.span);
    if (!c) {
      return std::unexpected(std::move(c.error()));
    }
    for (const auto& field : c->fields) {
      if (field.name && IsReserved(kReservedFieldNames, *field.name)) {
        return std::unexpected(Fail(
            field.span,
            fmt::format(
                "field name '{}' collides with a generated member of '{}'",
                *field.name, item_.name)));
      }
    }
    std::vector<Case> cases;
    cases.push_back(std::move(*c));
    return cases;
  }

  struct SplitAttributes {
    std::vector<Attribute> attributes;
    bool contextual = false;
  };

  // Separates the generator's own marker from pass-through attributes
  auto BuildAttributes(const std::vector<item::RawAttribute>& raw) const
      -> gen::GenResult<SplitAttributes> {
    SplitAttributes result;
    for (const auto& attr : raw) {
      if (attr.name != kContextualAttribute) {
        result.attributes.push_back(
            Attribute{
                .name = attr.name, .value = attr.value, .span = attr.span});
        continue;
      }
      if (attr.value.empty() || attr.value == "true") {
        result.contextual = true;
      } else if (attr.value != "false") {
        return std::unexpected(Fail(
            attr.span,
            fmt::format(
                "the contextual marker takes 'true' or 'false', not '{}'",
                attr.value)));
      }
    }
    return result;
  }

  auto BuildCase(
      const std::string& name, const std::vector<item::RawField>& raw_fields,
      const std::vector<item::RawAttribute>& raw_attributes,
      SourceSpan span) const -> gen::GenResult<Case> {
    if (!common::IsIdentifier(name)) {
      return std::unexpected(Fail(
          span, fmt::format("case name '{}' is not a valid identifier", name)));
    }

    auto attributes = BuildAttributes(raw_attributes);
    if (!attributes) {
      return std::unexpected(std::move(attributes.error()));
    }

    Case c{
        .name = name,
        .fields = {},
        .attributes = std::move(attributes->attributes),
        .contextual = attributes->contextual,
        .kind = std::monostate{},
        .span = span,
    };

    std::unordered_set<std::string> type_names;
    TypeNamesOf(raw_fields, type_names);

    std::unordered_set<std::string> field_names;
    std::optional<bool> named;
    for (const auto& raw : raw_fields) {
      if (named && *named != raw.name.has_value()) {
        return std::unexpected(Fail(
            raw.span,
            fmt::format(
                "case '{}' mixes named and positional fields", name)));
      }
      named = raw.name.has_value();
      if (raw.name) {
        if (!common::IsIdentifier(*raw.name)) {
          return std::unexpected(Fail(
              raw.span, fmt::format(
                            "field name '{}' in case '{}' is not a valid "
                            "identifier",
                            *raw.name, name)));
        }
        if (type_names.contains(*raw.name)) {
          return std::unexpected(Fail(
              raw.span,
              fmt::format(
                  "field name '{}' in case '{}' collides with a type named "
                  "by its fields",
                  *raw.name, name)));
        }
        if (!field_names.insert(*raw.name).second) {
          return std::unexpected(Fail(
              raw.span,
              fmt::format(
                  "field '{}' is declared more than once in case '{}'",
                  *raw.name, name)));
        }
      }
      if (common::NormalizeTypeSpelling(raw.type).empty()) {
        return std::unexpected(Fail(
            raw.span,
            fmt::format("a field of case '{}' has no type", name)));
      }

      Field field{
          .name = raw.name,
          .type = raw.type,
          .attributes = {},
          .span = raw.span};
      for (const auto& attr : raw.attributes) {
        field.attributes.push_back(
            Attribute{
                .name = attr.name, .value = attr.value, .span = attr.span});
      }
      c.fields.push_back(std::move(field));
    }
    return c;
  }

  const item::RawItem& item_;
};

}  // namespace

auto BuildTypeDefinition(const item::RawItem& item)
    -> gen::GenResult<TypeDefinition> {
  return Builder(item).Build();
}

}  // namespace ctxerr::model
