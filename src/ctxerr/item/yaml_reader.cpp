#include "ctxerr/item/yaml_reader.hpp"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "ctxerr/common/diagnostic/diagnostic.hpp"
#include "ctxerr/common/identifier.hpp"
#include "ctxerr/common/source_span.hpp"
#include "ctxerr/item/raw_item.hpp"

namespace ctxerr::item {

namespace {

// Carries a located diagnostic out of the recursive readers
class ReadError : public std::runtime_error {
 public:
  explicit ReadError(Diagnostic diag)
      : std::runtime_error(diag.primary.message), diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }

 private:
  Diagnostic diag_;
};

class DocumentReader {
 public:
  DocumentReader(FileId file, std::string path)
      : file_(file), path_(std::move(path)) {
  }

  auto Read(const YAML::Node& root) -> SourceDocument {
    SourceDocument doc;
    doc.path = path_;

    if (!root.IsMap()) {
      Fail(root, "expected a map at the top of the item description");
    }

    // A document is either a single item or a list of items with shared
    // placement options.
    if (root["kind"]) {
      doc.items.push_back(ReadItem(root));
      return doc;
    }

    ValidateKeys(root, {"namespace", "includes", "items"}, "document");
    if (root["namespace"]) {
      doc.cpp_namespace = Scalar(root["namespace"], "namespace");
      if (!common::IsNamespace(doc.cpp_namespace)) {
        Fail(
            root["namespace"],
            fmt::format("'{}' is not a valid namespace", doc.cpp_namespace));
      }
    }
    if (root["includes"]) {
      for (const auto& inc : Sequence(root["includes"], "includes")) {
        doc.includes.push_back(Scalar(inc, "includes entry"));
      }
    }
    if (!root["items"]) {
      Fail(root, "missing 'items'");
    }
    for (const auto& node : Sequence(root["items"], "items")) {
      doc.items.push_back(ReadItem(node));
    }
    return doc;
  }

 private:
  auto ReadItem(const YAML::Node& node) -> RawItem {
    if (!node.IsMap()) {
      Fail(node, "expected an item map");
    }
    ValidateKeys(
        node,
        {"kind", "name", "capability", "trait", "contextual", "display", "doc",
         "attributes", "cases", "fields"},
        "item");

    RawItem item;
    item.keyword = Scalar(Required(node, "kind", "item"), "kind");
    if (item.keyword == "enum") {
      item.kind = ItemKind::kEnum;
    } else if (item.keyword == "struct") {
      item.kind = ItemKind::kStruct;
    } else {
      item.kind = ItemKind::kOther;
    }
    item.name = Scalar(Required(node, "name", "item"), "name");
    item.span = SpanOf(node["name"]);

    for (const char* key : {"capability", "trait"}) {
      if (node[key]) {
        item.arguments.push_back(
            RawAttribute{
                .name = std::string(key),
                .value = Scalar(node[key], key),
                .span = SpanOf(node[key])});
      }
    }
    ReadAttributes(node, item.attributes);

    if (node["cases"]) {
      for (const auto& case_node : Sequence(node["cases"], "cases")) {
        item.variants.push_back(ReadCase(case_node));
      }
    }
    if (node["fields"]) {
      item.fields = ReadFields(node["fields"]);
    }
    return item;
  }

  auto ReadCase(const YAML::Node& node) -> RawCase {
    if (!node.IsMap()) {
      Fail(node, "expected a case map");
    }
    ValidateKeys(
        node, {"name", "contextual", "display", "doc", "attributes", "fields"},
        "case");

    RawCase c;
    c.name = Scalar(Required(node, "name", "case"), "name");
    c.span = SpanOf(node["name"]);
    ReadAttributes(node, c.attributes);
    if (node["fields"]) {
      c.fields = ReadFields(node["fields"]);
    }
    return c;
  }

  auto ReadFields(const YAML::Node& node) -> std::vector<RawField> {
    std::vector<RawField> fields;
    for (const auto& field_node : Sequence(node, "fields")) {
      // Shorthand: a bare type is a positional field
      if (field_node.IsScalar()) {
        fields.push_back(
            RawField{
                .name = std::nullopt,
                .type = Scalar(field_node, "field type"),
                .attributes = {},
                .span = SpanOf(field_node)});
        continue;
      }
      if (!field_node.IsMap()) {
        Fail(field_node, "expected a field map or a type name");
      }
      ValidateKeys(
          field_node, {"name", "type", "source", "doc", "attributes"}, "field");

      RawField field;
      const auto& type_node = Required(field_node, "type", "field");
      field.type = Scalar(type_node, "type");
      field.span = SpanOf(type_node);
      if (field_node["name"]) {
        field.name = Scalar(field_node["name"], "name");
        field.span = SpanOf(field_node["name"]);
      }
      if (field_node["source"] && Flag(field_node["source"], "source")) {
        field.attributes.push_back(
            RawAttribute{
                .name = "source",
                .value = {},
                .span = SpanOf(field_node["source"])});
      }
      if (field_node["doc"]) {
        field.attributes.push_back(
            RawAttribute{
                .name = "doc",
                .value = Scalar(field_node["doc"], "doc"),
                .span = SpanOf(field_node["doc"])});
      }
      ReadExtraAttributes(field_node, field.attributes);
      fields.push_back(std::move(field));
    }
    return fields;
  }

  // contextual / display / doc keys plus the free-form `attributes` map
  void ReadAttributes(
      const YAML::Node& node, std::vector<RawAttribute>& out) const {
    if (node["contextual"]) {
      out.push_back(
          RawAttribute{
              .name = "contextual",
              .value = MarkerValue(node["contextual"]),
              .span = SpanOf(node["contextual"])});
    }
    for (const char* key : {"display", "doc"}) {
      if (node[key]) {
        out.push_back(
            RawAttribute{
                .name = std::string(key),
                .value = Scalar(node[key], key),
                .span = SpanOf(node[key])});
      }
    }
    ReadExtraAttributes(node, out);
  }

  void ReadExtraAttributes(
      const YAML::Node& node, std::vector<RawAttribute>& out) const {
    if (!node["attributes"]) {
      return;
    }
    const auto& attrs = node["attributes"];
    if (!attrs.IsMap()) {
      Fail(attrs, "'attributes' must be a map of name to value");
    }
    for (const auto& pair : attrs) {
      out.push_back(
          RawAttribute{
              .name = Scalar(pair.first, "attribute name"),
              .value = pair.second.IsNull()
                           ? std::string()
                           : Scalar(pair.second, "attribute value"),
              .span = SpanOf(pair.first)});
    }
  }

  void ValidateKeys(
      const YAML::Node& node, std::initializer_list<std::string_view> allowed,
      std::string_view context) const {
    for (const auto& pair : node) {
      auto key = pair.first.as<std::string>();
      if (std::ranges::find(allowed, key) == allowed.end()) {
        Fail(pair.first, fmt::format("unknown field '{}' in {}", key, context));
      }
    }
  }

  auto Required(
      const YAML::Node& node, std::string_view key,
      std::string_view context) const -> YAML::Node {
    auto child = node[std::string(key)];
    if (!child) {
      Fail(
          node,
          fmt::format("{} is missing required field '{}'", context, key));
    }
    return child;
  }

  auto Scalar(const YAML::Node& node, std::string_view what) const
      -> std::string {
    if (!node.IsScalar()) {
      Fail(node, fmt::format("'{}' must be a scalar", what));
    }
    return node.as<std::string>();
  }

  auto Flag(const YAML::Node& node, std::string_view what) const -> bool {
    try {
      return node.as<bool>();
    } catch (const YAML::BadConversion&) {
      Fail(node, fmt::format("'{}' must be true or false", what));
    }
  }

  // YAML booleans ("True", "yes", "on") become "true" or "false", the same
  // spellings `source` accepts. Anything else is kept verbatim for the
  // builder to reject.
  auto MarkerValue(const YAML::Node& node) const -> std::string {
    if (node.IsNull()) {
      return {};
    }
    try {
      return node.as<bool>() ? "true" : "false";
    } catch (const YAML::BadConversion&) {
      return Scalar(node, "contextual");
    }
  }

  auto Sequence(const YAML::Node& node, std::string_view what) const
      -> YAML::Node {
    if (!node.IsSequence()) {
      Fail(node, fmt::format("'{}' must be a list", what));
    }
    return node;
  }

  [[nodiscard]] auto SpanOf(const YAML::Node& node) const -> SourceSpan {
    auto mark = node.Mark();
    if (mark.pos < 0) {
      return SourceSpan{.file_id = file_, .begin = 0, .end = 0};
    }
    auto begin = static_cast<uint32_t>(mark.pos);
    auto length = node.IsScalar() ? node.Scalar().size() : std::size_t{1};
    return SourceSpan{
        .file_id = file_,
        .begin = begin,
        .end = begin + static_cast<uint32_t>(std::max<std::size_t>(length, 1))};
  }

  [[noreturn]] void Fail(const YAML::Node& node, std::string message) const {
    throw ReadError(Diagnostic::HostError(SpanOf(node), std::move(message)));
  }

  FileId file_;
  std::string path_;
};

}  // namespace

auto YamlReader::ReadFile(const std::filesystem::path& path)
    -> Result<SourceDocument> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot open item description '{}'", path.string())));
  }
  std::ostringstream content;
  content << in.rdbuf();
  return ReadString(path.string(), content.str());
}

auto YamlReader::ReadString(std::string path, std::string content)
    -> Result<SourceDocument> {
  FileId file = sources_.AddFile(path, content);

  YAML::Node root;
  try {
    // NOLINTNEXTLINE(misc-include-cleaner): Load is provided by yaml.h
    root = YAML::Load(content);
  } catch (const YAML::ParserException& e) {
    auto begin = e.mark.pos < 0 ? 0U : static_cast<uint32_t>(e.mark.pos);
    return std::unexpected(
        Diagnostic::HostError(
            SourceSpan{.file_id = file, .begin = begin, .end = begin + 1},
            fmt::format("invalid YAML: {}", e.msg)));
  }

  try {
    auto doc = DocumentReader(file, path).Read(root);
    spdlog::debug("read {} item(s) from '{}'", doc.items.size(), path);
    return doc;
  } catch (const ReadError& e) {
    return std::unexpected(e.GetDiagnostic());
  } catch (const YAML::Exception& e) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("{}: {}", path, e.what())));
  }
}

}  // namespace ctxerr::item
