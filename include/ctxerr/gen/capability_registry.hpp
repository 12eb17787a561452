#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ctxerr/common/source_span.hpp"
#include "ctxerr/gen/generation_error.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::gen {

struct RegistryEntry {
  std::string wrapped_type;
  std::string case_name;
  SourceSpan span;

  auto operator==(const RegistryEntry&) const -> bool = default;
};

// Wrapped-type to case mapping of one capability scope. Each wrapped type
// maps to at most one case so that the conversion picked at a call site is
// never ambiguous. Lives for one generator invocation; scopes of separate
// invocations never see each other.
class CapabilityRegistry {
 public:
  explicit CapabilityRegistry(std::string capability_name)
      : name_(std::move(capability_name)) {
  }

  // Records a contextual case; opaque cases are ignored. Fails with
  // DuplicateWrappedType if the wrapped type is already claimed.
  auto Register(const model::AugmentedCase& augmented)
      -> std::expected<void, GenerationError>;

  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }

  // Entries in registration order
  [[nodiscard]] auto Entries() const -> const std::vector<RegistryEntry>& {
    return entries_;
  }

  [[nodiscard]] auto Find(std::string_view wrapped_type) const
      -> const RegistryEntry*;

 private:
  std::string name_;
  std::vector<RegistryEntry> entries_;
  std::unordered_map<std::string, std::size_t> by_wrapped_type_;
};

}  // namespace ctxerr::gen
