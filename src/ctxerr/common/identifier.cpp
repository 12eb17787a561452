#include "ctxerr/common/identifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ctxerr::common {

namespace {

constexpr std::array<std::string_view, 92> kKeywords = {
    "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor",
    "bool", "break", "case", "catch", "char", "char16_t", "char32_t", "char8_t",
    "class", "co_await", "co_return", "co_yield", "compl", "concept", "const",
    "const_cast", "consteval", "constexpr", "constinit", "continue", "decltype",
    "default", "delete", "do", "double", "dynamic_cast", "else", "enum",
    "explicit", "export", "extern", "false", "float", "for", "friend", "goto",
    "if", "inline", "int", "long", "mutable", "namespace", "new", "noexcept",
    "not", "not_eq", "nullptr", "operator", "or", "or_eq", "private",
    "protected", "public", "register", "reinterpret_cast", "requires", "return",
    "short", "signed", "sizeof", "static", "static_assert", "static_cast",
    "struct", "switch", "template", "this", "thread_local", "throw", "true",
    "try", "typedef", "typeid", "typename", "union", "unsigned", "using",
    "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq",
};

auto IsIdentChar(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

}  // namespace

auto IsIdentifier(std::string_view name) -> bool {
  if (name.empty()) {
    return false;
  }
  if (std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  if (!std::ranges::all_of(name, IsIdentChar)) {
    return false;
  }
  return std::ranges::find(kKeywords, name) == kKeywords.end();
}

auto IsNamespace(std::string_view name) -> bool {
  std::size_t start = 0;
  while (true) {
    auto end = name.find("::", start);
    if (!IsIdentifier(name.substr(start, end - start))) {
      return false;
    }
    if (end == std::string_view::npos) {
      return true;
    }
    start = end + 2;
  }
}

auto NormalizeTypeSpelling(std::string_view spelling) -> std::string {
  std::string result;
  result.reserve(spelling.size());
  bool pending_space = false;
  for (char c : spelling) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      pending_space = true;
      continue;
    }
    if (pending_space && !result.empty() && IsIdentChar(result.back()) &&
        IsIdentChar(c)) {
      result.push_back(' ');
    }
    pending_space = false;
    result.push_back(c);
  }
  return result;
}

auto UnqualifiedTypeNames(std::string_view spelling)
    -> std::vector<std::string> {
  std::vector<std::string> names;
  std::size_t pos = 0;
  while (pos < spelling.size()) {
    if (!IsIdentChar(spelling[pos])) {
      ++pos;
      continue;
    }
    auto start = pos;
    while (pos < spelling.size() && IsIdentChar(spelling[pos])) {
      ++pos;
    }
    auto word = spelling.substr(start, pos - start);

    auto before = start;
    while (before > 0 &&
           std::isspace(static_cast<unsigned char>(spelling[before - 1])) !=
               0) {
      --before;
    }
    bool qualified =
        before >= 2 && spelling.substr(before - 2, 2) == "::";
    if (qualified || !IsIdentifier(word)) {
      continue;
    }
    if (std::ranges::find(names, word) == names.end()) {
      names.emplace_back(word);
    }
  }
  return names;
}

}  // namespace ctxerr::common
