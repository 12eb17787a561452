#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ctxerr::common {

// True if `name` can be used as a C++ identifier in generated code: ASCII
// letters, digits and underscores, not starting with a digit, not a keyword.
auto IsIdentifier(std::string_view name) -> bool;

// True for a possibly qualified namespace name such as "app::net"
auto IsNamespace(std::string_view name) -> bool;

// Canonical spelling of a C++ type, used as the type's identity.
// Whitespace is dropped except a single space between two identifier
// characters ("unsigned  int" -> "unsigned int", "Foo < int >" -> "Foo<int>").
auto NormalizeTypeSpelling(std::string_view spelling) -> std::string;

// Names a type spelling looks up unqualified, in order of appearance and
// without repeats: "std::vector<IoFailure>" -> {"std", "IoFailure"}.
// Keywords and names that follow "::" are skipped.
auto UnqualifiedTypeNames(std::string_view spelling)
    -> std::vector<std::string>;

}  // namespace ctxerr::common
