#pragma once

#include <algorithm>
#include <concepts>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace ctxerr::support {

// Generated error types expose Display(); nested ones are rendered with it
template <typename T>
concept HasDisplay = requires(const T& value) {
  { value.Display() } -> std::convertible_to<std::string>;
};

template <typename T>
concept Streamable = requires(std::ostream& out, const T& value) {
  { out << value } -> std::same_as<std::ostream&>;
};

// Renders one field for a display template. `format_spec` is the text after
// ':' in the placeholder and only applies to {fmt}-formattable values.
template <typename T>
auto ToDisplayString(const T& value, std::string_view format_spec)
    -> std::string {
  if constexpr (HasDisplay<T>) {
    return value.Display();
  } else if constexpr (fmt::is_formattable<T>::value) {
    // Runtime pattern: known only once the template is parsed
    std::string pattern =
        format_spec.empty() ? std::string("{}")
                            : fmt::format("{{:{}}}", format_spec);
    return fmt::format(fmt::runtime(pattern), value);
  } else if constexpr (Streamable<T>) {
    std::ostringstream out;
    out << value;
    return out.str();
  } else {
    return "<unprintable>";
  }
}

// Reference to a field handed to a display template. Every field of a case
// is passed, referenced by the template or not, so fields without a
// formatter must still be accepted.
template <typename T>
struct DisplayArg {
  const T* value;
};

template <typename T>
auto Arg(const T& value) -> DisplayArg<T> {
  return DisplayArg<T>{&value};
}

// Renders a display template. The template text is handed to {fmt} as is.
template <typename... Args>
auto Render(std::string_view display_template, const Args&... args)
    -> std::string {
  return fmt::format(fmt::runtime(display_template), args...);
}

}  // namespace ctxerr::support

namespace fmt {

template <typename T>
struct formatter<ctxerr::support::DisplayArg<T>> {
  std::string format_spec;

  auto parse(format_parse_context& ctx) -> format_parse_context::iterator {
    auto it = ctx.begin();
    while (it != ctx.end() && *it != '}') {
      ++it;
    }
    format_spec.assign(ctx.begin(), it);
    return it;
  }

  template <typename FormatContext>
  auto format(
      const ctxerr::support::DisplayArg<T>& arg, FormatContext& ctx) const
      -> decltype(ctx.out()) {
    auto text = ctxerr::support::ToDisplayString(*arg.value, format_spec);
    return std::copy(text.begin(), text.end(), ctx.out());
  }
};

}  // namespace fmt
