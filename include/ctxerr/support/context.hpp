#pragma once

#include <concepts>
#include <expected>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "ctxerr/support/display.hpp"

namespace ctxerr::support {

// Anything that can become the message of a contextual case
template <typename C>
concept Stringifiable = std::convertible_to<const C&, std::string_view> ||
                        HasDisplay<C> ||
                        fmt::is_formattable<std::remove_cvref_t<C>>::value;

template <Stringifiable C>
auto Stringify(const C& context) -> std::string {
  if constexpr (std::convertible_to<const C&, std::string_view>) {
    return std::string(std::string_view(context));
  } else if constexpr (HasDisplay<C>) {
    return context.Display();
  } else {
    return fmt::format(fmt::runtime("{}"), context);
  }
}

// True when `Capability` has a realization for `Result`. The primary
// template of every capability is declared but never defined, so only the
// generated specializations expose `Ok`.
template <template <typename> class Capability, typename Result>
concept Realizes = requires { typename Capability<Result>::Ok; };

// Success passes through unchanged; on failure the original failure is moved
// into `make`, whose result becomes the error of the returned value.
template <typename Target, typename T, typename E, typename Make>
auto AttachContext(std::expected<T, E>&& result, Make&& make)
    -> std::expected<T, Target> {
  if (result.has_value()) {
    if constexpr (std::is_void_v<T>) {
      return {};
    } else {
      return std::expected<T, Target>(std::in_place, std::move(*result));
    }
  }
  return std::unexpected<Target>(
      Target(std::forward<Make>(make)(std::move(result).error())));
}

// Causal-source access: a pointer to `value` if it is (or derives from) T
template <typename T, typename U>
auto SourceIf(const U& value) -> const T* {
  if constexpr (std::is_same_v<T, U> || std::is_base_of_v<T, U>) {
    return &value;
  } else {
    return nullptr;
  }
}

}  // namespace ctxerr::support
