#pragma once

namespace ctxerr::support {

// Visitor helper for std::visit with multiple lambdas.
//
// Usage:
//   std::visit(Overloaded{
//       [](const Reqwest& e) { ... },
//       [](const Io& e) { ... },
//   }, variant);
//
// Used by the generator itself and by every generated error type.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace ctxerr::support
