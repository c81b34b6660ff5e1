#pragma once

namespace fnt {

// Visitor helper for std::visit with multiple lambdas.
//
// Usage:
//   std::visit(Overloaded{
//       [](const PlaceHandle& p) { ... },
//       [](const TransitionHandle& t) { ... },
//   }, node);
//
// With two variants, the non-template lambdas win over a generic
// `[](const auto&, const auto&)` fallback.

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace fnt
