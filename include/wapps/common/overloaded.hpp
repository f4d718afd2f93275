#pragma once

namespace wapps {

// Builds a visitor for std::visit out of several lambdas, one per
// alternative:
//
//   std::visit(Overloaded{
//       [](const PointerMove& e) { ... },
//       [](const KeyDown& e) { ... },
//   }, event);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace wapps
