#pragma once

namespace sbomgraph::util {

// Visitor built from lambdas, for exhaustive std::visit over closed variants.
template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace sbomgraph::util
