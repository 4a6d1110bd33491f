#pragma once

#include <cstdint>
#include <limits>

#include "internal/model/relationship.hpp"

namespace sbomgraph::analysis {

inline constexpr std::uint64_t kUnlimitedDepth = std::numeric_limits<std::uint64_t>::max();

/*
  Per-request traversal options.

  A depth of 0 disables that direction; an empty relationship set
  follows every edge.
*/
struct QueryOptions {
  std::uint64_t          ancestors   = kUnlimitedDepth;
  std::uint64_t          descendants = kUnlimitedDepth;
  model::RelationshipSet relationships;
};

} // namespace sbomgraph::analysis
