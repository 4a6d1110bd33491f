#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

namespace sbomgraph::model {

// limit == 0 means "everything from offset on"
struct Paginated {
  std::uint64_t offset = 0;
  std::uint64_t limit  = 0;
};

template <typename T>
struct PaginatedResults {
  std::vector<T> items;
  std::uint64_t  total = 0;
};

template <typename T>
PaginatedResults<T> Paginate(std::vector<T> all, const Paginated& page) {
  PaginatedResults<T> out;
  out.total = all.size();

  const auto begin = std::min<std::uint64_t>(page.offset, all.size());
  auto       end   = static_cast<std::uint64_t>(all.size());
  if (page.limit > 0 && page.limit < end - begin) {
    end = begin + page.limit;
  }

  out.items.reserve(end - begin);
  std::move(all.begin() + static_cast<std::ptrdiff_t>(begin), all.begin() + static_cast<std::ptrdiff_t>(end), std::back_inserter(out.items));
  return out;
}

} // namespace sbomgraph::model
