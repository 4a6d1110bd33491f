#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/model/node.hpp"

namespace sbomgraph::query {

// Fields a filter expression can reference. Resolved once at parse time.
enum class Field : std::uint8_t {
  kSbomId,
  kNodeId,
  kName,
  kVersion,
  kPurl,
  kCpe,
  kExternalDocumentReference,
  kExternalNodeId,
  kUnknown,
};

inline constexpr std::size_t kFieldCount = static_cast<std::size_t>(Field::kUnknown);

// kUnknown for names outside the fixed set
Field ParseField(std::string_view name);

/*
  Field values of one node, as seen by a filter expression.

  Base fields are present on every node; version / purl / cpe only on
  packages; external_* only on external nodes. Views point into the
  node, which must outlive the context.
*/
class FieldContext {
 public:
  explicit FieldContext(const model::Node& node);

  // nullptr when the field is absent for this node's variant
  const std::vector<std::string_view>* Values(Field field) const;

  // every value of every present field, for full-text terms
  template <typename F>
  bool AnyValue(F&& pred) const {
    for (const auto& slot : values_) {
      if (!slot) continue;
      for (auto v : *slot) {
        if (pred(v)) return true;
      }
    }
    return false;
  }

 private:
  void Set(Field field, std::vector<std::string_view> values);

  std::array<std::optional<std::vector<std::string_view>>, kFieldCount> values_;
};

} // namespace sbomgraph::query
