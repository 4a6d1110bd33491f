#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/query/field_context.hpp"

namespace sbomgraph::query {

enum class Operator {
  kEqual,        // =
  kNotEqual,     // !=
  kLike,         // ~   case-insensitive contains
  kNotLike,      // !~
  kGreater,      // >
  kGreaterEqual, // >=
  kLess,         // <
  kLessEqual,    // <=
};

/*
  One '&'-separated part of an expression.

  field == nullopt is a full-text term: any value of the node contains
  one of the alternatives, case-insensitively.
*/
struct Condition {
  std::optional<Field>     field;
  Operator                 op = Operator::kLike;
  std::vector<std::string> values;
};

/*
  Filter expression over node fields.

    name=openssl&version>=3.0
    purl~pkg:maven|pkg:npm
    openssl

  Conditions are AND-ed, '|'-separated alternatives OR-ed. '\' escapes
  any of  & | = ! ~ < > \  . Ordering operators compare version-aware
  (numeric runs numerically).

  On multi-valued fields a positive operator holds if any element
  satisfies it and a negated operator holds if none satisfies the
  positive form. Unknown fields and fields the node does not have never
  match, whatever the operator.

  The empty expression matches every node.
*/
class FilterExpression {
 public:
  // Throws util::InvalidArgument on malformed text.
  static FilterExpression Parse(std::string_view text);

  bool Matches(const FieldContext& context) const;

  bool Matches(const model::Node& node) const {
    return Matches(FieldContext(node));
  }

  const std::string& Text() const {
    return text_;
  }

  const std::vector<Condition>& Conditions() const {
    return conditions_;
  }

 private:
  std::string            text_;
  std::vector<Condition> conditions_;
};

// <0, 0, >0 like strcmp, comparing digit runs by numeric value
int NaturalCompare(std::string_view a, std::string_view b);

} // namespace sbomgraph::query
