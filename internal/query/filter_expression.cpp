#include "internal/query/filter_expression.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace sbomgraph::query {

namespace {

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

char Lower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                        [](char a, char b) { return Lower(a) == Lower(b); });
  return it != haystack.end();
}

// Splits on unescaped `sep`, keeping escapes in the parts.
std::vector<std::string_view> SplitUnescaped(std::string_view text, char sep) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\\') {
      ++i;
      continue;
    }
    if (text[i] == sep) {
      parts.push_back(text.substr(start, i - start));
      start = i + 1;
    }
  }
  parts.push_back(text.substr(start));
  return parts;
}

std::string Unescape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\\') {
      if (i + 1 == text.size()) {
        throw util::InvalidArgument("dangling escape in filter expression");
      }
      out += text[++i];
      continue;
    }
    out += text[i];
  }
  return out;
}

std::vector<std::string> Alternatives(std::string_view text) {
  std::vector<std::string> values;
  for (auto part : SplitUnescaped(text, '|')) values.push_back(Unescape(part));
  return values;
}

struct OperatorMatch {
  std::size_t position;
  std::size_t length;
  Operator    op;
};

std::optional<OperatorMatch> FindOperator(std::string_view segment) {
  for (std::size_t i = 0; i < segment.size(); ++i) {
    const char c    = segment[i];
    const char next = i + 1 < segment.size() ? segment[i + 1] : '\0';
    switch (c) {
      case '\\':
        ++i;
        break;
      case '=':
        return OperatorMatch{i, 1, Operator::kEqual};
      case '~':
        return OperatorMatch{i, 1, Operator::kLike};
      case '!':
        if (next == '=') return OperatorMatch{i, 2, Operator::kNotEqual};
        if (next == '~') return OperatorMatch{i, 2, Operator::kNotLike};
        throw util::InvalidArgument("unexpected '!' in filter expression: " + std::string(segment));
      case '>':
        if (next == '=') return OperatorMatch{i, 2, Operator::kGreaterEqual};
        return OperatorMatch{i, 1, Operator::kGreater};
      case '<':
        if (next == '=') return OperatorMatch{i, 2, Operator::kLessEqual};
        return OperatorMatch{i, 1, Operator::kLess};
      default:
        break;
    }
  }
  return std::nullopt;
}

bool IsNegated(Operator op) {
  return op == Operator::kNotEqual || op == Operator::kNotLike;
}

// the positive form of `op` on one value / alternative pair
bool Holds(Operator op, std::string_view value, std::string_view alt) {
  switch (op) {
    case Operator::kEqual:
    case Operator::kNotEqual:
      return value == alt;
    case Operator::kLike:
    case Operator::kNotLike:
      return ContainsIgnoreCase(value, alt);
    case Operator::kGreater:
      return NaturalCompare(value, alt) > 0;
    case Operator::kGreaterEqual:
      return NaturalCompare(value, alt) >= 0;
    case Operator::kLess:
      return NaturalCompare(value, alt) < 0;
    case Operator::kLessEqual:
      return NaturalCompare(value, alt) <= 0;
  }
  return false;
}

bool Evaluate(const Condition& condition, const FieldContext& context) {
  if (!condition.field) {
    return context.AnyValue([&](std::string_view value) {
      return std::any_of(condition.values.begin(), condition.values.end(),
                         [&](const std::string& alt) { return ContainsIgnoreCase(value, alt); });
    });
  }

  const auto* values = context.Values(*condition.field);
  if (!values) return false;

  bool any = false;
  for (auto value : *values) {
    for (const auto& alt : condition.values) {
      if (Holds(condition.op, value, alt)) {
        any = true;
        break;
      }
    }
    if (any) break;
  }

  return IsNegated(condition.op) ? !any : any;
}

} // namespace

FilterExpression FilterExpression::Parse(std::string_view text) {
  FilterExpression expr;
  expr.text_ = std::string(text);

  if (text.empty()) return expr;

  for (auto segment : SplitUnescaped(text, '&')) {
    if (segment.empty()) {
      throw util::InvalidArgument("empty condition in filter expression: " + std::string(text));
    }

    Condition condition;
    if (auto op = FindOperator(segment)) {
      const auto field_name = Unescape(segment.substr(0, op->position));
      if (field_name.empty()) {
        throw util::InvalidArgument("missing field name in filter expression: " + std::string(segment));
      }
      condition.field  = ParseField(field_name);
      condition.op     = op->op;
      condition.values = Alternatives(segment.substr(op->position + op->length));
    } else {
      condition.values = Alternatives(segment);
    }

    expr.conditions_.push_back(std::move(condition));
  }

  return expr;
}

bool FilterExpression::Matches(const FieldContext& context) const {
  return std::all_of(conditions_.begin(), conditions_.end(),
                     [&](const Condition& c) { return Evaluate(c, context); });
}

int NaturalCompare(std::string_view a, std::string_view b) {
  std::size_t i = 0;
  std::size_t j = 0;

  while (i < a.size() && j < b.size()) {
    if (IsDigit(a[i]) && IsDigit(b[j])) {
      const auto si = i;
      const auto sj = j;
      while (i < a.size() && IsDigit(a[i])) ++i;
      while (j < b.size() && IsDigit(b[j])) ++j;

      auto na = a.substr(si, i - si);
      auto nb = b.substr(sj, j - sj);
      na.remove_prefix(std::min(na.find_first_not_of('0'), na.size()));
      nb.remove_prefix(std::min(nb.find_first_not_of('0'), nb.size()));

      if (na.size() != nb.size()) return na.size() < nb.size() ? -1 : 1;
      if (const int c = na.compare(nb); c != 0) return c < 0 ? -1 : 1;
      continue;
    }

    if (a[i] != b[j]) return static_cast<unsigned char>(a[i]) < static_cast<unsigned char>(b[j]) ? -1 : 1;
    ++i;
    ++j;
  }

  if (i == a.size() && j == b.size()) return 0;
  return i == a.size() ? -1 : 1;
}

} // namespace sbomgraph::query
