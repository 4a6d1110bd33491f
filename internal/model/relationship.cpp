#include "internal/model/relationship.hpp"

#include <array>
#include <utility>

#include "internal/util/errors.hpp"

namespace sbomgraph::model {

namespace {

constexpr std::array<std::pair<Relationship, std::string_view>, 16> kNames = {{
    {Relationship::kContains, "contains"},
    {Relationship::kDependsOn, "depends_on"},
    {Relationship::kDevDependsOn, "dev_depends_on"},
    {Relationship::kOptionalDependsOn, "optional_depends_on"},
    {Relationship::kProvidedDependsOn, "provided_depends_on"},
    {Relationship::kTestDependsOn, "test_depends_on"},
    {Relationship::kRuntimeDependsOn, "runtime_depends_on"},
    {Relationship::kExampleOf, "example_of"},
    {Relationship::kGeneratedFrom, "generated_from"},
    {Relationship::kAncestorOf, "ancestor_of"},
    {Relationship::kVariantOf, "variant_of"},
    {Relationship::kBuildToolOf, "build_tool_of"},
    {Relationship::kDevToolOf, "dev_tool_of"},
    {Relationship::kDescribes, "describes"},
    {Relationship::kPackageOf, "package_of"},
    {Relationship::kUndefined, "undefined"},
}};

} // namespace

std::string_view ToString(Relationship relationship) {
  for (const auto& [value, name] : kNames) {
    if (value == relationship) {
      return name;
    }
  }
  return "undefined";
}

std::optional<Relationship> ParseRelationship(std::string_view name) {
  for (const auto& [value, known] : kNames) {
    if (known == name) {
      return value;
    }
  }
  return std::nullopt;
}

RelationshipSet ParseRelationships(const std::vector<std::string>& names) {
  RelationshipSet out;
  for (const auto& name : names) {
    auto parsed = ParseRelationship(name);
    if (!parsed) {
      throw util::InvalidArgument("unknown relationship: " + name);
    }
    out.insert(*parsed);
  }
  return out;
}

} // namespace sbomgraph::model
