#include <cassert>
#include <iostream>
#include <string>
#include <variant>

#include "internal/query/graph_query.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace sbomgraph;
using query::ComponentReference;
using query::GraphQuery;

model::Node Zlib() {
  model::PackageNode node;
  node.sbom_id = "s1";
  node.node_id = "SPDXRef-zlib";
  node.name    = "zlib";
  node.version = "1.3.1";
  node.purl.push_back(*model::Purl::Parse("pkg:generic/zlib@1.3.1?download_url=https://zlib.net"));
  node.cpe.push_back(*model::Cpe::Parse("cpe:2.3:a:zlib:zlib:1.3.1:*:*:*:*:*:*:*"));
  return node;
}

model::Node NamedFile() {
  model::UnknownNode node;
  node.sbom_id = "s1";
  node.node_id = "SPDXRef-file";
  node.name    = "zlib";
  return node;
}

bool RejectsReference(const std::string& text) {
  try {
    (void)query::ParseComponentReference(text);
  } catch (const util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestReferenceParsingByPrefix() {
  assert(std::holds_alternative<model::Purl>(query::ParseComponentReference("pkg:npm/left-pad@1.3.0")));
  assert(std::holds_alternative<model::Cpe>(query::ParseComponentReference("cpe:/a:zlib:zlib:1.3.1")));

  const auto name = query::ParseComponentReference("left-pad");
  assert(std::holds_alternative<query::ComponentName>(name));
  assert(std::get<query::ComponentName>(name).name == "left-pad");

  assert(RejectsReference("pkg:left-pad"));
  assert(RejectsReference("cpe:bogus"));
}

void TestIdAndNameMatchAnyVariant() {
  const GraphQuery by_id   = ComponentReference{query::ComponentId{"SPDXRef-file"}};
  const GraphQuery by_name = ComponentReference{query::ComponentName{"zlib"}};

  assert(query::Matches(by_id, NamedFile()));
  assert(!query::Matches(by_id, Zlib()));
  assert(query::Matches(by_name, NamedFile()));
  assert(query::Matches(by_name, Zlib()));
}

void TestPurlAndCpeMatchPackagesOnly() {
  const GraphQuery purl = query::ParseComponentReference("pkg:GENERIC/zlib@1.3.1?download_url=https://zlib.net");
  const GraphQuery cpe  = query::ParseComponentReference("cpe:2.3:a:ZLIB:zlib:1.3.1:*:*:*:*:*:*:*");
  const GraphQuery other = query::ParseComponentReference("pkg:generic/zlib@1.3.0");

  assert(query::Matches(purl, Zlib()));
  assert(query::Matches(cpe, Zlib()));
  assert(!query::Matches(other, Zlib()));
  assert(!query::Matches(purl, NamedFile()));
  assert(!query::Matches(cpe, NamedFile()));
}

void TestFilterExpressionQueries() {
  const GraphQuery expr = query::FilterExpression::Parse("name=zlib&version>=1.3");
  assert(query::Matches(expr, Zlib()));
  assert(!query::Matches(expr, NamedFile()));
}

void TestDescribe() {
  assert(query::Describe(ComponentReference{query::ComponentId{"n1"}}) == "id:n1");
  assert(query::Describe(query::ParseComponentReference("pkg:npm/a@1")) == "purl:pkg:npm/a@1");
  assert(query::Describe(query::FilterExpression::Parse("name~ssl")) == "q:name~ssl");
}

} // namespace

int main() {
  TestReferenceParsingByPrefix();
  TestIdAndNameMatchAnyVariant();
  TestPurlAndCpeMatchPackagesOnly();
  TestFilterExpressionQueries();
  TestDescribe();

  std::cout << "sbomgraph_unit_graph_query: pass\n";
  return 0;
}
