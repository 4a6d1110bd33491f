#include <cassert>
#include <iostream>
#include <string>

#include "internal/query/filter_expression.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace sbomgraph;
using query::FilterExpression;

model::Node OpenSsl() {
  model::PackageNode node;
  node.sbom_id = "sbom-1";
  node.node_id = "SPDXRef-openssl";
  node.name    = "OpenSSL";
  node.version = "3.0.10";
  node.purl.push_back(*model::Purl::Parse("pkg:generic/openssl@3.0.10"));
  node.purl.push_back(*model::Purl::Parse("pkg:deb/debian/libssl3@3.0.10"));
  node.cpe.push_back(*model::Cpe::Parse("cpe:2.3:a:openssl:openssl:3.0.10:*:*:*:*:*:*:*"));
  return node;
}

model::Node DocumentRoot() {
  model::UnknownNode node;
  node.sbom_id = "sbom-1";
  node.node_id = "SPDXRef-DOCUMENT";
  node.name    = "firmware image";
  return node;
}

model::Node ExternalRef() {
  model::ExternalNode node;
  node.sbom_id                     = "sbom-1";
  node.node_id                     = "DocumentRef-kernel:SPDXRef-linux";
  node.name                        = "kernel";
  node.external_document_reference = "DocumentRef-kernel";
  node.external_node_id            = "SPDXRef-linux";
  return node;
}

bool Match(const std::string& text, const model::Node& node) {
  return FilterExpression::Parse(text).Matches(node);
}

bool Rejects(const std::string& text) {
  try {
    (void)FilterExpression::Parse(text);
  } catch (const util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestEqualityAndAlternatives() {
  const auto node = OpenSsl();
  assert(Match("name=OpenSSL", node));
  assert(!Match("name=openssl", node));
  assert(Match("name=zlib|OpenSSL", node));
  assert(Match("name=OpenSSL&version=3.0.10", node));
  assert(!Match("name=OpenSSL&version=3.0.9", node));
  assert(Match("name!=zlib", node));
  assert(!Match("name!=zlib|OpenSSL", node));
}

void TestContainsIsCaseInsensitive() {
  const auto node = OpenSsl();
  assert(Match("name~openss", node));
  assert(Match("purl~PKG:DEB", node));
  assert(Match("name!~zlib", node));
  assert(!Match("name!~SSL", node));
}

void TestOrderingIsVersionAware() {
  const auto node = OpenSsl();
  assert(Match("version>3.0.9", node));
  assert(Match("version>=3.0.10", node));
  assert(Match("version<3.0.10a", node));
  assert(Match("version<=3.0.10", node));
  assert(!Match("version<3.0.2", node));

  assert(query::NaturalCompare("1.10", "1.9") > 0);
  assert(query::NaturalCompare("2.007", "2.7") == 0);
  assert(query::NaturalCompare("abc", "abd") < 0);
  assert(query::NaturalCompare("1.0", "1.0.1") < 0);
}

void TestMultiValuedFields() {
  const auto node = OpenSsl();
  assert(Match("purl=pkg:deb/debian/libssl3@3.0.10", node));
  assert(!Match("purl!=pkg:deb/debian/libssl3@3.0.10", node));
  assert(Match("purl!=pkg:npm/left-pad@1.0.0", node));
  assert(Match("cpe~openssl:3.0.10", node));
}

void TestAbsentAndUnknownFieldsNeverMatch() {
  const auto root = DocumentRoot();
  assert(!Match("version=1.0", root));
  assert(!Match("version!=1.0", root));
  assert(!Match("purl!~pkg:", root));

  const auto node = OpenSsl();
  assert(!Match("license=MIT", node));
  assert(!Match("license!=MIT", node));
  assert(!Match("external_node_id!=x", node));

  const auto ext = ExternalRef();
  assert(Match("external_document_reference=DocumentRef-kernel", ext));
  assert(Match("external_node_id~linux", ext));
  assert(!Match("version>0", ext));
}

void TestFullTextTerms() {
  assert(Match("firmware", DocumentRoot()));
  assert(Match("LIBSSL3", OpenSsl()));
  assert(Match("zlib|libssl", OpenSsl()));
  assert(!Match("zlib", OpenSsl()));
  assert(Match("kernel&name=kernel", ExternalRef()));
}

void TestEscapes() {
  model::UnknownNode node;
  node.sbom_id = "s";
  node.node_id = "n";
  node.name    = "a&b=c|d";

  assert(Match("name=a\\&b\\=c\\|d", node));
  assert(Match("a\\&b", node));

  const auto expr = FilterExpression::Parse("na\\~me=x");
  assert(expr.Conditions().size() == 1);
  assert(expr.Conditions().front().field == query::Field::kUnknown);
}

void TestEmptyExpressionMatchesEverything() {
  const auto expr = FilterExpression::Parse("");
  assert(expr.Conditions().empty());
  assert(expr.Matches(OpenSsl()));
  assert(expr.Matches(DocumentRoot()));
}

void TestMalformedExpressionsAreRejected() {
  assert(Rejects("name=a&"));
  assert(Rejects("&name=a"));
  assert(Rejects("name=a&&version=1"));
  assert(Rejects("=openssl"));
  assert(Rejects("name!openssl"));
  assert(Rejects("name=openssl\\"));
}

} // namespace

int main() {
  TestEqualityAndAlternatives();
  TestContainsIsCaseInsensitive();
  TestOrderingIsVersionAware();
  TestMultiValuedFields();
  TestAbsentAndUnknownFieldsNeverMatch();
  TestFullTextTerms();
  TestEscapes();
  TestEmptyExpressionMatchesEverything();
  TestMalformedExpressionsAreRejected();

  std::cout << "sbomgraph_unit_filter_expression: pass\n";
  return 0;
}
