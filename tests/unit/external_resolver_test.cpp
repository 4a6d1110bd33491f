#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/resolve/external_resolver.hpp"
#include "support/sbom_fixtures.hpp"

namespace {

using namespace sbomgraph;
using db::model::DiscriminatorType;
using db::model::ExternalType;

const std::string kTargetSha256 = "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";

void Seed(db::Repository& repo) {
  test::SbomWriter w(repo);

  // targets
  w.Sbom("spdx-target", "https://example.org/spdx/target", kTargetSha256)
      .Package("spdx-target", "SPDXRef-root", "target", "1.0");
  w.Sbom("cdx-target", "urn:cdx:3e671687-395b-41f5-a30f-a58921a69b79/2")
      .Package("cdx-target", "cdx-root", "cdx target", "2.0");
  w.Sbom("product-b", "https://example.org/spdx/product-b")
      .Package("product-b", "real-x", "x", "1.1")
      .Checksum("product-b", "real-x", "sha256", "abc")
      .Package("product-b", "real-y", "y", "9.9.9")
      .Package("product-b", "real-z", "z", "4.2");

  // references
  w.Sbom("source", "https://example.org/spdx/source")
      .External("source", "spdx-sha256", ExternalType::kSpdx, "DocumentRef-target", "SPDXRef-root",
                DiscriminatorType::kSha256, kTargetSha256)
      .External("source", "spdx-md5", ExternalType::kSpdx, "DocumentRef-target", "SPDXRef-root", DiscriminatorType::kMd5,
                kTargetSha256)
      .External("source", "spdx-empty", ExternalType::kSpdx, "DocumentRef-target", "SPDXRef-root",
                DiscriminatorType::kSha256, std::string())
      .External("source", "spdx-unknown", ExternalType::kSpdx, "DocumentRef-other", "SPDXRef-root",
                DiscriminatorType::kSha256, std::string("0000"))
      .External("source", "cdx", ExternalType::kCycloneDx, "3e671687-395b-41f5-a30f-a58921a69b79", "cdx-root",
                std::nullopt, std::string("2"))
      .External("source", "cdx-wrong-version", ExternalType::kCycloneDx, "3e671687-395b-41f5-a30f-a58921a69b79",
                "cdx-root", std::nullopt, std::string("3"))
      .External("source", "cdx-empty", ExternalType::kCycloneDx, "3e671687-395b-41f5-a30f-a58921a69b79", "cdx-root",
                std::nullopt, std::nullopt)
      .Package("source", "variant-x", "x", "1.0")
      .Checksum("source", "variant-x", "sha256", "abc")
      .External("source", "pc-checksum", ExternalType::kProductComponent, "", "variant-x")
      .Package("source", "variant-y", "y", "9.9.9")
      .External("source", "pc-version", ExternalType::kProductComponent, "", "variant-y")
      .Package("source", "variant-z", "z", "4.2")
      .Checksum("source", "variant-z", "sha256", "unshared")
      .External("source", "pc-no-match", ExternalType::kProductComponent, "", "variant-z");
  w.Commit();
}

std::optional<model::ResolvedSbom> Resolve(db::Repository& repo, const std::string& node_id) {
  auto tx = repo.BeginRead();
  return resolve::ResolveExternalSbom(repo, *tx, node_id);
}

void TestSpdxResolvesBySha256Only() {
  db::memory::MemoryRepository repo;
  Seed(repo);

  assert((Resolve(repo, "spdx-sha256") == model::ResolvedSbom{"spdx-target", "SPDXRef-root"}));
  assert(!Resolve(repo, "spdx-md5").has_value());
  assert(!Resolve(repo, "spdx-empty").has_value());
  assert(!Resolve(repo, "spdx-unknown").has_value());
}

void TestCycloneDxResolvesBySerialAndVersion() {
  db::memory::MemoryRepository repo;
  Seed(repo);

  assert((Resolve(repo, "cdx") == model::ResolvedSbom{"cdx-target", "cdx-root"}));
  assert(!Resolve(repo, "cdx-wrong-version").has_value());
  assert(!Resolve(repo, "cdx-empty").has_value());
}

void TestProductComponentHeuristics() {
  db::memory::MemoryRepository repo;
  Seed(repo);

  assert((Resolve(repo, "pc-checksum") == model::ResolvedSbom{"product-b", "real-x"}));
  assert((Resolve(repo, "pc-version") == model::ResolvedSbom{"product-b", "real-y"}));

  // a checksum row without a match never falls back to the version
  assert(!Resolve(repo, "pc-no-match").has_value());
}

void TestNonExternalNodesDoNotResolve() {
  db::memory::MemoryRepository repo;
  Seed(repo);

  assert(!Resolve(repo, "variant-x").has_value());
  assert(!Resolve(repo, "does-not-exist").has_value());
}

} // namespace

int main() {
  TestSpdxResolvesBySha256Only();
  TestCycloneDxResolvesBySerialAndVersion();
  TestProductComponentHeuristics();
  TestNonExternalNodesDoNotResolve();

  std::cout << "sbomgraph_unit_external_resolver: pass\n";
  return 0;
}
