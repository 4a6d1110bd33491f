#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/analysis/analysis_service.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/log_capture.hpp"
#include "support/sbom_fixtures.hpp"

namespace {

using namespace sbomgraph;
using analysis::AnalysisService;
using analysis::QueryOptions;
using db::model::DiscriminatorType;
using db::model::ExternalType;

AnalysisService MakeService(std::shared_ptr<db::Repository> repo) {
  analysis::AnalysisConfig config;
  config.concurrency = 4;
  return AnalysisService(std::move(repo), config);
}

query::GraphQuery ByName(const std::string& name) {
  return query::ComponentReference{query::ComponentName{name}};
}

QueryOptions Depths(std::uint64_t ancestors, std::uint64_t descendants) {
  QueryOptions options;
  options.ancestors   = ancestors;
  options.descendants = descendants;
  return options;
}

std::vector<std::string> NodeIds(const std::vector<model::AnalysisNode>& nodes) {
  std::vector<std::string> ids;
  for (const auto& node : nodes) ids.push_back(node.base.node_id);
  return ids;
}

/*
  Forwards to a MemoryRepository; graph loading fails while `fail` is set.
*/
class FlakyRepository final : public db::Repository {
 public:
  bool fail = false;

  db::memory::MemoryRepository& Inner() {
    return inner_;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_.Begin();
  }
  std::unique_ptr<db::Transaction> BeginRead() override {
    return inner_.BeginRead();
  }

  db::Result InsertSourceDocument(db::Transaction& tx, const db::model::SourceDocumentRecord& r) override {
    return inner_.InsertSourceDocument(tx, r);
  }
  db::Result InsertSbom(db::Transaction& tx, const db::model::SbomRecord& r) override {
    return inner_.InsertSbom(tx, r);
  }
  db::Result InsertNode(db::Transaction& tx, const db::model::NodeRecord& r) override {
    return inner_.InsertNode(tx, r);
  }
  db::Result InsertPackage(db::Transaction& tx, const db::model::PackageRecord& r) override {
    return inner_.InsertPackage(tx, r);
  }
  db::Result InsertPurlRef(db::Transaction& tx, const db::model::PurlRefRecord& r) override {
    return inner_.InsertPurlRef(tx, r);
  }
  db::Result InsertCpeRef(db::Transaction& tx, const db::model::CpeRefRecord& r) override {
    return inner_.InsertCpeRef(tx, r);
  }
  db::Result InsertExternalNode(db::Transaction& tx, const db::model::ExternalNodeRecord& r) override {
    return inner_.InsertExternalNode(tx, r);
  }
  db::Result InsertChecksum(db::Transaction& tx, const db::model::ChecksumRecord& r) override {
    return inner_.InsertChecksum(tx, r);
  }
  db::Result InsertRelationship(db::Transaction& tx, const db::model::RelationshipRecord& r) override {
    return inner_.InsertRelationship(tx, r);
  }

  std::vector<std::string> ListSbomIds(db::Transaction& tx) override {
    return inner_.ListSbomIds(tx);
  }
  std::optional<db::model::GraphRows> FetchGraphRows(db::Transaction& tx, const std::string& sbom_id) override {
    if (fail) throw util::DataAccessError("connection lost while loading " + sbom_id);
    return inner_.FetchGraphRows(tx, sbom_id);
  }

  std::vector<std::string> FindSbomsByNodeId(db::Transaction& tx, const std::string& v) override {
    return inner_.FindSbomsByNodeId(tx, v);
  }
  std::vector<std::string> FindSbomsByName(db::Transaction& tx, const std::string& v) override {
    return inner_.FindSbomsByName(tx, v);
  }
  std::vector<std::string> FindSbomsByPurl(db::Transaction& tx, const std::string& v) override {
    return inner_.FindSbomsByPurl(tx, v);
  }
  std::vector<std::string> FindSbomsByCpe(db::Transaction& tx, const std::string& v) override {
    return inner_.FindSbomsByCpe(tx, v);
  }

  std::optional<db::model::ExternalNodeRecord> FindExternalNode(db::Transaction& tx, const std::string& v) override {
    return inner_.FindExternalNode(tx, v);
  }
  std::optional<std::string> FindSbomBySourceSha256(db::Transaction& tx, const std::string& v) override {
    return inner_.FindSbomBySourceSha256(tx, v);
  }
  std::optional<std::string> FindSbomByDocumentId(db::Transaction& tx, const std::string& v) override {
    return inner_.FindSbomByDocumentId(tx, v);
  }
  std::optional<db::model::ChecksumRecord> FindChecksumByNode(db::Transaction& tx, const std::string& v) override {
    return inner_.FindChecksumByNode(tx, v);
  }
  std::optional<db::model::ChecksumRecord> FindChecksumMatch(db::Transaction& tx, const std::string& v, const std::string& e) override {
    return inner_.FindChecksumMatch(tx, v, e);
  }
  std::optional<db::model::PackageRecord> FindPackageByNode(db::Transaction& tx, const std::string& v) override {
    return inner_.FindPackageByNode(tx, v);
  }
  std::optional<db::model::PackageRecord> FindPackageByVersion(db::Transaction& tx, const std::string& v, const std::string& e) override {
    return inner_.FindPackageByVersion(tx, v, e);
  }

 private:
  db::memory::MemoryRepository inner_;
};

void TestDirectDependencyAtDepthOne() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  test::SbomWriter w(*repo);
  w.Sbom("A", "https://example.org/spdx/A")
      .Package("A", "P1", "P1", "1.0")
      .Package("A", "P2", "P2", "2.0")
      .Relate("A", "P1", "depends_on", "P2");
  w.Commit();

  auto service = MakeService(repo);

  auto p2 = service.Retrieve(ByName("P2"), Depths(1, 0), {});
  assert(p2.total == 1);
  assert(p2.items.front().ancestors.has_value());
  assert(NodeIds(*p2.items.front().ancestors) == std::vector<std::string>{"P1"});
  assert(!p2.items.front().descendants.has_value());

  auto p1 = service.Retrieve(ByName("P1"), Depths(0, 1), {});
  assert(p1.total == 1);
  assert(p1.items.front().descendants.has_value());
  assert(NodeIds(*p1.items.front().descendants) == std::vector<std::string>{"P2"});
  assert(p1.items.front().descendants->front().relationship == model::Relationship::kDependsOn);
  assert(!p1.items.front().ancestors.has_value());
}

void TestCycloneDxReferenceReachedAtDepthTwo() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  test::SeedCycloneDxPair(*repo);
  auto service = MakeService(repo);

  auto result = service.Retrieve(ByName("lib"), Depths(0, 2), {});
  assert(result.total == 1);

  const auto& lib = result.items.front();
  assert(lib.base.sbom_id == "sbom-a");
  assert(lib.descendants && NodeIds(*lib.descendants) == std::vector<std::string>{"ext-b"});

  const auto& ext = lib.descendants->front();
  assert(ext.descendants && ext.descendants->size() == 1);
  assert(ext.descendants->front().base.sbom_id == "sbom-b");
  assert(ext.descendants->front().base.node_id == "core");
  assert(!ext.descendants->front().descendants.has_value());
}

void TestPurlMatchAndZeroMatch() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  test::SbomWriter w(*repo);
  w.Sbom("npm", "urn:cdx:npm/1")
      .Package("npm", "foo", "foo", "1.0.0", {"pkg:npm/foo@1.0.0"})
      .Package("npm", "bar", "bar", "2.0.0", {"pkg:npm/bar@2.0.0"});
  w.Commit();
  auto service = MakeService(repo);

  auto hit = service.Retrieve(query::ParseComponentReference("pkg:npm/foo@1.0.0"), {}, {});
  assert(hit.total == 1);
  assert(hit.items.size() == 1);
  assert(hit.items.front().base.node_id == "foo");
  assert(hit.items.front().base.purl == std::vector<std::string>{"pkg:npm/foo@1.0.0"});

  auto miss = service.Retrieve(query::ParseComponentReference("pkg:npm/foo@9.9.9"), {}, {});
  assert(miss.total == 0);
  assert(miss.items.empty());
}

void TestNonCanonicalStoredIdentifiersAreInScope() {
  const std::string stored_purl = "pkg:RPM/redhat/openssl@3.0.7?repository_id=rhel&arch=x86_64";
  const std::string stored_cpe  = "cpe:2.3:a:OpenSSL:OpenSSL:3.0.7:*:*:*:*:*:*:*";

  auto repo = std::make_shared<db::memory::MemoryRepository>();
  test::SbomWriter w(*repo);
  w.Sbom("a", "urn:cdx:a/1").Package("a", "p1", "openssl", "3.0.7", {stored_purl}, {stored_cpe});
  w.Commit();
  auto service = MakeService(repo);

  const auto by_purl = query::ParseComponentReference(stored_purl);
  auto single        = service.RetrieveSingle("a", by_purl, {}, {});
  auto scoped        = service.Retrieve(by_purl, {}, {});
  assert(single.total == 1);
  assert(scoped.total == 1);
  assert(scoped.items.front().base.node_id == "p1");

  auto canonical = service.Retrieve(
      query::ParseComponentReference("pkg:rpm/redhat/openssl@3.0.7?arch=x86_64&repository_id=rhel"), {}, {});
  assert(canonical.total == 1);

  auto by_cpe = service.Retrieve(query::ParseComponentReference(stored_cpe), {}, {});
  assert(by_cpe.total == 1);
  auto lower =
      service.Retrieve(query::ParseComponentReference("cpe:2.3:a:openssl:openssl:3.0.7:*:*:*:*:*:*:*"), {}, {});
  assert(lower.total == 1);
}

void TestCyclicGraphsContributeNothing() {
  test::LogCapture capture;

  auto repo = std::make_shared<db::memory::MemoryRepository>();
  test::SbomWriter w(*repo);
  w.Sbom("cyclic", "urn:cdx:cyclic/1")
      .Package("cyclic", "a", "shared", "1")
      .Package("cyclic", "b", "b", "1")
      .Relate("cyclic", "a", "depends_on", "b")
      .Relate("cyclic", "b", "depends_on", "a");
  w.Sbom("clean", "urn:cdx:clean/1").Package("clean", "s", "shared", "1");
  w.Commit();
  auto service = MakeService(repo);

  auto result = service.Retrieve(ByName("shared"), {}, {});
  assert(result.total == 1);
  assert(result.items.front().base.sbom_id == "clean");
  assert(capture.Count(spdlog::level::warn, {"cyclic", "circular", "b -> a"}) >= 1);
  assert(capture.Count(spdlog::level::warn, {"clean", "circular"}) == 0);

  auto everything = service.Retrieve(query::FilterExpression::Parse(""), {}, {});
  assert(everything.total == 1);
}

void TestMutualReferencesDoNotRepeat() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  test::SbomWriter w(*repo);
  w.Sbom("sbom-x", "urn:cdx:x/1")
      .Package("sbom-x", "x1", "x1", "1")
      .External("sbom-x", "to-y", ExternalType::kCycloneDx, "y", "y1", std::nullopt, std::string("1"))
      .Relate("sbom-x", "x1", "depends_on", "to-y");
  w.Sbom("sbom-y", "urn:cdx:y/1")
      .Package("sbom-y", "y1", "y1", "1")
      .External("sbom-y", "to-x", ExternalType::kCycloneDx, "x", "x1", std::nullopt, std::string("1"))
      .Relate("sbom-y", "y1", "depends_on", "to-x");
  w.Commit();
  auto service = MakeService(repo);

  auto result = service.Retrieve(ByName("x1"), Depths(0, analysis::kUnlimitedDepth), {});
  assert(result.total == 1);

  // x1 -> to-y -> y1 -> to-x -> x1 (leaf)
  const model::AnalysisNode* node  = &result.items.front();
  std::size_t                depth = 0;
  while (node->descendants && !node->descendants->empty()) {
    assert(node->descendants->size() == 1);
    node = &node->descendants->front();
    ++depth;
  }
  assert(depth == 4);
  assert(node->base.node_id == "x1");
  assert(!node->descendants.has_value());
}

void TestSpdxDiscriminatorsThatCannotResolve() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  test::SbomWriter w(*repo);
  w.Sbom("target", "https://example.org/spdx/target", "abc123").Package("target", "root", "root", "1");
  w.Sbom("origin", "https://example.org/spdx/origin")
      .Package("origin", "app", "app", "1")
      .External("origin", "md5-ref", ExternalType::kSpdx, "DocumentRef-t", "root", DiscriminatorType::kMd5, std::string("abc123"))
      .External("origin", "empty-ref", ExternalType::kSpdx, "DocumentRef-t", "root", DiscriminatorType::kSha256, std::string())
      .External("origin", "good-ref", ExternalType::kSpdx, "DocumentRef-t", "root", DiscriminatorType::kSha256, std::string("abc123"))
      .Relate("origin", "app", "depends_on", "md5-ref")
      .Relate("origin", "app", "depends_on", "empty-ref")
      .Relate("origin", "app", "depends_on", "good-ref");
  w.Commit();
  auto service = MakeService(repo);

  auto result = service.Retrieve(ByName("app"), Depths(0, analysis::kUnlimitedDepth), {});
  assert(result.total == 1);

  const auto& children = *result.items.front().descendants;
  assert(children.size() == 3);
  for (const auto& child : children) {
    if (child.base.node_id == "good-ref") {
      assert(child.descendants && child.descendants->front().base.sbom_id == "target");
    } else {
      assert(!child.descendants.has_value());
    }
  }
}

void TestRelationshipFilterAndPagination() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  test::SbomWriter w(*repo);
  w.Sbom("s", "urn:cdx:s/1").Package("s", "root", "root", "1");
  for (int i = 0; i < 5; ++i) {
    const auto id = "dep-" + std::to_string(i);
    w.Package("s", id, id, "1." + std::to_string(i)).Relate("s", "root", i % 2 == 0 ? "depends_on" : "dev_depends_on", id);
  }
  w.Commit();
  auto service = MakeService(repo);

  auto options          = Depths(0, 1);
  options.relationships = {model::Relationship::kDevDependsOn};
  auto filtered         = service.Retrieve(ByName("root"), options, {});
  assert(NodeIds(*filtered.items.front().descendants) == (std::vector<std::string>{"dep-1", "dep-3"}));

  auto page = service.Retrieve(query::FilterExpression::Parse("name~dep"), Depths(0, 0), model::Paginated{1, 2});
  assert(page.total == 5);
  assert(page.items.size() == 2);

  auto tail = service.Retrieve(query::FilterExpression::Parse("version>=1.2"), Depths(0, 0), model::Paginated{2, 0});
  assert(tail.total == 3);
  assert(tail.items.size() == 1);
}

void TestRetrieveSingleIsScopedToOneSbom() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  test::SeedCycloneDxPair(*repo);
  auto service = MakeService(repo);

  auto everything = query::FilterExpression::Parse("");
  auto in_b       = service.RetrieveSingle("sbom-b", everything, Depths(0, 0), {});
  assert(in_b.total == 2);
  for (const auto& node : in_b.items) assert(node.base.sbom_id == "sbom-b");

  auto unknown = service.RetrieveSingle("missing", everything, {}, {});
  assert(unknown.total == 0);
  assert(unknown.items.empty());
}

void TestCacheStatusAndRendering() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  test::SeedCycloneDxPair(*repo);
  auto service = MakeService(repo);

  assert(service.Status().sbom_count == 2);
  assert(service.Status().graph_count == 0);

  assert(service.LoadAllGraphs() == 2);
  assert(service.CacheLen() == 2);
  assert(service.CacheSizeUsed() > 0);
  assert(service.Status().graph_count == 2);

  // copies share the cache
  auto copy = service;
  copy.ClearAllGraphs();
  assert(service.CacheLen() == 0);
  assert(service.CacheSizeUsed() == 0);

  const auto dot = service.RenderGraph("sbom-b");
  assert(dot.find("digraph \"sbom-b\"") != std::string::npos);
  assert(dot.find("contains") != std::string::npos);

  bool threw = false;
  try {
    (void)service.RenderGraph("missing");
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestDataAccessFailuresAbortTheRequest() {
  auto repo = std::make_shared<FlakyRepository>();
  test::SeedCycloneDxPair(repo->Inner());
  auto service = MakeService(repo);

  repo->fail = true;
  bool threw = false;
  try {
    (void)service.Retrieve(ByName("lib"), {}, {});
  } catch (const util::DataAccessError&) {
    threw = true;
  }
  assert(threw);
  assert(service.CacheLen() == 0);

  repo->fail = false;
  auto result = service.Retrieve(ByName("lib"), {}, {});
  assert(result.total == 1);
  assert(service.CacheLen() == 2);
}

} // namespace

int main() {
  TestDirectDependencyAtDepthOne();
  TestCycloneDxReferenceReachedAtDepthTwo();
  TestPurlMatchAndZeroMatch();
  TestNonCanonicalStoredIdentifiersAreInScope();
  TestCyclicGraphsContributeNothing();
  TestMutualReferencesDoNotRepeat();
  TestSpdxDiscriminatorsThatCannotResolve();
  TestRelationshipFilterAndPagination();
  TestRetrieveSingleIsScopedToOneSbom();
  TestCacheStatusAndRendering();
  TestDataAccessFailuresAbortTheRequest();

  std::cout << "sbomgraph_unit_analysis_service: pass\n";
  return 0;
}
