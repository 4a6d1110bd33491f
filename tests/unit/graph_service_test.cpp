#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/analysis/analysis_service.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/service/graph_service.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"
#include "support/sbom_fixtures.hpp"

namespace {

using namespace sbomgraph::analysis::v1;

sbomgraph::service::GraphService MakeService() {
  auto repo = std::make_shared<sbomgraph::db::memory::MemoryRepository>();
  sbomgraph::test::SeedCycloneDxPair(*repo);

  sbomgraph::service::ServiceContext ctx;
  ctx.analysis = std::make_shared<sbomgraph::analysis::AnalysisService>(repo, sbomgraph::analysis::AnalysisConfig{});
  return sbomgraph::service::GraphService(ctx);
}

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const sbomgraph::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestRequestConversion() {
  RetrieveRequest req;
  assert(ThrowsInvalidArgument([&] { (void)sbomgraph::service::ToGraphQuery(req); }));

  req.set_node_id("lib");
  auto by_id = sbomgraph::service::ToGraphQuery(req);
  assert(sbomgraph::query::Describe(by_id) == "id:lib");

  req.set_component("pkg:npm/lib@2.1.0");
  assert(sbomgraph::query::Describe(sbomgraph::service::ToGraphQuery(req)) == "purl:pkg:npm/lib@2.1.0");

  req.set_q("name=lib&");
  assert(ThrowsInvalidArgument([&] { (void)sbomgraph::service::ToGraphQuery(req); }));

  auto options = sbomgraph::service::ToQueryOptions(req);
  assert(options.ancestors == sbomgraph::analysis::kUnlimitedDepth);
  assert(options.descendants == sbomgraph::analysis::kUnlimitedDepth);
  assert(options.relationships.empty());

  req.set_ancestors(0);
  req.set_descendants(3);
  req.add_relationships("depends_on");
  options = sbomgraph::service::ToQueryOptions(req);
  assert(options.ancestors == 0);
  assert(options.descendants == 3);
  assert(options.relationships.size() == 1);

  req.add_relationships("requires");
  assert(ThrowsInvalidArgument([&] { (void)sbomgraph::service::ToQueryOptions(req); }));
}

void TestRetrieveBuildsNestedNodes() {
  auto service = MakeService();

  RetrieveRequest req;
  req.set_component("app");
  req.set_ancestors(0);
  req.set_descendants(2);

  const auto resp = service.Retrieve(req);
  assert(resp.total() == 1);
  assert(resp.items_size() == 1);

  const auto& app = resp.items(0);
  assert(app.sbom_id() == "sbom-a");
  assert(app.version() == "1.0.0");
  assert(app.purl_size() == 1 && app.purl(0) == "pkg:npm/app@1.0.0");
  assert(app.document_id() == "urn:cdx:serial-a/1");
  assert(!app.has_relationship());
  assert(!app.has_ancestors());
  assert(app.has_descendants());

  const auto& lib = app.descendants().items(0);
  assert(lib.node_id() == "lib");
  assert(lib.relationship() == "depends_on");
  assert(lib.has_descendants() && lib.descendants().items_size() == 1);

  // depth exhausted below ext-b
  const auto& ext = lib.descendants().items(0);
  assert(ext.node_id() == "ext-b");
  assert(!ext.has_descendants());
}

void TestRetrieveSingleAndPaging() {
  auto service = MakeService();

  RetrieveSingleRequest req;
  req.set_sbom_id("sbom-b");
  req.mutable_request()->set_q("version>=3");
  req.mutable_request()->set_ancestors(0);
  req.mutable_request()->set_descendants(0);
  req.mutable_request()->set_limit(1);

  const auto resp = service.RetrieveSingle(req);
  assert(resp.total() == 2);
  assert(resp.items_size() == 1);
  assert(resp.items(0).sbom_id() == "sbom-b");

  RetrieveSingleRequest missing_id;
  missing_id.mutable_request()->set_q("");
  assert(ThrowsInvalidArgument([&] { (void)service.RetrieveSingle(missing_id); }));
}

void TestStatusClearAndRender() {
  auto service = MakeService();

  RetrieveRequest req;
  req.set_node_id("core");
  (void)service.Retrieve(req);

  auto status = service.Status(StatusRequest{});
  assert(status.sbom_count() == 2);
  assert(status.graph_count() == 1);
  assert(status.cache_len() == 1);
  assert(status.cache_size_used() > 0);

  service.ClearAllGraphs(ClearAllGraphsRequest{});
  status = service.Status(StatusRequest{});
  assert(status.cache_len() == 0);
  assert(status.cache_size_used() == 0);

  RenderGraphRequest render;
  render.set_sbom_id("sbom-a");
  assert(service.RenderGraph(render).dot().find("depends_on") != std::string::npos);

  render.set_sbom_id("missing");
  bool threw = false;
  try {
    (void)service.RenderGraph(render);
  } catch (const sbomgraph::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestFactoryBuildsMemoryBackend() {
  sbomgraph::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_analysis()->set_max_cache_size("1MiB");
  config.mutable_analysis()->set_concurrency(2);
  config.mutable_analysis()->set_preload(true);

  auto app = sbomgraph::factory::Build(config);
  assert(app.repository != nullptr);
  assert(app.analysis != nullptr);
  assert(app.graph_service != nullptr);
  assert(app.analysis->Cache()->MaxSize() == 1024 * 1024);

  const auto status = app.graph_service->Status(StatusRequest{});
  assert(status.sbom_count() == 0);
}

} // namespace

int main() {
  TestRequestConversion();
  TestRetrieveBuildsNestedNodes();
  TestRetrieveSingleAndPaging();
  TestStatusClearAndRender();
  TestFactoryBuildsMemoryBackend();

  std::cout << "sbomgraph_unit_graph_service: pass\n";
  return 0;
}
