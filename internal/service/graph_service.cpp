#include "graph_service.hpp"

#include <chrono>
#include <type_traits>

#include "internal/analysis/analysis_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "proto_convert.hpp"

namespace sbomgraph::service {

using namespace sbomgraph::analysis::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

// Span, request metrics and an error log around one call; errors are rethrown.
template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* sbom_id, Fn&& fn) {
  sbomgraph::observability::SpanScope span(route);
  if (sbom_id) {
    span.SetAttribute("sbom.id", *sbom_id);
  }

  auto& metrics    = sbomgraph::observability::Metrics::Instance();
  const auto start = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      metrics.ObserveRequest(route, true, ElapsedMs(start));
    } else {
      auto result = fn();
      metrics.ObserveRequest(route, true, ElapsedMs(start));
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SBOMGRAPH_LOG_ERROR("RPC failed", {sbomgraph::observability::StringField("route", route),
                                       sbomgraph::observability::StringField("error", ex.what()),
                                       sbomgraph::observability::StringField("sbom_id", sbom_id ? *sbom_id : "")});
    metrics.ObserveRequest(route, false, ElapsedMs(start));
    throw;
  }
}

RetrieveResponse ToResponse(const sbomgraph::analysis::AnalysisService::Results& results) {
  RetrieveResponse resp;
  for (const auto& node : results.items) {
    ToProto(node, resp.add_items());
  }
  resp.set_total(results.total);
  return resp;
}

} // namespace

GraphService::GraphService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RetrieveResponse GraphService::Retrieve(const RetrieveRequest& req) {
  return ObserveRpc("GraphService.Retrieve", nullptr, [&] {
    const auto query   = ToGraphQuery(req);
    const auto options = ToQueryOptions(req);
    return ToResponse(ctx_.analysis->Retrieve(query, options, ToPage(req)));
  });
}

RetrieveResponse GraphService::RetrieveSingle(const RetrieveSingleRequest& req) {
  return ObserveRpc("GraphService.RetrieveSingle", &req.sbom_id(), [&] {
    if (req.sbom_id().empty()) {
      throw sbomgraph::util::InvalidArgument("retrieve single: sbom_id is required");
    }
    const auto query   = ToGraphQuery(req.request());
    const auto options = ToQueryOptions(req.request());
    return ToResponse(ctx_.analysis->RetrieveSingle(req.sbom_id(), query, options, ToPage(req.request())));
  });
}

StatusResponse GraphService::Status(const StatusRequest&) {
  return ObserveRpc("GraphService.Status", nullptr, [&] {
    const auto status = ctx_.analysis->Status();

    StatusResponse resp;
    resp.set_sbom_count(status.sbom_count);
    resp.set_graph_count(status.graph_count);
    resp.set_cache_size_used(ctx_.analysis->CacheSizeUsed());
    resp.set_cache_len(ctx_.analysis->CacheLen());
    return resp;
  });
}

void GraphService::ClearAllGraphs(const ClearAllGraphsRequest&) {
  ObserveRpc("GraphService.ClearAllGraphs", nullptr, [&] { ctx_.analysis->ClearAllGraphs(); });
}

RenderGraphResponse GraphService::RenderGraph(const RenderGraphRequest& req) {
  return ObserveRpc("GraphService.RenderGraph", &req.sbom_id(), [&] {
    RenderGraphResponse resp;
    resp.set_dot(ctx_.analysis->RenderGraph(req.sbom_id()));
    return resp;
  });
}

}
