#pragma once

#include "sbomgraph/analysis/v1/analysis.pb.h"
#include "service_context.hpp"

namespace sbomgraph::service {

/*
  Protobuf-facing front of the analysis engine.

  Converts requests into queries, runs them and records a span, a
  request counter and a latency sample per call. Exceptions are logged
  and rethrown for the transport to translate.
*/
class GraphService {
public:
  explicit GraphService(ServiceContext ctx);

  sbomgraph::analysis::v1::RetrieveResponse
  Retrieve(const sbomgraph::analysis::v1::RetrieveRequest& req);

  sbomgraph::analysis::v1::RetrieveResponse
  RetrieveSingle(const sbomgraph::analysis::v1::RetrieveSingleRequest& req);

  sbomgraph::analysis::v1::StatusResponse
  Status(const sbomgraph::analysis::v1::StatusRequest& req);

  void ClearAllGraphs(const sbomgraph::analysis::v1::ClearAllGraphsRequest& req);

  sbomgraph::analysis::v1::RenderGraphResponse
  RenderGraph(const sbomgraph::analysis::v1::RenderGraphRequest& req);

private:
  ServiceContext ctx_;
};

}
