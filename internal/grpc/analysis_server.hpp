#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "sbomgraph/analysis/v1/analysis.grpc.pb.h"
#include "internal/service/graph_service.hpp"

namespace sbomgraph::grpc {

class AnalysisServer final : public sbomgraph::analysis::v1::AnalysisService::Service {
public:
  explicit AnalysisServer(std::shared_ptr<sbomgraph::service::GraphService> svc);

  ::grpc::Status Retrieve(::grpc::ServerContext*,
                          const sbomgraph::analysis::v1::RetrieveRequest*,
                          sbomgraph::analysis::v1::RetrieveResponse*) override;

  ::grpc::Status RetrieveSingle(::grpc::ServerContext*,
                                const sbomgraph::analysis::v1::RetrieveSingleRequest*,
                                sbomgraph::analysis::v1::RetrieveResponse*) override;

  ::grpc::Status Status(::grpc::ServerContext*,
                        const sbomgraph::analysis::v1::StatusRequest*,
                        sbomgraph::analysis::v1::StatusResponse*) override;

  ::grpc::Status ClearAllGraphs(::grpc::ServerContext*,
                                const sbomgraph::analysis::v1::ClearAllGraphsRequest*,
                                sbomgraph::analysis::v1::ClearAllGraphsResponse*) override;

  ::grpc::Status RenderGraph(::grpc::ServerContext*,
                             const sbomgraph::analysis::v1::RenderGraphRequest*,
                             sbomgraph::analysis::v1::RenderGraphResponse*) override;

private:
  std::shared_ptr<sbomgraph::service::GraphService> service_;
};

}
