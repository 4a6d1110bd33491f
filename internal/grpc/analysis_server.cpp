#include "analysis_server.hpp"

#include "grpc_error.hpp"

namespace sbomgraph::grpc {

using namespace sbomgraph::analysis::v1;

AnalysisServer::AnalysisServer(std::shared_ptr<sbomgraph::service::GraphService> svc) : service_(std::move(svc)) {
}

::grpc::Status AnalysisServer::Retrieve(::grpc::ServerContext*, const RetrieveRequest* req, RetrieveResponse* resp) {
  try {
    *resp = service_->Retrieve(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalysisServer::RetrieveSingle(::grpc::ServerContext*, const RetrieveSingleRequest* req, RetrieveResponse* resp) {
  try {
    *resp = service_->RetrieveSingle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalysisServer::Status(::grpc::ServerContext*, const StatusRequest* req, StatusResponse* resp) {
  try {
    *resp = service_->Status(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalysisServer::ClearAllGraphs(::grpc::ServerContext*, const ClearAllGraphsRequest* req, ClearAllGraphsResponse*) {
  try {
    service_->ClearAllGraphs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalysisServer::RenderGraph(::grpc::ServerContext*, const RenderGraphRequest* req, RenderGraphResponse* resp) {
  try {
    *resp = service_->RenderGraph(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sbomgraph::grpc
