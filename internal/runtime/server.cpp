#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace sbomgraph::runtime {

Server::Server(const sbomgraph::runtime::config::ServerConfig& config, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(config.bind_address()),
      shutdown_grace_(config.shutdown_grace_ms()),
      max_message_bytes_(static_cast<int>(config.max_message_bytes())),
      services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &port_);
  if (max_message_bytes_ > 0) {
    builder.SetMaxReceiveMessageSize(max_message_bytes_);
    builder.SetMaxSendMessageSize(max_message_bytes_);
  }

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_ || port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  SBOMGRAPH_LOG_INFO("gRPC server listening", {sbomgraph::observability::StringField("bind_address", bind_address_),
                                               sbomgraph::observability::IntField("port", port_),
                                               sbomgraph::observability::IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;

  grpc_server_->Shutdown(std::chrono::system_clock::now() + shutdown_grace_);
  grpc_server_.reset();
  SBOMGRAPH_LOG_INFO("gRPC server stopped");
}

} // namespace sbomgraph::runtime
