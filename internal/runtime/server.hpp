#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace sbomgraph::runtime {

/*
  gRPC listener hosting the transport adapters.

  Owns the services; they must outlive the grpc::Server, which is
  destroyed in Stop().
*/
class Server {
public:
  Server(const sbomgraph::runtime::config::ServerConfig& config, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Throws std::runtime_error when the address cannot be bound.
  void Start();
  void Wait();

  // Rejects new calls and cancels those still running after the grace period.
  void Stop();

  // Port actually bound; valid after Start().
  int Port() const { return port_; }

private:
  std::string bind_address_;
  std::chrono::milliseconds shutdown_grace_;
  int max_message_bytes_;
  int port_ = 0;

  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> grpc_server_;
};

} // namespace sbomgraph::runtime
