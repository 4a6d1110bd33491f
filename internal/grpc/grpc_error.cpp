#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace sbomgraph::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace sbomgraph::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const DataAccessError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace sbomgraph::grpc
