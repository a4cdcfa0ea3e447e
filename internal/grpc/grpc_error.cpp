#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace macrelay::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace macrelay::util;

  if (dynamic_cast<const NotFound*>(&e) || dynamic_cast<const FileNotReady*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const AdmissionRejected*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const StreamUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace macrelay::grpc
