#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace hosting::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace hosting::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InUse*>(&e) || dynamic_cast<const ConfigInvalid*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const StartupError*>(&e) || dynamic_cast<const ReloadError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  // UpstreamError and anything unexpected
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace hosting::grpc
