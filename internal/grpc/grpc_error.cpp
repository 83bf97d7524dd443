#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace workledger::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace workledger::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (const auto* insufficient = dynamic_cast<const InsufficientCredits*>(&e)) {
    // details: "available=<n> required=<n>"
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what(),
            "available=" + std::to_string(insufficient->Available()) + " required=" + std::to_string(insufficient->Required())};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace workledger::grpc
