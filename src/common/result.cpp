#include "sessionkit/common/result.hpp"

namespace sessionkit::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "ok";
  case ErrorCode::Collision:
    return "collision";
  case ErrorCode::Source:
    return "source";
  case ErrorCode::Storage:
    return "storage";
  case ErrorCode::Cancelled:
    return "cancelled";
  case ErrorCode::DeadlineExceeded:
    return "deadline_exceeded";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::NotConfigured:
    return "not_configured";
  }
  return "unknown";
}

} // namespace sessionkit::common
