#include "alog/core/result.h"

namespace alog::core {

const char* to_string(const ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidIdentifier:
      return "invalid_identifier";
    case ErrorCode::kInvalidAddress:
      return "invalid_address";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kCollision:
      return "collision";
    case ErrorCode::kUnsupportedAddressFamily:
      return "unsupported_address_family";
    case ErrorCode::kBackend:
      return "backend";
  }
  return "unknown";
}

}  // namespace alog::core
