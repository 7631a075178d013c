#pragma once

#include "alog/core/binary_id.h"
#include "alog/core/types.h"
#include "alog/net/ip_address.h"

#include <string>

namespace alog::domain {

// LogRecord is one recorded event: who (subject) did what (scope) to whom (object),
// from where (remote_origin) and when (creation_time).
//
// Only subject_id, object_id and remote_origin change after creation, and only
// through anonymization. A nil subject_id/object_id means "none".
struct LogRecord {
  core::BinaryId id;                   // NOLINT(readability-identifier-naming)
  core::UnixSeconds creation_time{0};  // NOLINT(readability-identifier-naming)
  std::string scope;                   // NOLINT(readability-identifier-naming)
  net::IpAddress remote_origin;        // NOLINT(readability-identifier-naming)
  core::BinaryId subject_id;           // NOLINT(readability-identifier-naming)
  core::BinaryId object_id;            // NOLINT(readability-identifier-naming)

  bool operator==(const LogRecord&) const = default;
};

}  // namespace alog::domain
