#pragma once

#include "alog/core/result.h"
#include "alog/domain/log_collection.h"
#include "alog/domain/log_record.h"

#include <nlohmann/json.hpp>

namespace alog::domain {

// Deterministic JSON serialization.
// Keys are sorted alphabetically (nlohmann::json uses std::map internally).
// Ids use their canonical base64url text; nil subject/object ids become null.
// "creation_iso8601" is derived from creation_time and ignored on input.
[[nodiscard]] nlohmann::json log_record_to_json(const LogRecord& record);

// Array of records in collection order.
[[nodiscard]] nlohmann::json log_collection_to_json(const LogCollection& records);

// Deserialize a LogRecord from JSON. Missing fields and type mismatches are
// kInvalidArgument; malformed id or address text keeps its own error code.
[[nodiscard]] core::Result<LogRecord, core::Error> log_record_from_json(const nlohmann::json& j);

}  // namespace alog::domain
