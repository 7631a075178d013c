#include "alog/storage/access_log.h"

#include <algorithm>

namespace alog::storage {

namespace {

// Characters in UTF-8 text: every byte that is not a continuation byte (10xxxxxx).
std::size_t utf8_length(const std::string& text) {
  return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
    return (static_cast<unsigned char>(c) & 0xC0U) != 0x80U;
  }));
}

}  // namespace

std::string validate_access_log_config(const AccessLogConfig& config) {
  const bool prefix_ok =
      std::all_of(config.table_prefix.begin(), config.table_prefix.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '_' || c == '-';
      });
  if (!prefix_ok) {
    return "table prefix '" + config.table_prefix +
           "' may only contain letters, digits, '_' and '-'";
  }
  if (config.scope_length == 0) {
    return "scope length must be positive";
  }
  if (config.default_remote_origin.has_value() &&
      config.default_remote_origin->family() == net::AddressFamily::kUnspecified) {
    return "default remote origin has no address family";
  }
  return "";
}

core::Result<domain::LogRecord, core::Error> build_candidate(const NewLogRecord& fields,
                                                             const AccessLogConfig& config,
                                                             core::IIdGenerator& id_gen,
                                                             core::IClock& clock) {
  domain::LogRecord record;

  record.id = fields.id.has_value() ? *fields.id : id_gen.next();
  if (record.id.is_nil()) {
    return core::fail<domain::LogRecord>(core::ErrorCode::kInvalidIdentifier,
                                         "Log id must not be nil");
  }

  record.creation_time = fields.creation_time.value_or(clock.now_unix_seconds());
  if (record.creation_time < 0) {
    return core::fail<domain::LogRecord>(
        core::ErrorCode::kInvalidArgument,
        "creation_time must be non-negative, got " + std::to_string(record.creation_time));
  }

  if (utf8_length(fields.scope) > config.scope_length) {
    return core::fail<domain::LogRecord>(
        core::ErrorCode::kInvalidArgument,
        "scope '" + fields.scope + "' exceeds " + std::to_string(config.scope_length) +
            " characters");
  }
  record.scope = fields.scope;

  if (fields.remote_origin.has_value()) {
    record.remote_origin = *fields.remote_origin;
  } else {
    record.remote_origin = config.default_remote_origin.value_or(net::IpAddress::loopback());
  }
  if (record.remote_origin.family() == net::AddressFamily::kUnspecified) {
    return core::fail<domain::LogRecord>(core::ErrorCode::kInvalidAddress,
                                         "remote origin has no address family");
  }

  record.subject_id = fields.subject_id;
  record.object_id = fields.object_id;
  return core::Result<domain::LogRecord, core::Error>::ok(record);
}

}  // namespace alog::storage
