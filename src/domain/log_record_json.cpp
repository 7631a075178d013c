#include "alog/domain/log_record_json.h"

#include "alog/core/time.h"

#include <string>

namespace alog::domain {

namespace {

nlohmann::json optional_id_to_json(const core::BinaryId& id) {
  if (id.is_nil()) {
    return nullptr;
  }
  return id.to_string();
}

core::Result<core::BinaryId, core::Error> optional_id_from_json(const nlohmann::json& j) {
  if (j.is_null()) {
    return core::Result<core::BinaryId, core::Error>::ok(core::BinaryId{});
  }
  return core::BinaryId::parse(j.get<std::string>());
}

// Field access throws nlohmann::json::exception; log_record_from_json converts it.
core::Result<LogRecord, core::Error> parse_record(const nlohmann::json& j) {
  LogRecord record;

  auto id = core::BinaryId::parse(j.at("id").get<std::string>());
  if (!id.has_value()) {
    return core::Result<LogRecord, core::Error>::err(id.error());
  }
  record.id = id.value();

  record.creation_time = j.at("creation_time").get<core::UnixSeconds>();
  record.scope = j.at("scope").get<std::string>();

  auto origin = net::IpAddress::parse(j.at("remote_origin").get<std::string>());
  if (!origin.has_value()) {
    return core::Result<LogRecord, core::Error>::err(origin.error());
  }
  record.remote_origin = origin.value();

  auto subject = optional_id_from_json(j.at("subject_id"));
  if (!subject.has_value()) {
    return core::Result<LogRecord, core::Error>::err(subject.error());
  }
  record.subject_id = subject.value();

  auto object = optional_id_from_json(j.at("object_id"));
  if (!object.has_value()) {
    return core::Result<LogRecord, core::Error>::err(object.error());
  }
  record.object_id = object.value();

  return core::Result<LogRecord, core::Error>::ok(record);
}

}  // namespace

nlohmann::json log_record_to_json(const LogRecord& record) {
  nlohmann::json j;
  j["creation_iso8601"] = core::format_iso8601(record.creation_time);
  j["creation_time"] = record.creation_time;
  j["id"] = record.id.to_string();
  j["object_id"] = optional_id_to_json(record.object_id);
  j["remote_origin"] = record.remote_origin.to_string();
  j["scope"] = record.scope;
  j["subject_id"] = optional_id_to_json(record.subject_id);
  return j;
}

nlohmann::json log_collection_to_json(const LogCollection& records) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& record : records) {
    out.push_back(log_record_to_json(record));
  }
  return out;
}

core::Result<LogRecord, core::Error> log_record_from_json(const nlohmann::json& j) {
  try {
    return parse_record(j);
  } catch (const nlohmann::json::exception& e) {
    return core::fail<LogRecord>(core::ErrorCode::kInvalidArgument,
                                 std::string("Malformed log record JSON: ") + e.what());
  }
}

}  // namespace alog::domain
