#include "alog/domain/log_record_json.h"

#include <catch2/catch.hpp>

using namespace alog;

namespace {

domain::LogRecord sample_record() {
  domain::LogRecord record;
  record.id = core::BinaryId::parse("00112233-4455-6677-8899-aabbccddeeff").value();
  record.creation_time = 86400;
  record.scope = "login";
  record.remote_origin = net::IpAddress::ipv4(1, 2, 3, 4);
  record.subject_id = core::BinaryId::parse("AAAAAAAAAAAAAAAAAAAAAQ").value();
  return record;
}

}  // namespace

TEST_CASE("log_record_to_json writes canonical text fields", "[domain][json]") {
  const auto j = domain::log_record_to_json(sample_record());

  CHECK(j.at("id") == "ABEiM0RVZneImaq7zN3u_w");
  CHECK(j.at("creation_time") == 86400);
  CHECK(j.at("creation_iso8601") == "1970-01-02T00:00:00Z");
  CHECK(j.at("scope") == "login");
  CHECK(j.at("remote_origin") == "1.2.3.4");
  CHECK(j.at("subject_id") == "AAAAAAAAAAAAAAAAAAAAAQ");
  CHECK(j.at("object_id").is_null());
}

TEST_CASE("log_record_to_json output is deterministic", "[domain][json]") {
  const auto record = sample_record();
  CHECK(domain::log_record_to_json(record).dump() == domain::log_record_to_json(record).dump());
}

TEST_CASE("log_record_from_json restores the record", "[domain][json]") {
  const auto record = sample_record();
  auto restored = domain::log_record_from_json(domain::log_record_to_json(record));
  REQUIRE(restored.has_value());
  CHECK(restored.value() == record);
}

TEST_CASE("log_record_from_json reports malformed ids and addresses", "[domain][json]") {
  auto j = domain::log_record_to_json(sample_record());

  auto bad_id = j;
  bad_id["id"] = "not-an-id";
  auto id_result = domain::log_record_from_json(bad_id);
  REQUIRE_FALSE(id_result.has_value());
  CHECK(id_result.error().code == core::ErrorCode::kInvalidIdentifier);

  auto bad_origin = j;
  bad_origin["remote_origin"] = "999.1.1.1";
  auto origin_result = domain::log_record_from_json(bad_origin);
  REQUIRE_FALSE(origin_result.has_value());
  CHECK(origin_result.error().code == core::ErrorCode::kInvalidAddress);
}

TEST_CASE("log_record_from_json reports missing fields and wrong types", "[domain][json]") {
  auto j = domain::log_record_to_json(sample_record());

  auto missing_scope = j;
  missing_scope.erase("scope");
  auto missing_result = domain::log_record_from_json(missing_scope);
  REQUIRE_FALSE(missing_result.has_value());
  CHECK(missing_result.error().code == core::ErrorCode::kInvalidArgument);

  auto text_time = j;
  text_time["creation_time"] = "yesterday";
  auto type_result = domain::log_record_from_json(text_time);
  REQUIRE_FALSE(type_result.has_value());
  CHECK(type_result.error().code == core::ErrorCode::kInvalidArgument);

  auto not_object = domain::log_record_from_json(nlohmann::json::array());
  REQUIRE_FALSE(not_object.has_value());
  CHECK(not_object.error().code == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("log_collection_to_json keeps collection order", "[domain][json]") {
  auto first = sample_record();
  auto second = sample_record();
  second.id = core::BinaryId::parse("AAAAAAAAAAAAAAAAAAAAAg").value();

  domain::LogCollection logs;
  logs.add(second);
  logs.add(first);

  const auto j = domain::log_collection_to_json(logs);
  REQUIRE(j.is_array());
  REQUIRE(j.size() == 2);
  CHECK(j[0].at("id") == "AAAAAAAAAAAAAAAAAAAAAg");
  CHECK(j[1].at("id") == "ABEiM0RVZneImaq7zN3u_w");
}
