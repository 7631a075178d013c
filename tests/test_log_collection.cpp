#include "alog/core/id_generator.h"
#include "alog/domain/log_collection.h"

#include <catch2/catch.hpp>

using namespace alog;

namespace {

domain::LogRecord make_record(core::IIdGenerator& gen, const std::string& scope) {
  domain::LogRecord record;
  record.id = gen.next();
  record.creation_time = 100;
  record.scope = scope;
  record.remote_origin = net::IpAddress::loopback();
  return record;
}

}  // namespace

TEST_CASE("LogCollection preserves insertion order and supports lookup", "[domain][collection]") {
  core::DeterministicIdGenerator gen;
  const auto first = make_record(gen, "login");
  const auto second = make_record(gen, "logout");
  const auto third = make_record(gen, "login");

  domain::LogCollection logs;
  logs.add(third);
  logs.add(first);
  logs.add(second);

  REQUIRE(logs.size() == 3);
  CHECK(logs.at(0).id == third.id);
  CHECK(logs.at(1).id == first.id);
  CHECK(logs.at(2).id == second.id);

  const auto ids = logs.ids();
  REQUIRE(ids.size() == 3);
  CHECK(ids[0] == third.id);

  const auto* found = logs.get(second.id);
  REQUIRE(found != nullptr);
  CHECK(found->scope == "logout");
  CHECK(logs.contains(first.id));
}

TEST_CASE("LogCollection lookup of a missing id returns null", "[domain][collection]") {
  core::DeterministicIdGenerator gen;
  domain::LogCollection logs;
  CHECK(logs.empty());
  CHECK(logs.get(gen.next()) == nullptr);
  CHECK_FALSE(logs.contains(core::BinaryId{}));
}

TEST_CASE("LogCollection replaces a duplicate id in place", "[domain][collection]") {
  core::DeterministicIdGenerator gen;
  auto first = make_record(gen, "a");
  const auto second = make_record(gen, "b");

  domain::LogCollection logs;
  logs.add(first);
  logs.add(second);

  first.scope = "a2";
  logs.add(first);

  REQUIRE(logs.size() == 2);
  CHECK(logs.at(0).scope == "a2");
  CHECK(logs.at(1).scope == "b");
}
