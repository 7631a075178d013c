#include "alog/core/clock.h"
#include "alog/core/id_generator.h"
#include "alog/storage/inmemory_access_log.h"

#include <catch2/catch.hpp>

#include <algorithm>

using namespace alog;

namespace {

domain::LogRecord create_at(storage::IAccessLog& log, core::UnixSeconds time,
                            const std::string& scope = "event") {
  storage::NewLogRecord fields;
  fields.creation_time = time;
  fields.scope = scope;
  auto record = log.create(fields);
  REQUIRE(record.has_value());
  return record.value();
}

std::vector<core::BinaryId> search_ids(const storage::IAccessLog& log,
                                       const storage::LogFilter& filter,
                                       const storage::SortSpec& sort = {},
                                       const storage::PageSpec& page = {}) {
  auto logs = log.search(filter, sort, page);
  REQUIRE(logs.has_value());
  return logs.value().ids();
}

}  // namespace

TEST_CASE("InMemoryAccessLog create and get", "[inmemory][access-log]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{500};
  storage::InMemoryAccessLog log({}, id_gen, clock);

  storage::NewLogRecord fields;
  fields.scope = "login";
  fields.subject_id = core::BinaryId::parse("AAAAAAAAAAAAAAAAAAAAAg").value();
  auto created = log.create(fields);
  REQUIRE(created.has_value());
  CHECK(created.value().creation_time == 500);
  CHECK(created.value().remote_origin == net::IpAddress::loopback());

  auto fetched = log.get(created.value().id);
  REQUIRE(fetched.has_value());
  REQUIRE(fetched.value().has_value());
  CHECK(*fetched.value() == created.value());
}

TEST_CASE("InMemoryAccessLog rejects a colliding id", "[inmemory][access-log]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{500};
  storage::InMemoryAccessLog log({}, id_gen, clock);

  storage::NewLogRecord fields;
  fields.id = id_gen.next();
  REQUIRE(log.create(fields).has_value());

  auto duplicate = log.create(fields);
  REQUIRE_FALSE(duplicate.has_value());
  CHECK(duplicate.error().code == core::ErrorCode::kCollision);

  auto count = log.count({});
  REQUIRE(count.has_value());
  CHECK(count.value() == 1);
}

TEST_CASE("InMemoryAccessLog sorts and pages like the SQL store", "[inmemory][access-log]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{500};
  storage::InMemoryAccessLog log({}, id_gen, clock);

  const auto late = create_at(log, 30);
  const auto early_a = create_at(log, 10);
  const auto middle = create_at(log, 20);
  const auto early_b = create_at(log, 10);

  const std::vector<core::BinaryId> ascending{early_a.id, early_b.id, middle.id, late.id};
  CHECK(search_ids(log, {}) == ascending);

  auto descending = search_ids(
      log, {}, {storage::SortField::kCreationTime, storage::SortOrder::kDescending});
  std::reverse(descending.begin(), descending.end());
  CHECK(descending == ascending);

  CHECK(search_ids(log, {}, {}, {1, 3}) == std::vector<core::BinaryId>{late.id});
  CHECK(search_ids(log, {}, {}, {2, 3}).empty());
}

TEST_CASE("InMemoryAccessLog filters and prunes", "[inmemory][access-log]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{500};
  storage::InMemoryAccessLog log({}, id_gen, clock);

  create_at(log, 1, "a");
  create_at(log, 2, "b");
  const auto third = create_at(log, 3, "a");
  const auto undated = create_at(log, 0, "c");

  storage::LogFilter filter;
  filter.scopes = std::vector<std::string>{"a"};
  filter.created_after = 1;
  CHECK(search_ids(log, filter) == std::vector<core::BinaryId>{third.id});

  auto pruned = log.prune(3);
  REQUIRE(pruned.has_value());
  CHECK(pruned.value() == 2);

  auto scopes = log.unique_scopes();
  REQUIRE(scopes.has_value());
  CHECK(scopes.value() == std::set<std::string>{"a", "c"});

  auto rest = log.prune();
  REQUIRE(rest.has_value());
  CHECK(rest.value() == 1);
  CHECK(search_ids(log, {}) == std::vector<core::BinaryId>{undated.id});

  auto removed = log.remove(undated.id);
  REQUIRE(removed.has_value());
  CHECK(removed.value());
}
