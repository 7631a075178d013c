#include "alog/storage/query_builder.h"

#include <catch2/catch.hpp>

#include <variant>

using namespace alog;

TEST_CASE("Unfiltered query has no WHERE clause", "[query]") {
  const auto where = storage::build_where_clause(storage::LogFilter{});
  CHECK(where.sql.empty());
  CHECK(where.params.empty());
}

TEST_CASE("Single value becomes an equality predicate", "[query]") {
  storage::LogFilter filter;
  filter.scopes = std::vector<std::string>{"login"};

  const auto where = storage::build_where_clause(filter);
  CHECK(where.sql == " WHERE scope = ?");
  REQUIRE(where.params.size() == 1);
  CHECK(std::get<std::string>(where.params[0]) == "login");
}

TEST_CASE("Several values become a membership test", "[query]") {
  const auto predicates = storage::string_equal_predicates(
      "scope", std::vector<std::string>{"login", "logout", "reset"});
  REQUIRE(predicates.size() == 1);
  CHECK(predicates[0].sql == "scope IN (?, ?, ?)");
  CHECK(predicates[0].params.size() == 3);
}

TEST_CASE("Present but empty value set matches nothing", "[query]") {
  const auto predicates = storage::id_set_predicates("id", std::vector<core::BinaryId>{});
  REQUIRE(predicates.size() == 1);
  CHECK(predicates[0].sql == "0 = 1");
  CHECK(predicates[0].params.empty());
}

TEST_CASE("Time cutoffs are exclusive on both ends", "[query]") {
  const auto predicates = storage::time_cutoff_predicates("creation_time", 10, 20);
  REQUIRE(predicates.size() == 2);
  CHECK(predicates[0].sql == "creation_time > ?");
  CHECK(std::get<std::int64_t>(predicates[0].params[0]) == 10);
  CHECK(predicates[1].sql == "creation_time < ?");
  CHECK(std::get<std::int64_t>(predicates[1].params[0]) == 20);
}

TEST_CASE("Remote origins bind their 16-byte storage form", "[query]") {
  const auto origin = net::IpAddress::ipv4(1, 2, 3, 4);
  const auto predicates =
      storage::remote_origin_predicates("remote_origin", std::vector<net::IpAddress>{origin});
  REQUIRE(predicates.size() == 1);
  CHECK(predicates[0].sql == "remote_origin = ?");
  CHECK(std::get<core::Bytes16>(predicates[0].params[0]) == origin.storage_bytes());
}

TEST_CASE("Filters combine with AND in a fixed order", "[query]") {
  storage::LogFilter filter;
  filter.created_after = 5;
  filter.subject_ids = std::vector<core::BinaryId>{core::BinaryId{}};
  filter.scopes = std::vector<std::string>{"a", "b"};

  const auto where = storage::build_where_clause(filter);
  CHECK(where.sql == " WHERE creation_time > ? AND scope IN (?, ?) AND subject_id = ?");
  CHECK(where.params.size() == 4);
}

TEST_CASE("Order clause breaks creation_time ties by id", "[query]") {
  CHECK(storage::build_order_clause(storage::SortSpec{}) ==
        " ORDER BY creation_time ASC, id ASC");
  CHECK(storage::build_order_clause(
            {storage::SortField::kCreationTime, storage::SortOrder::kDescending}) ==
        " ORDER BY creation_time DESC, id DESC");
  CHECK(storage::build_order_clause({storage::SortField::kId, storage::SortOrder::kAscending}) ==
        " ORDER BY id ASC");
}

TEST_CASE("Limit clause is only emitted for a positive page size", "[query]") {
  CHECK(storage::build_limit_clause(storage::PageSpec{}).sql.empty());
  CHECK(storage::build_limit_clause(storage::PageSpec{3, 0}).sql.empty());

  const auto limit = storage::build_limit_clause(storage::PageSpec{2, 10});
  CHECK(limit.sql == " LIMIT ? OFFSET ?");
  REQUIRE(limit.params.size() == 2);
  CHECK(std::get<std::int64_t>(limit.params[0]) == 10);
  CHECK(std::get<std::int64_t>(limit.params[1]) == 20);
}

TEST_CASE("Sort names parse to fields and orders", "[query]") {
  CHECK(storage::parse_sort_field("creation_time") == storage::SortField::kCreationTime);
  CHECK(storage::parse_sort_field("id") == storage::SortField::kId);
  CHECK_FALSE(storage::parse_sort_field("scope").has_value());
  CHECK(storage::parse_sort_order("desc") == storage::SortOrder::kDescending);
  CHECK(storage::parse_sort_order("ascending") == storage::SortOrder::kAscending);
  CHECK_FALSE(storage::parse_sort_order("up").has_value());
}
