#pragma once

#include "alog/core/binary_id.h"
#include "alog/core/types.h"
#include "alog/net/ip_address.h"
#include "alog/storage/log_query.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace alog::storage {

// Positional statement parameter; every '?' in a SqlClause has exactly one entry.
using SqlParam = std::variant<std::int64_t, std::string, core::Bytes16>;

struct SqlClause {
  std::string sql;               // NOLINT(readability-identifier-naming)
  std::vector<SqlParam> params;  // NOLINT(readability-identifier-naming)
};

// ── Predicate families ──────────────────────────────────────────────────────
// Each builder returns zero or more predicates to AND together. An absent value
// set yields no predicate; a present but empty set yields a predicate that
// matches nothing. Multiple values become an IN (...) membership test.

[[nodiscard]] std::vector<SqlClause> id_set_predicates(
    std::string_view column, const std::optional<std::vector<core::BinaryId>>& ids);

[[nodiscard]] std::vector<SqlClause> time_cutoff_predicates(
    std::string_view column, const std::optional<core::UnixSeconds>& after,
    const std::optional<core::UnixSeconds>& before);

[[nodiscard]] std::vector<SqlClause> string_equal_predicates(
    std::string_view column, const std::optional<std::vector<std::string>>& values);

[[nodiscard]] std::vector<SqlClause> remote_origin_predicates(
    std::string_view column, const std::optional<std::vector<net::IpAddress>>& origins);

// ── Statement assembly ──────────────────────────────────────────────────────

// " WHERE p1 AND p2 ..." for the whole filter, or an empty clause when unfiltered.
[[nodiscard]] SqlClause build_where_clause(const LogFilter& filter);

// " ORDER BY ..." with the id tie-breaker for creation_time sorts.
[[nodiscard]] std::string build_order_clause(const SortSpec& sort);

// " LIMIT ? OFFSET ?" when paginated, otherwise empty.
[[nodiscard]] SqlClause build_limit_clause(const PageSpec& page);

// Append `tail` (sql and params) to `head`.
void append_clause(SqlClause& head, const SqlClause& tail);

}  // namespace alog::storage
