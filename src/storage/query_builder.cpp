#include "alog/storage/query_builder.h"

#include <limits>

namespace alog::storage {

namespace {

constexpr const char* kMatchNothing = "0 = 1";

// "column IN (?, ?, ...)" over already converted parameters.
template <typename T, typename Convert>
std::vector<SqlClause> membership_predicates(std::string_view column,
                                             const std::optional<std::vector<T>>& values,
                                             Convert convert) {
  if (!values.has_value()) {
    return {};
  }
  if (values->empty()) {
    return {SqlClause{kMatchNothing, {}}};
  }

  SqlClause clause;
  clause.sql.append(column);
  if (values->size() == 1) {
    clause.sql.append(" = ?");
  } else {
    clause.sql.append(" IN (");
    for (std::size_t i = 0; i < values->size(); ++i) {
      clause.sql.append(i == 0 ? "?" : ", ?");
    }
    clause.sql.append(")");
  }
  clause.params.reserve(values->size());
  for (const auto& value : *values) {
    clause.params.emplace_back(convert(value));
  }
  return {std::move(clause)};
}

std::int64_t clamp_to_int64(const std::size_t value) {
  constexpr auto kMax = static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max());
  return static_cast<std::int64_t>(value > kMax ? kMax : value);
}

}  // namespace

std::vector<SqlClause> id_set_predicates(std::string_view column,
                                         const std::optional<std::vector<core::BinaryId>>& ids) {
  return membership_predicates(column, ids,
                               [](const core::BinaryId& id) { return SqlParam{id.bytes}; });
}

std::vector<SqlClause> time_cutoff_predicates(std::string_view column,
                                              const std::optional<core::UnixSeconds>& after,
                                              const std::optional<core::UnixSeconds>& before) {
  std::vector<SqlClause> result;
  if (after.has_value()) {
    result.push_back(SqlClause{std::string(column) + " > ?", {SqlParam{std::int64_t{*after}}}});
  }
  if (before.has_value()) {
    result.push_back(SqlClause{std::string(column) + " < ?", {SqlParam{std::int64_t{*before}}}});
  }
  return result;
}

std::vector<SqlClause> string_equal_predicates(
    std::string_view column, const std::optional<std::vector<std::string>>& values) {
  return membership_predicates(column, values,
                               [](const std::string& value) { return SqlParam{value}; });
}

std::vector<SqlClause> remote_origin_predicates(
    std::string_view column, const std::optional<std::vector<net::IpAddress>>& origins) {
  return membership_predicates(column, origins, [](const net::IpAddress& origin) {
    return SqlParam{origin.storage_bytes()};
  });
}

SqlClause build_where_clause(const LogFilter& filter) {
  std::vector<SqlClause> conditions;
  const auto collect = [&conditions](std::vector<SqlClause> predicates) {
    for (auto& predicate : predicates) {
      conditions.push_back(std::move(predicate));
    }
  };

  collect(id_set_predicates("id", filter.ids));
  collect(time_cutoff_predicates("creation_time", filter.created_after, filter.created_before));
  collect(string_equal_predicates("scope", filter.scopes));
  collect(remote_origin_predicates("remote_origin", filter.remote_origins));
  collect(id_set_predicates("subject_id", filter.subject_ids));
  collect(id_set_predicates("object_id", filter.object_ids));

  SqlClause where;
  for (std::size_t i = 0; i < conditions.size(); ++i) {
    where.sql.append(i == 0 ? " WHERE " : " AND ");
    append_clause(where, conditions[i]);
  }
  return where;
}

std::string build_order_clause(const SortSpec& sort) {
  const char* direction = sort.order == SortOrder::kAscending ? "ASC" : "DESC";
  switch (sort.field) {
    case SortField::kCreationTime:
      return std::string(" ORDER BY creation_time ") + direction + ", id " + direction;
    case SortField::kId:
      return std::string(" ORDER BY id ") + direction;
  }
  return std::string(" ORDER BY creation_time ") + direction + ", id " + direction;
}

SqlClause build_limit_clause(const PageSpec& page) {
  if (!page.paginated()) {
    return {};
  }
  const std::size_t page_size = *page.page_size;
  const std::size_t offset = page.page > std::numeric_limits<std::size_t>::max() / page_size
                                 ? std::numeric_limits<std::size_t>::max()
                                 : page.page * page_size;
  return SqlClause{" LIMIT ? OFFSET ?",
                   {SqlParam{clamp_to_int64(page_size)}, SqlParam{clamp_to_int64(offset)}}};
}

void append_clause(SqlClause& head, const SqlClause& tail) {
  head.sql.append(tail.sql);
  head.params.insert(head.params.end(), tail.params.begin(), tail.params.end());
}

}  // namespace alog::storage
