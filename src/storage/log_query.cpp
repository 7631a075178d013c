#include "alog/storage/log_query.h"

#include <algorithm>
#include <tuple>

namespace alog::storage {

namespace {

template <typename T>
bool in_set(const std::optional<std::vector<T>>& values, const T& candidate) {
  if (!values.has_value()) {
    return true;
  }
  return std::find(values->begin(), values->end(), candidate) != values->end();
}

}  // namespace

bool matches(const LogFilter& filter, const domain::LogRecord& record) {
  if (filter.created_after.has_value() && !(record.creation_time > *filter.created_after)) {
    return false;
  }
  if (filter.created_before.has_value() && !(record.creation_time < *filter.created_before)) {
    return false;
  }
  return in_set(filter.ids, record.id) && in_set(filter.scopes, record.scope) &&
         in_set(filter.remote_origins, record.remote_origin) &&
         in_set(filter.subject_ids, record.subject_id) &&
         in_set(filter.object_ids, record.object_id);
}

std::optional<SortField> parse_sort_field(std::string_view name) {
  if (name == "creation_time") {
    return SortField::kCreationTime;
  }
  if (name == "id") {
    return SortField::kId;
  }
  return std::nullopt;
}

std::optional<SortOrder> parse_sort_order(std::string_view name) {
  if (name == "asc" || name == "ascending") {
    return SortOrder::kAscending;
  }
  if (name == "desc" || name == "descending") {
    return SortOrder::kDescending;
  }
  return std::nullopt;
}

const char* to_string(const SortField field) {
  switch (field) {
    case SortField::kCreationTime:
      return "creation_time";
    case SortField::kId:
      return "id";
  }
  return "creation_time";
}

bool ordered_before(const SortSpec& sort, const domain::LogRecord& a,
                    const domain::LogRecord& b) {
  const domain::LogRecord& lhs = sort.order == SortOrder::kAscending ? a : b;
  const domain::LogRecord& rhs = sort.order == SortOrder::kAscending ? b : a;
  switch (sort.field) {
    case SortField::kCreationTime:
      return std::tie(lhs.creation_time, lhs.id) < std::tie(rhs.creation_time, rhs.id);
    case SortField::kId:
      return lhs.id < rhs.id;
  }
  return false;
}

}  // namespace alog::storage
