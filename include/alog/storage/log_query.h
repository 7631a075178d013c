#pragma once

#include "alog/core/binary_id.h"
#include "alog/core/types.h"
#include "alog/domain/log_record.h"
#include "alog/net/ip_address.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace alog::storage {

// LogFilter selects rows for search() and count().
//
// Every field is optional; an absent field contributes no predicate.
// Fields combine with AND, values inside one set combine with OR.
// A present but empty set matches nothing.
// Time cutoffs are exclusive: created_after keeps creation_time > cutoff,
// created_before keeps creation_time < cutoff.
struct LogFilter {
  std::optional<std::vector<core::BinaryId>> ids;             // NOLINT(readability-identifier-naming)
  std::optional<core::UnixSeconds> created_after;             // NOLINT(readability-identifier-naming)
  std::optional<core::UnixSeconds> created_before;            // NOLINT(readability-identifier-naming)
  std::optional<std::vector<std::string>> scopes;             // NOLINT(readability-identifier-naming)
  std::optional<std::vector<net::IpAddress>> remote_origins;  // NOLINT(readability-identifier-naming)
  std::optional<std::vector<core::BinaryId>> subject_ids;     // NOLINT(readability-identifier-naming)
  std::optional<std::vector<core::BinaryId>> object_ids;      // NOLINT(readability-identifier-naming)
};

// In-process evaluation of a LogFilter, equivalent to the SQL built by query_builder.
[[nodiscard]] bool matches(const LogFilter& filter, const domain::LogRecord& record);

enum class SortField {
  kCreationTime,
  kId,
};

enum class SortOrder {
  kAscending,
  kDescending,
};

// Sorting by creation_time breaks ties by id in the same direction, so every sort is a
// total order and a descending result is exactly the reverse of the ascending one.
struct SortSpec {
  SortField field{SortField::kCreationTime};  // NOLINT(readability-identifier-naming)
  SortOrder order{SortOrder::kAscending};     // NOLINT(readability-identifier-naming)
};

// Accepts "creation_time" and "id". Any other name is not a sortable field.
[[nodiscard]] std::optional<SortField> parse_sort_field(std::string_view name);

// Accepts "asc"/"ascending" and "desc"/"descending".
[[nodiscard]] std::optional<SortOrder> parse_sort_order(std::string_view name);

[[nodiscard]] const char* to_string(SortField field);

// Strict weak ordering matching the SQL ORDER BY for the same SortSpec.
[[nodiscard]] bool ordered_before(const SortSpec& sort, const domain::LogRecord& a,
                                  const domain::LogRecord& b);

// PageSpec selects a 0-based page of page_size rows.
// An unset (or zero) page_size returns every matching row and ignores page.
struct PageSpec {
  std::size_t page{0};                   // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> page_size;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool paginated() const { return page_size.has_value() && *page_size > 0; }
};

}  // namespace alog::storage
