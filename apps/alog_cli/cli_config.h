#pragma once

#include "alog/core/result.h"
#include "alog/core/types.h"
#include "alog/storage/access_log.h"
#include "alog/storage/log_query.h"

#include "shared/arg_parser.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace alog::cli {

// CliConfig holds every flag accepted by alog_cli subcommands.
// Values that need parsing into domain types (ids, addresses) are kept as text and
// converted by the to_* helpers below, so a bad value is reported with its flag.
struct CliConfig {
  // ── Store ──
  std::optional<std::string> db_path;                      // NOLINT(readability-identifier-naming)
  std::string table_prefix;                                // NOLINT(readability-identifier-naming)
  std::optional<std::string> default_origin;               // NOLINT(readability-identifier-naming)
  std::size_t scope_length{storage::kDefaultScopeLength};  // NOLINT(readability-identifier-naming)

  // ── Record fields ──
  std::optional<std::string> id;                   // NOLINT(readability-identifier-naming)
  std::optional<core::UnixSeconds> creation_time;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> scope;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> origin;               // NOLINT(readability-identifier-naming)
  std::optional<std::string> subject;              // NOLINT(readability-identifier-naming)
  std::optional<std::string> object;               // NOLINT(readability-identifier-naming)
  std::optional<std::string> new_id;               // NOLINT(readability-identifier-naming)

  // ── Filter (comma separated lists) ──
  std::optional<std::string> ids;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> scopes;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> origins;       // NOLINT(readability-identifier-naming)
  std::optional<std::string> subjects;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> objects;       // NOLINT(readability-identifier-naming)
  std::optional<core::UnixSeconds> after;   // NOLINT(readability-identifier-naming)
  std::optional<core::UnixSeconds> before;  // NOLINT(readability-identifier-naming)

  // ── Sort / page ──
  storage::SortSpec sort;  // NOLINT(readability-identifier-naming)
  storage::PageSpec page;  // NOLINT(readability-identifier-naming)

  // ── Cooldown ──
  std::optional<std::int64_t> amount;  // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> period;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<CliConfig>> build_option_registry();

// Parse argv[start..]; argv[1] is the subcommand.
[[nodiscard]] apps::ParsedArgs<CliConfig> parse_cli_args(
    int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
    int start = 2);

// validate_cli_config checks the store settings shared by every subcommand.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

// Split a comma separated flag value. Every token is kept, so "" yields one empty token.
[[nodiscard]] std::vector<std::string> split_list(std::string_view text);

// Parse a decimal integer; accepts an optional leading '-'.
[[nodiscard]] std::optional<std::int64_t> parse_integer(std::string_view text);

[[nodiscard]] core::Result<storage::AccessLogConfig, core::Error> to_access_log_config(
    const CliConfig& config);

[[nodiscard]] core::Result<storage::LogFilter, core::Error> to_log_filter(const CliConfig& config);

[[nodiscard]] core::Result<storage::NewLogRecord, core::Error> to_new_log_record(
    const CliConfig& config);

}  // namespace alog::cli
