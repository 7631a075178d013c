#pragma once

#include "alog/core/binary_id.h"
#include "alog/core/clock.h"
#include "alog/core/id_generator.h"
#include "alog/core/result.h"
#include "alog/domain/log_collection.h"
#include "alog/domain/log_record.h"
#include "alog/net/ip_address.h"
#include "alog/storage/log_query.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace alog::storage {

constexpr std::size_t kDefaultScopeLength = 16;

// AccessLogConfig is fixed at store construction and read-only afterwards.
struct AccessLogConfig {
  // Prepended to the table name ("<prefix>access_logs"); [A-Za-z0-9_-] only.
  std::string table_prefix;  // NOLINT(readability-identifier-naming)
  // Origin recorded by create() and assumed by cooldown checks when the caller gives none.
  std::optional<net::IpAddress> default_remote_origin;  // NOLINT(readability-identifier-naming)
  std::size_t scope_length{kDefaultScopeLength};        // NOLINT(readability-identifier-naming)
};

// Returns "" on success, otherwise a description of the first invalid setting.
[[nodiscard]] std::string validate_access_log_config(const AccessLogConfig& config);

// Fields supplied to create(). Unset optionals take their documented defaults:
// id -> generated, creation_time -> clock now, remote_origin -> configured default or loopback.
struct NewLogRecord {
  std::optional<core::BinaryId> id;                // NOLINT(readability-identifier-naming)
  std::optional<core::UnixSeconds> creation_time;  // NOLINT(readability-identifier-naming)
  std::string scope;                               // NOLINT(readability-identifier-naming)
  std::optional<net::IpAddress> remote_origin;     // NOLINT(readability-identifier-naming)
  core::BinaryId subject_id;                       // NOLINT(readability-identifier-naming)
  core::BinaryId object_id;                        // NOLINT(readability-identifier-naming)
};

// build_candidate applies create() defaults and validates record invariants
// (non-negative creation_time, scope within the configured bound).
[[nodiscard]] core::Result<domain::LogRecord, core::Error> build_candidate(
    const NewLogRecord& fields, const AccessLogConfig& config, core::IIdGenerator& id_gen,
    core::IClock& clock);

// Replacement origin for one stored record, used by origin anonymization.
struct OriginUpdate {
  core::BinaryId id;             // NOLINT(readability-identifier-naming)
  net::IpAddress remote_origin;  // NOLINT(readability-identifier-naming)
};

// IAccessLog is the durable store of LogRecords.
//
// Every operation runs as one statement or one transaction against the backend.
// Not-found is never an error: get() returns nullopt, search() an empty collection,
// count() zero and remove() false.
class IAccessLog {
 public:
  virtual ~IAccessLog() = default;

  // Persist a new record. Fails with kCollision (writing nothing) when the id exists.
  virtual core::Result<domain::LogRecord, core::Error> create(const NewLogRecord& fields) = 0;

  [[nodiscard]] virtual core::Result<std::optional<domain::LogRecord>, core::Error> get(
      const core::BinaryId& id) const = 0;

  [[nodiscard]] virtual core::Result<std::int64_t, core::Error> count(
      const LogFilter& filter) const = 0;

  [[nodiscard]] virtual core::Result<domain::LogCollection, core::Error> search(
      const LogFilter& filter, const SortSpec& sort = {}, const PageSpec& page = {}) const = 0;

  // Returns whether a row was removed.
  virtual core::Result<bool, core::Error> remove(const core::BinaryId& id) = 0;

  // Delete dated rows (creation_time != 0), only those older than created_before when given.
  // Returns the number of rows removed.
  virtual core::Result<std::int64_t, core::Error> prune(
      std::optional<core::UnixSeconds> created_before = std::nullopt) = 0;

  [[nodiscard]] virtual core::Result<std::set<std::string>, core::Error> unique_scopes()
      const = 0;

  // Rewrite subject_id == old_id and, independently, object_id == old_id to new_id.
  // Returns the number of column values rewritten.
  virtual core::Result<std::int64_t, core::Error> replace_party_id(
      const core::BinaryId& old_id, const core::BinaryId& new_id) = 0;

  // Apply one origin update per entry, targeting rows by id. Returns rows updated.
  virtual core::Result<std::int64_t, core::Error> update_remote_origins(
      const std::vector<OriginUpdate>& updates) = 0;

  [[nodiscard]] virtual const AccessLogConfig& config() const = 0;

 protected:
  IAccessLog() = default;
  IAccessLog(const IAccessLog&) = default;
  IAccessLog& operator=(const IAccessLog&) = default;
  IAccessLog(IAccessLog&&) = default;
  IAccessLog& operator=(IAccessLog&&) = default;
};

}  // namespace alog::storage
