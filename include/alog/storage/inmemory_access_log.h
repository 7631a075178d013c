#pragma once

#include "alog/storage/access_log.h"

#include <mutex>
#include <vector>

namespace alog::storage {

// In-memory implementation of IAccessLog. Ephemeral, lost on process exit.
// Intended for unit tests of code layered on IAccessLog; production paths use
// SqliteAccessLog (an in-memory SQLite database when no file is configured).
// Rows are kept in insertion order; search() sorts a filtered copy.
class InMemoryAccessLog final : public IAccessLog {
 public:
  InMemoryAccessLog(AccessLogConfig config, core::IIdGenerator& id_gen, core::IClock& clock);

  core::Result<domain::LogRecord, core::Error> create(const NewLogRecord& fields) override;
  [[nodiscard]] core::Result<std::optional<domain::LogRecord>, core::Error> get(
      const core::BinaryId& id) const override;
  [[nodiscard]] core::Result<std::int64_t, core::Error> count(
      const LogFilter& filter) const override;
  [[nodiscard]] core::Result<domain::LogCollection, core::Error> search(
      const LogFilter& filter, const SortSpec& sort = {},
      const PageSpec& page = {}) const override;
  core::Result<bool, core::Error> remove(const core::BinaryId& id) override;
  core::Result<std::int64_t, core::Error> prune(
      std::optional<core::UnixSeconds> created_before = std::nullopt) override;
  [[nodiscard]] core::Result<std::set<std::string>, core::Error> unique_scopes() const override;
  core::Result<std::int64_t, core::Error> replace_party_id(const core::BinaryId& old_id,
                                                           const core::BinaryId& new_id) override;
  core::Result<std::int64_t, core::Error> update_remote_origins(
      const std::vector<OriginUpdate>& updates) override;
  [[nodiscard]] const AccessLogConfig& config() const override { return config_; }

 private:
  AccessLogConfig config_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;

  mutable std::mutex mutex_;
  std::vector<domain::LogRecord> rows_;
};

}  // namespace alog::storage
