#pragma once

#include "alog/storage/access_log.h"
#include "alog/storage/query_builder.h"
#include "alog/storage/sqlite/sqlite_db.h"

#include <memory>

namespace alog::storage::sqlite {

// SqliteAccessLog implements IAccessLog over the "<prefix>access_logs" table.
//
// Ids, origins and subject/object ids are stored as 16-byte BLOBs; the id column is
// the primary key and is the authoritative guard against duplicate ids. create()
// also runs a preflight lookup inside the same immediate transaction so the common
// collision is reported without attempting the insert.
//
// Each public operation holds the connection lock (SqliteDb::lock()) for its duration,
// so stores sharing one SqliteDb never interleave their statements or transactions.
class SqliteAccessLog final : public IAccessLog {
 public:
  // Validate config and bind a store to db. Does not touch the schema; call install().
  [[nodiscard]] static core::Result<std::unique_ptr<SqliteAccessLog>, core::Error> open(
      std::shared_ptr<SqliteDb> db, AccessLogConfig config, core::IIdGenerator& id_gen,
      core::IClock& clock);

  ~SqliteAccessLog() override = default;

  SqliteAccessLog(const SqliteAccessLog&) = delete;
  SqliteAccessLog& operator=(const SqliteAccessLog&) = delete;
  SqliteAccessLog(SqliteAccessLog&&) = delete;
  SqliteAccessLog& operator=(SqliteAccessLog&&) = delete;

  // Create the table and its indexes if they do not exist yet.
  [[nodiscard]] core::Result<bool, core::Error> install();

  // Drop the table (teardown).
  [[nodiscard]] core::Result<bool, core::Error> uninstall();

  [[nodiscard]] const std::string& table_name() const { return table_name_; }

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
  SqliteAccessLog(std::shared_ptr<SqliteDb> db, AccessLogConfig config,
                  core::IIdGenerator& id_gen, core::IClock& clock);

  std::shared_ptr<SqliteDb> db_;
  AccessLogConfig config_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;
  std::string table_name_;
  std::string quoted_table_;

  // Callers hold the connection lock.
  [[nodiscard]] core::Result<std::int64_t, core::Error> count_locked(
      const LogFilter& filter) const;
  [[nodiscard]] core::Result<domain::LogCollection, core::Error> search_locked(
      const LogFilter& filter, const SortSpec& sort, const PageSpec& page) const;
  [[nodiscard]] core::Result<std::int64_t, core::Error> execute_locked(
      const SqlClause& statement) const;

  // Deserialize a row into a LogRecord.
  // Column order: id(0), creation_time(1), scope(2), remote_origin(3),
  //               subject_id(4), object_id(5)
  [[nodiscard]] core::Result<domain::LogRecord, core::Error> row_to_record(
      sqlite3_stmt* stmt) const;

  [[nodiscard]] core::Error backend_error(const std::string& context) const;
};

}  // namespace alog::storage::sqlite
