#include "alog/storage/sqlite/sqlite_access_log.h"

#include <sqlite3.h>

#include <type_traits>
#include <utility>

namespace alog::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, creation_time, scope, remote_origin, subject_id, object_id FROM ";

// Bind params to ?1..?N. Returns the first non-OK sqlite result code, or SQLITE_OK.
int bind_params(sqlite3_stmt* stmt, const std::vector<SqlParam>& params) {
  int index = 1;
  for (const auto& param : params) {
    const int rc = std::visit(
        [stmt, index](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::int64_t>) {
            return sqlite3_bind_int64(stmt, index, value);
          } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()),
                                     SQLITE_TRANSIENT);
          } else {
            return sqlite3_bind_blob(stmt, index, value.data(), static_cast<int>(value.size()),
                                     SQLITE_TRANSIENT);
          }
        },
        param);
    if (rc != SQLITE_OK) {
      return rc;
    }
    ++index;
  }
  return SQLITE_OK;
}

std::string quote_identifier(const std::string& name) {
  return "\"" + name + "\"";
}

bool is_unique_violation(const int rc) {
  return rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE;
}

}  // namespace

SqliteAccessLog::SqliteAccessLog(std::shared_ptr<SqliteDb> db, AccessLogConfig config,
                                 core::IIdGenerator& id_gen, core::IClock& clock)
    : db_(std::move(db)),
      config_(std::move(config)),
      id_gen_(id_gen),
      clock_(clock),
      table_name_(config_.table_prefix + "access_logs"),
      quoted_table_(quote_identifier(table_name_)) {}

core::Result<std::unique_ptr<SqliteAccessLog>, core::Error> SqliteAccessLog::open(
    std::shared_ptr<SqliteDb> db, AccessLogConfig config, core::IIdGenerator& id_gen,
    core::IClock& clock) {
  if (!db) {
    return core::fail<std::unique_ptr<SqliteAccessLog>>(core::ErrorCode::kInvalidArgument,
                                                        "Access log requires a database");
  }
  const std::string config_error = validate_access_log_config(config);
  if (!config_error.empty()) {
    return core::fail<std::unique_ptr<SqliteAccessLog>>(core::ErrorCode::kInvalidArgument,
                                                        "Invalid access log config: " +
                                                            config_error);
  }
  return core::Result<std::unique_ptr<SqliteAccessLog>, core::Error>::ok(
      std::unique_ptr<SqliteAccessLog>(
          new SqliteAccessLog(std::move(db), std::move(config), id_gen, clock)));
}

core::Result<bool, core::Error> SqliteAccessLog::install() {
  const auto lock = db_->lock();

  auto exists = db_->table_exists(table_name_);
  if (!exists.has_value()) {
    return exists;
  }
  if (exists.value()) {
    return core::Result<bool, core::Error>::ok(true);
  }

  const std::string scope_length = std::to_string(config_.scope_length);
  const std::string schema =
      "CREATE TABLE IF NOT EXISTS " + quoted_table_ +
      " (\n"
      "  id BLOB NOT NULL PRIMARY KEY CHECK (length(id) = 16),\n"
      "  creation_time INTEGER NOT NULL DEFAULT 0,\n"
      "  scope VARCHAR(" + scope_length + ") NOT NULL DEFAULT '' CHECK (length(scope) <= " +
      scope_length +
      "),\n"
      "  remote_origin BLOB NOT NULL DEFAULT (zeroblob(16)) CHECK (length(remote_origin) = 16),\n"
      "  subject_id BLOB NOT NULL DEFAULT (zeroblob(16)) CHECK (length(subject_id) = 16),\n"
      "  object_id BLOB NOT NULL DEFAULT (zeroblob(16)) CHECK (length(object_id) = 16)\n"
      ");\n"
      "CREATE INDEX IF NOT EXISTS " + quote_identifier(table_name_ + "_creation_time") + " ON " +
      quoted_table_ + " (creation_time);\n"
      "CREATE INDEX IF NOT EXISTS " + quote_identifier(table_name_ + "_scope") + " ON " +
      quoted_table_ + " (scope);\n"
      "CREATE INDEX IF NOT EXISTS " + quote_identifier(table_name_ + "_subject_id") + " ON " +
      quoted_table_ + " (subject_id);\n"
      "CREATE INDEX IF NOT EXISTS " + quote_identifier(table_name_ + "_object_id") + " ON " +
      quoted_table_ + " (object_id);\n";

  Transaction txn(*db_);
  if (!txn.is_active()) {
    return core::fail<bool>(core::ErrorCode::kBackend, "Failed to install: " + txn.error());
  }
  auto created = db_->exec(schema);
  if (!created.has_value()) {
    return created;
  }
  return txn.commit();
}

core::Result<bool, core::Error> SqliteAccessLog::uninstall() {
  const auto lock = db_->lock();
  return db_->exec("DROP TABLE IF EXISTS " + quoted_table_);
}

core::Result<domain::LogRecord, core::Error> SqliteAccessLog::create(const NewLogRecord& fields) {
  auto candidate = build_candidate(fields, config_, id_gen_, clock_);
  if (!candidate.has_value()) {
    return candidate;
  }
  const domain::LogRecord& record = candidate.value();

  const auto lock = db_->lock();
  Transaction txn(*db_);
  if (!txn.is_active()) {
    return core::fail<domain::LogRecord>(core::ErrorCode::kBackend,
                                         "Failed to begin create: " + txn.error());
  }

  // Preflight check for an existing id
  LogFilter same_id;
  same_id.ids = std::vector<core::BinaryId>{record.id};
  auto existing = count_locked(same_id);
  if (!existing.has_value()) {
    return core::Result<domain::LogRecord, core::Error>::err(existing.error());
  }
  if (existing.value() > 0) {
    return core::fail<domain::LogRecord>(core::ErrorCode::kCollision,
                                         "Log ID collision: " + record.id.to_string());
  }

  const std::string sql = "INSERT INTO " + quoted_table_ +
                          " (id, creation_time, scope, remote_origin, subject_id, object_id)"
                          " VALUES (?, ?, ?, ?, ?, ?)";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return core::Result<domain::LogRecord, core::Error>::err(
        backend_error("Failed to prepare insert: " + stmt.error()));
  }

  const std::vector<SqlParam> params{
      SqlParam{record.id.bytes},
      SqlParam{std::int64_t{record.creation_time}},
      SqlParam{record.scope},
      SqlParam{record.remote_origin.storage_bytes()},
      SqlParam{record.subject_id.bytes},
      SqlParam{record.object_id.bytes},
  };
  if (bind_params(stmt.get(), params) != SQLITE_OK) {
    return core::Result<domain::LogRecord, core::Error>::err(
        backend_error("Failed to bind insert"));
  }

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    // The primary key decides when two creators raced past the preflight check.
    if (is_unique_violation(rc)) {
      return core::fail<domain::LogRecord>(core::ErrorCode::kCollision,
                                           "Log ID collision: " + record.id.to_string());
    }
    if (rc == SQLITE_CONSTRAINT_CHECK) {
      return core::fail<domain::LogRecord>(core::ErrorCode::kInvalidArgument,
                                           "Log record rejected: " + db_->last_error());
    }
    return core::Result<domain::LogRecord, core::Error>::err(backend_error("Failed to insert"));
  }

  auto committed = txn.commit();
  if (!committed.has_value()) {
    return core::Result<domain::LogRecord, core::Error>::err(committed.error());
  }
  return candidate;
}

core::Result<std::optional<domain::LogRecord>, core::Error> SqliteAccessLog::get(
    const core::BinaryId& id) const {
  using GetResult = core::Result<std::optional<domain::LogRecord>, core::Error>;

  LogFilter filter;
  filter.ids = std::vector<core::BinaryId>{id};

  const auto lock = db_->lock();
  auto logs = search_locked(filter, SortSpec{}, PageSpec{});
  if (!logs.has_value()) {
    return GetResult::err(logs.error());
  }
  const domain::LogRecord* found = logs.value().get(id);
  if (found == nullptr) {
    return GetResult::ok(std::nullopt);
  }
  return GetResult::ok(*found);
}

core::Result<std::int64_t, core::Error> SqliteAccessLog::count(const LogFilter& filter) const {
  const auto lock = db_->lock();
  return count_locked(filter);
}

core::Result<domain::LogCollection, core::Error> SqliteAccessLog::search(
    const LogFilter& filter, const SortSpec& sort, const PageSpec& page) const {
  const auto lock = db_->lock();
  return search_locked(filter, sort, page);
}

core::Result<bool, core::Error> SqliteAccessLog::remove(const core::BinaryId& id) {
  const auto lock = db_->lock();
  auto removed = execute_locked(
      SqlClause{"DELETE FROM " + quoted_table_ + " WHERE id = ?", {SqlParam{id.bytes}}});
  if (!removed.has_value()) {
    return core::Result<bool, core::Error>::err(removed.error());
  }
  return core::Result<bool, core::Error>::ok(removed.value() > 0);
}

core::Result<std::int64_t, core::Error> SqliteAccessLog::prune(
    std::optional<core::UnixSeconds> created_before) {
  // creation_time 0 marks an undated row and is never pruned.
  SqlClause statement{"DELETE FROM " + quoted_table_ + " WHERE creation_time != 0", {}};
  if (created_before.has_value()) {
    append_clause(statement,
                  SqlClause{" AND creation_time < ?", {SqlParam{std::int64_t{*created_before}}}});
  }

  const auto lock = db_->lock();
  return execute_locked(statement);
}

core::Result<std::set<std::string>, core::Error> SqliteAccessLog::unique_scopes() const {
  using ScopesResult = core::Result<std::set<std::string>, core::Error>;

  const auto lock = db_->lock();
  const std::string sql = "SELECT DISTINCT scope FROM " + quoted_table_ + " ORDER BY scope";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return ScopesResult::err(backend_error("Failed to prepare scope query: " + stmt.error()));
  }

  std::set<std::string> scopes;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    const auto* text = sqlite3_column_text(stmt.get(), 0);
    scopes.insert(text != nullptr ? reinterpret_cast<const char*>(text) : "");
  }
  if (rc != SQLITE_DONE) {
    return ScopesResult::err(backend_error("Failed to read scopes"));
  }
  return ScopesResult::ok(std::move(scopes));
}

core::Result<std::int64_t, core::Error> SqliteAccessLog::replace_party_id(
    const core::BinaryId& old_id, const core::BinaryId& new_id) {
  const auto lock = db_->lock();
  Transaction txn(*db_);
  if (!txn.is_active()) {
    return core::fail<std::int64_t>(core::ErrorCode::kBackend,
                                    "Failed to begin id replacement: " + txn.error());
  }

  std::int64_t rewritten = 0;
  for (const char* column : {"subject_id", "object_id"}) {
    const std::string sql = "UPDATE " + quoted_table_ + " SET " + column + " = ? WHERE " +
                            column + " = ?";
    auto updated =
        execute_locked(SqlClause{sql, {SqlParam{new_id.bytes}, SqlParam{old_id.bytes}}});
    if (!updated.has_value()) {
      return updated;
    }
    rewritten += updated.value();
  }

  auto committed = txn.commit();
  if (!committed.has_value()) {
    return core::Result<std::int64_t, core::Error>::err(committed.error());
  }
  return core::Result<std::int64_t, core::Error>::ok(rewritten);
}

core::Result<std::int64_t, core::Error> SqliteAccessLog::update_remote_origins(
    const std::vector<OriginUpdate>& updates) {
  const auto lock = db_->lock();
  Transaction txn(*db_);
  if (!txn.is_active()) {
    return core::fail<std::int64_t>(core::ErrorCode::kBackend,
                                    "Failed to begin origin update: " + txn.error());
  }

  const std::string sql = "UPDATE " + quoted_table_ + " SET remote_origin = ? WHERE id = ?";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return core::Result<std::int64_t, core::Error>::err(
        backend_error("Failed to prepare origin update: " + stmt.error()));
  }

  std::int64_t updated = 0;
  for (const auto& update : updates) {
    stmt.reset();
    const std::vector<SqlParam> params{SqlParam{update.remote_origin.storage_bytes()},
                                       SqlParam{update.id.bytes}};
    if (bind_params(stmt.get(), params) != SQLITE_OK ||
        sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return core::Result<std::int64_t, core::Error>::err(
          backend_error("Failed to update origin of " + update.id.to_string()));
    }
    updated += db_->changes();
  }

  auto committed = txn.commit();
  if (!committed.has_value()) {
    return core::Result<std::int64_t, core::Error>::err(committed.error());
  }
  return core::Result<std::int64_t, core::Error>::ok(updated);
}

core::Result<std::int64_t, core::Error> SqliteAccessLog::count_locked(
    const LogFilter& filter) const {
  SqlClause statement{"SELECT COUNT(*) FROM " + quoted_table_, {}};
  append_clause(statement, build_where_clause(filter));

  PreparedStatement stmt(db_->connection(), statement.sql);
  if (!stmt.is_valid()) {
    return core::Result<std::int64_t, core::Error>::err(
        backend_error("Failed to prepare count: " + stmt.error()));
  }
  if (bind_params(stmt.get(), statement.params) != SQLITE_OK) {
    return core::Result<std::int64_t, core::Error>::err(backend_error("Failed to bind count"));
  }
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return core::Result<std::int64_t, core::Error>::err(backend_error("Failed to count"));
  }
  return core::Result<std::int64_t, core::Error>::ok(sqlite3_column_int64(stmt.get(), 0));
}

core::Result<domain::LogCollection, core::Error> SqliteAccessLog::search_locked(
    const LogFilter& filter, const SortSpec& sort, const PageSpec& page) const {
  using SearchResult = core::Result<domain::LogCollection, core::Error>;

  SqlClause statement{kSelectColumns + quoted_table_, {}};
  append_clause(statement, build_where_clause(filter));
  statement.sql.append(build_order_clause(sort));
  append_clause(statement, build_limit_clause(page));

  PreparedStatement stmt(db_->connection(), statement.sql);
  if (!stmt.is_valid()) {
    return SearchResult::err(backend_error("Failed to prepare search: " + stmt.error()));
  }
  if (bind_params(stmt.get(), statement.params) != SQLITE_OK) {
    return SearchResult::err(backend_error("Failed to bind search"));
  }

  domain::LogCollection logs;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    auto record = row_to_record(stmt.get());
    if (!record.has_value()) {
      return SearchResult::err(record.error());
    }
    logs.add(std::move(record.value()));
  }
  if (rc != SQLITE_DONE) {
    return SearchResult::err(backend_error("Failed to read search results"));
  }
  return SearchResult::ok(std::move(logs));
}

core::Result<std::int64_t, core::Error> SqliteAccessLog::execute_locked(
    const SqlClause& statement) const {
  PreparedStatement stmt(db_->connection(), statement.sql);
  if (!stmt.is_valid()) {
    return core::Result<std::int64_t, core::Error>::err(
        backend_error("Failed to prepare statement: " + stmt.error()));
  }
  if (bind_params(stmt.get(), statement.params) != SQLITE_OK) {
    return core::Result<std::int64_t, core::Error>::err(backend_error("Failed to bind statement"));
  }
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return core::Result<std::int64_t, core::Error>::err(backend_error("Failed to execute"));
  }
  return core::Result<std::int64_t, core::Error>::ok(db_->changes());
}

// Column order: id(0), creation_time(1), scope(2), remote_origin(3),
//               subject_id(4), object_id(5)
core::Result<domain::LogRecord, core::Error> SqliteAccessLog::row_to_record(
    sqlite3_stmt* stmt) const {
  using RecordResult = core::Result<domain::LogRecord, core::Error>;

  const auto read_id = [stmt](int column) {
    const void* blob = sqlite3_column_blob(stmt, column);
    const int size = sqlite3_column_bytes(stmt, column);
    return core::BinaryId::from_bytes(blob, static_cast<std::size_t>(size));
  };

  domain::LogRecord record;

  auto id = read_id(0);
  if (!id.has_value()) {
    return RecordResult::err(backend_error("Corrupt id column: " + id.error().message));
  }
  record.id = id.value();

  record.creation_time = sqlite3_column_int64(stmt, 1);

  const auto* scope_text = sqlite3_column_text(stmt, 2);
  if (scope_text != nullptr) {
    record.scope = reinterpret_cast<const char*>(scope_text);
  }

  const void* origin_blob = sqlite3_column_blob(stmt, 3);
  const int origin_size = sqlite3_column_bytes(stmt, 3);
  auto origin = net::IpAddress::from_storage(origin_blob, static_cast<std::size_t>(origin_size));
  if (!origin.has_value()) {
    return RecordResult::err(backend_error("Corrupt remote_origin column: " +
                                           origin.error().message));
  }
  record.remote_origin = origin.value();

  auto subject = read_id(4);
  if (!subject.has_value()) {
    return RecordResult::err(backend_error("Corrupt subject_id column: " +
                                           subject.error().message));
  }
  record.subject_id = subject.value();

  auto object = read_id(5);
  if (!object.has_value()) {
    return RecordResult::err(backend_error("Corrupt object_id column: " + object.error().message));
  }
  record.object_id = object.value();

  return RecordResult::ok(std::move(record));
}

core::Error SqliteAccessLog::backend_error(const std::string& context) const {
  return core::Error{core::ErrorCode::kBackend, context + ": " + db_->last_error()};
}

}  // namespace alog::storage::sqlite
