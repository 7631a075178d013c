#include "alog/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace alog::storage::sqlite {

namespace {

// Milliseconds a statement waits on a lock held by another connection.
constexpr int kBusyTimeoutMs = 5000;

}  // namespace

// Deleter implementations
void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, core::Error> SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return core::fail<std::shared_ptr<SqliteDb>>(core::ErrorCode::kBackend,
                                                 "Failed to open database: " + error);
  }

  // Constraint failures are classified by extended result code (primary key vs check).
  sqlite3_extended_result_codes(db, 1);

  rc = sqlite3_busy_timeout(db, kBusyTimeoutMs);
  if (rc != SQLITE_OK) {
    std::string error = sqlite3_errmsg(db);
    sqlite3_close(db);
    return core::fail<std::shared_ptr<SqliteDb>>(core::ErrorCode::kBackend,
                                                 "Failed to set busy timeout: " + error);
  }

  return core::Result<std::shared_ptr<SqliteDb>, core::Error>::ok(
      std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

core::Result<bool, core::Error> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::fail<bool>(core::ErrorCode::kBackend, "SQL execution failed: " + error);
  }

  return core::Result<bool, core::Error>::ok(true);
}

core::Result<bool, core::Error> SqliteDb::table_exists(const std::string& name) const {
  const char* sql = "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?";

  PreparedStatement stmt(db_.get(), sql);
  if (!stmt.is_valid()) {
    return core::fail<bool>(core::ErrorCode::kBackend, "Failed to check table: " + stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return core::Result<bool, core::Error>::ok(true);
  }
  if (rc == SQLITE_DONE) {
    return core::Result<bool, core::Error>::ok(false);
  }
  return core::fail<bool>(core::ErrorCode::kBackend, "Failed to check table: " + last_error());
}

std::string SqliteDb::last_error() const {
  return sqlite3_errmsg(db_.get());
}

std::int64_t SqliteDb::changes() const {
  return sqlite3_changes(db_.get());
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    stmt_ = nullptr;
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

Transaction::Transaction(SqliteDb& db) : db_(db) {
  auto begin = db_.exec("BEGIN IMMEDIATE");
  if (begin.has_value()) {
    active_ = true;
  } else {
    error_ = begin.error().message;
  }
}

Transaction::~Transaction() {
  if (active_) {
    // Nothing to report from a destructor; a failed rollback leaves SQLite to
    // abandon the transaction when the connection closes.
    (void)db_.exec("ROLLBACK");
  }
}

core::Result<bool, core::Error> Transaction::commit() {
  if (!active_) {
    return core::fail<bool>(core::ErrorCode::kBackend, "Transaction is not active");
  }
  auto result = db_.exec("COMMIT");
  if (result.has_value()) {
    active_ = false;
  }
  return result;
}

}  // namespace alog::storage::sqlite
