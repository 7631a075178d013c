#pragma once

#include "alog/core/result.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace alog::storage::sqlite {

// SqliteDb manages a SQLite database connection.
// Responsibilities:
// - Open/close database connection
// - Execute ad-hoc statements and report engine errors
// - Answer table existence checks for idempotent installs
//
// Design principles:
// - RAII: connection managed via unique_ptr with custom deleter
// - Explicit error handling via Result<T,E>
// - One connection per instance; every store built on it serializes through lock()
class SqliteDb {
 public:
  // Open or create database at path.
  // If path is ":memory:", creates in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, core::Error> open(
      const std::string& path);

  ~SqliteDb() = default;

  // Disable copy/move (unique ownership)
  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Execute SQL statement (for non-query operations)
  [[nodiscard]] core::Result<bool, core::Error> exec(const std::string& sql);

  [[nodiscard]] core::Result<bool, core::Error> table_exists(const std::string& name) const;

  // Message of the most recent failure on this connection.
  [[nodiscard]] std::string last_error() const;

  // Rows modified by the most recent INSERT/UPDATE/DELETE.
  [[nodiscard]] std::int64_t changes() const;

  // Exclusive use of the connection. Stores hold it for a whole operation, covering any
  // Transaction and the changes() read that follows, so operations from different stores
  // on one connection never interleave.
  [[nodiscard]] std::unique_lock<std::mutex> lock() const {
    return std::unique_lock<std::mutex>(mutex_);
  }

  // Get raw connection (for prepared statements)
  // Should be used only by store implementations
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
  mutable std::mutex mutex_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  // Returns true if statement was prepared successfully
  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }

  // Get error message if preparation failed
  [[nodiscard]] std::string error() const { return error_; }

  // Get raw statement (for binding/stepping)
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // Reset statement for reuse
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

// RAII write transaction (BEGIN IMMEDIATE). Rolls back on destruction unless committed.
class Transaction {
 public:
  explicit Transaction(SqliteDb& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  // Returns true if BEGIN succeeded
  [[nodiscard]] bool is_active() const { return active_; }

  // Get error message if BEGIN failed
  [[nodiscard]] std::string error() const { return error_; }

  [[nodiscard]] core::Result<bool, core::Error> commit();

 private:
  SqliteDb& db_;
  bool active_{false};
  std::string error_;
};

}  // namespace alog::storage::sqlite
