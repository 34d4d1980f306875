#pragma once

#include "ckmcp/core/result.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace ckmcp::engine {

// Index schema version this build reads and creates.
constexpr int kIndexSchemaVersion = 1;

// SqliteDb owns one connection to a repository index database.
// RAII: the connection closes when the last shared owner goes away.
class SqliteDb {
 public:
  // Open or create database at path. ":memory:" gives a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 when no schema has been applied.
  [[nodiscard]] int schema_version() const;

  // Create the index tables if missing. Idempotent.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Single integer from a query such as SELECT COUNT(*); nullopt on any failure.
  [[nodiscard]] std::optional<std::int64_t> scalar(const std::string& sql) const;

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// Statement is a prepared statement with positional bind helpers (1-based, like SQLite).
class Statement {
 public:
  Statement(const SqliteDb& db, const std::string& sql);
  ~Statement() = default;

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&&) = delete;
  Statement& operator=(Statement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }

  Statement& bind(int index, const std::string& value);
  Statement& bind(int index, std::int64_t value);

  // Advance to the next row; false when done or on error (see failed()).
  [[nodiscard]] bool step();
  [[nodiscard]] bool failed() const { return failed_; }

  [[nodiscard]] std::string column_text(int index) const;
  [[nodiscard]] std::int64_t column_int(int index) const;
  [[nodiscard]] bool column_is_null(int index) const;

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
  bool failed_{false};
};

}  // namespace ckmcp::engine
