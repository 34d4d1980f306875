#include "ckmcp/engine/sqlite_db.h"

#include <sqlite3.h>

namespace ckmcp::engine {

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void Statement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

// Index schema v1: symbols, references between them, and the module graph.
constexpr const char* kIndexSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS modules (
  module_id TEXT PRIMARY KEY,
  path TEXT NOT NULL,
  name TEXT NOT NULL,
  language TEXT
);

CREATE TABLE IF NOT EXISTS module_deps (
  from_module TEXT NOT NULL,
  to_module TEXT NOT NULL,
  kind TEXT NOT NULL DEFAULT 'import',
  PRIMARY KEY(from_module, to_module)
);

CREATE TABLE IF NOT EXISTS symbols (
  symbol_id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  kind TEXT NOT NULL,
  module_id TEXT,
  file_path TEXT NOT NULL,
  start_line INTEGER NOT NULL,
  end_line INTEGER NOT NULL,
  signature TEXT,
  documentation TEXT,
  visibility TEXT
);

CREATE INDEX IF NOT EXISTS idx_symbols_name ON symbols(name);
CREATE INDEX IF NOT EXISTS idx_symbols_file ON symbols(file_path);

CREATE TABLE IF NOT EXISTS refs (
  symbol_id TEXT NOT NULL,
  file_path TEXT NOT NULL,
  line INTEGER NOT NULL,
  col INTEGER NOT NULL DEFAULT 0,
  kind TEXT NOT NULL DEFAULT 'reference',
  from_symbol_id TEXT
);

CREATE INDEX IF NOT EXISTS idx_refs_symbol ON refs(symbol_id);
CREATE INDEX IF NOT EXISTS idx_refs_file ON refs(file_path);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using R = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* db = nullptr;
  int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return R::err("Failed to open index database: " + error);
  }

  // Readers wait for a concurrent indexer instead of failing with SQLITE_BUSY.
  sqlite3_busy_timeout(db, 2000);

  return R::ok(std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::schema_version() const {
  return static_cast<int>(
      scalar("SELECT version FROM schema_version ORDER BY version DESC LIMIT 1").value_or(0));
}

core::Result<bool, std::string> SqliteDb::ensure_schema() {
  if (schema_version() >= kIndexSchemaVersion) {
    return core::Result<bool, std::string>::ok(true);
  }
  auto applied = exec(kIndexSchemaV1);
  if (!applied.has_value()) {
    return core::Result<bool, std::string>::err("Failed to apply index schema: " +
                                                 applied.error());
  }
  return applied;
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

std::optional<std::int64_t> SqliteDb::scalar(const std::string& sql) const {
  Statement stmt(*this, sql);
  if (!stmt.is_valid() || !stmt.step()) {
    return std::nullopt;
  }
  return stmt.column_int(0);
}

// ────────────────────────────────────────────────────────────────
// Statement
// ────────────────────────────────────────────────────────────────

Statement::Statement(const SqliteDb& db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  int rc = sqlite3_prepare_v2(db.connection(), sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db.connection());
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

Statement& Statement::bind(int index, const std::string& value) {
  if (stmt_) {
    sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
  }
  return *this;
}

Statement& Statement::bind(int index, std::int64_t value) {
  if (stmt_) {
    sqlite3_bind_int64(stmt_.get(), index, value);
  }
  return *this;
}

bool Statement::step() {
  if (!stmt_ || failed_) {
    return false;
  }
  const int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc != SQLITE_DONE) {
    failed_ = true;
    error_ = sqlite3_errmsg(sqlite3_db_handle(stmt_.get()));
  }
  return false;
}

std::string Statement::column_text(int index) const {
  const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
  if (text == nullptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

std::int64_t Statement::column_int(int index) const {
  return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
  return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

}  // namespace ckmcp::engine
