#pragma once

#include "ckmcp/engine/query_engine.h"
#include "ckmcp/engine/sqlite_db.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace ckmcp::engine {

// Index location relative to a repository root.
constexpr const char* kIndexDirName = ".ckmcp";
constexpr const char* kIndexFileName = "index.db";

// SqliteQueryEngine serves lookups from a repository's SQLite index
// (<repo>/.ckmcp/index.db).
//
// Supported operations: getStatus, searchSymbols, getSymbol, findReferences,
// getModuleOverview, getArchitecture, explainFile, batchGet, batchSearch.
// Everything else reports kUnsupported.
class SqliteQueryEngine final : public IQueryEngine {
 public:
  // Fails when the repository has no .ckmcp directory or the database cannot be opened.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteQueryEngine>, std::string> open(
      const std::filesystem::path& repo_root);

  SqliteQueryEngine(std::shared_ptr<SqliteDb> db, std::string repo_path);
  ~SqliteQueryEngine() override = default;

  SqliteQueryEngine(const SqliteQueryEngine&) = delete;
  SqliteQueryEngine& operator=(const SqliteQueryEngine&) = delete;
  SqliteQueryEngine(SqliteQueryEngine&&) = delete;
  SqliteQueryEngine& operator=(SqliteQueryEngine&&) = delete;

  [[nodiscard]] QueryResult query(std::string_view operation,
                                  const nlohmann::json& arguments) override;
  [[nodiscard]] nlohmann::json status() override;
  [[nodiscard]] const std::string& repo_path() const override { return repo_path_; }

 private:
  QueryResult search_symbols(const nlohmann::json& args);
  QueryResult get_symbol(const nlohmann::json& args);
  QueryResult find_references(const nlohmann::json& args);
  QueryResult module_overview(const nlohmann::json& args);
  QueryResult architecture(const nlohmann::json& args);
  QueryResult explain_file(const nlohmann::json& args);
  QueryResult batch_get(const nlohmann::json& args);
  QueryResult batch_search(const nlohmann::json& args);
  nlohmann::json status_locked();

  std::shared_ptr<SqliteDb> db_;
  std::string repo_path_;
  // One connection; statements are not interleaved across threads.
  std::mutex mutex_;
};

}  // namespace ckmcp::engine
