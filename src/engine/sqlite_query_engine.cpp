#include "ckmcp/engine/sqlite_query_engine.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <set>
#include <system_error>

namespace ckmcp::engine {

using json = nlohmann::json;

std::string_view engine_error_code_name(EngineErrorCode code) {
  switch (code) {
    case EngineErrorCode::kUnsupported:
      return "UNSUPPORTED";
    case EngineErrorCode::kInvalidArguments:
      return "INVALID_ARGUMENTS";
    case EngineErrorCode::kNotFound:
      return "NOT_FOUND";
    case EngineErrorCode::kBackend:
      return "BACKEND_ERROR";
  }
  return "BACKEND_ERROR";
}

namespace {

constexpr std::size_t kMaxBatchGet = 50;
constexpr std::size_t kMaxBatchSearch = 10;
// Upper bound for numeric arguments such as limit and depth.
constexpr std::int64_t kMaxIntArg = 100000;

constexpr const char* kSymbolColumns =
    "symbol_id, name, kind, module_id, file_path, start_line, end_line, signature, "
    "documentation, visibility";

QueryResult fail(EngineErrorCode code, std::string message) {
  return QueryResult::err(EngineError{.code = code, .message = std::move(message)});
}

QueryResult backend_failure(const Statement& stmt) {
  return fail(EngineErrorCode::kBackend, "index query failed: " + stmt.error());
}

std::optional<std::string> string_arg(const json& args, const char* key) {
  if (!args.is_object() || !args.contains(key) || !args[key].is_string()) {
    return std::nullopt;
  }
  auto value = args[key].get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::int64_t int_arg(const json& args, const char* key, std::int64_t fallback) {
  if (!args.is_object() || !args.contains(key) || !args[key].is_number()) {
    return fallback;
  }
  const auto& raw = args[key];
  if (raw.is_number_unsigned()) {
    return static_cast<std::int64_t>(
        std::min<std::uint64_t>(raw.get<std::uint64_t>(), static_cast<std::uint64_t>(kMaxIntArg)));
  }
  if (raw.is_number_integer()) {
    const auto value = raw.get<std::int64_t>();
    return value > 0 ? std::min(value, kMaxIntArg) : fallback;
  }
  // Compare as double before casting; the cast is only defined inside the int64 range.
  const auto value = raw.get<double>();
  if (!std::isfinite(value) || value < 1.0) {
    return fallback;
  }
  if (value >= static_cast<double>(kMaxIntArg)) {
    return kMaxIntArg;
  }
  return static_cast<std::int64_t>(value);
}

bool bool_arg(const json& args, const char* key) {
  return args.is_object() && args.contains(key) && args[key].is_boolean() &&
         args[key].get<bool>();
}

json symbol_row(const Statement& stmt) {
  json symbol{
      {"symbolId", stmt.column_text(0)},
      {"name", stmt.column_text(1)},
      {"kind", stmt.column_text(2)},
      {"location",
       {
           {"filePath", stmt.column_text(4)},
           {"startLine", stmt.column_int(5)},
           {"endLine", stmt.column_int(6)},
       }},
  };
  if (!stmt.column_is_null(3)) {
    symbol["moduleId"] = stmt.column_text(3);
  }
  if (!stmt.column_is_null(7)) {
    symbol["signature"] = stmt.column_text(7);
  }
  if (!stmt.column_is_null(8)) {
    symbol["documentation"] = stmt.column_text(8);
  }
  if (!stmt.column_is_null(9)) {
    symbol["visibility"] = stmt.column_text(9);
  }
  return symbol;
}

struct SearchRequest {
  std::string query;
  std::optional<std::string> scope;
  std::set<std::string> kinds;
  std::int64_t limit{20};
};

// Exact (case-insensitive) matches first, then shorter names, then alphabetical.
QueryResult run_search(const SqliteDb& db, const SearchRequest& request) {
  std::string sql = std::string("SELECT ") + kSymbolColumns +
                    " FROM symbols WHERE instr(lower(name), lower(?1)) > 0";
  if (request.scope.has_value()) {
    sql += " AND module_id = ?2";
  }
  sql += " ORDER BY lower(name) = lower(?1) DESC, length(name), name, symbol_id";

  Statement stmt(db, sql);
  if (!stmt.is_valid()) {
    return backend_failure(stmt);
  }
  stmt.bind(1, request.query);
  if (request.scope.has_value()) {
    stmt.bind(2, request.scope.value());
  }

  json symbols = json::array();
  bool truncated = false;
  while (stmt.step()) {
    if (!request.kinds.empty() && request.kinds.count(stmt.column_text(2)) == 0) {
      continue;
    }
    if (static_cast<std::int64_t>(symbols.size()) >= request.limit) {
      truncated = true;
      break;
    }
    symbols.push_back(symbol_row(stmt));
  }
  if (stmt.failed()) {
    return backend_failure(stmt);
  }

  return QueryResult::ok(json{
      {"query", request.query},
      {"symbols", symbols},
      {"totalReturned", symbols.size()},
      {"truncated", truncated},
  });
}

std::optional<json> lookup_symbol(const SqliteDb& db, const std::string& symbol_id,
                                  std::string* error) {
  Statement stmt(db, std::string("SELECT ") + kSymbolColumns + " FROM symbols WHERE symbol_id = ?");
  if (!stmt.is_valid()) {
    *error = stmt.error();
    return std::nullopt;
  }
  stmt.bind(1, symbol_id);
  if (stmt.step()) {
    return symbol_row(stmt);
  }
  if (stmt.failed()) {
    *error = stmt.error();
  }
  return std::nullopt;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Construction
// ────────────────────────────────────────────────────────────────

core::Result<std::shared_ptr<SqliteQueryEngine>, std::string> SqliteQueryEngine::open(
    const std::filesystem::path& repo_root) {
  using R = core::Result<std::shared_ptr<SqliteQueryEngine>, std::string>;

  std::error_code ec;
  const auto index_dir = repo_root / kIndexDirName;
  if (!std::filesystem::is_directory(index_dir, ec)) {
    return R::err("Repository not initialized: " + repo_root.string() + " (missing " +
                  kIndexDirName + "/)");
  }

  auto db_result = SqliteDb::open((index_dir / kIndexFileName).string());
  if (!db_result.has_value()) {
    return R::err(db_result.error());
  }
  auto db = db_result.value();

  auto schema = db->ensure_schema();
  if (!schema.has_value()) {
    return R::err(schema.error());
  }

  return R::ok(std::make_shared<SqliteQueryEngine>(std::move(db), repo_root.string()));
}

SqliteQueryEngine::SqliteQueryEngine(std::shared_ptr<SqliteDb> db, std::string repo_path)
    : db_(std::move(db)), repo_path_(std::move(repo_path)) {}

// ────────────────────────────────────────────────────────────────
// Dispatch
// ────────────────────────────────────────────────────────────────

QueryResult SqliteQueryEngine::query(std::string_view operation, const json& arguments) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (operation == "getStatus") {
    return QueryResult::ok(status_locked());
  }
  if (operation == "searchSymbols") {
    return search_symbols(arguments);
  }
  if (operation == "getSymbol") {
    return get_symbol(arguments);
  }
  if (operation == "findReferences") {
    return find_references(arguments);
  }
  if (operation == "getModuleOverview") {
    return module_overview(arguments);
  }
  if (operation == "getArchitecture") {
    return architecture(arguments);
  }
  if (operation == "explainFile") {
    return explain_file(arguments);
  }
  if (operation == "batchGet") {
    return batch_get(arguments);
  }
  if (operation == "batchSearch") {
    return batch_search(arguments);
  }
  return fail(EngineErrorCode::kUnsupported,
              "operation not supported by the SQLite index backend: " + std::string(operation));
}

json SqliteQueryEngine::status() {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_locked();
}

json SqliteQueryEngine::status_locked() {
  const auto symbols = db_->scalar("SELECT COUNT(*) FROM symbols");
  const auto refs = db_->scalar("SELECT COUNT(*) FROM refs");
  const auto modules = db_->scalar("SELECT COUNT(*) FROM modules");
  const bool healthy = symbols.has_value() && refs.has_value() && modules.has_value();
  return json{
      {"backend", "sqlite"},
      {"repoPath", repo_path_},
      {"schemaVersion", db_->schema_version()},
      {"healthy", healthy},
      {"symbols", symbols.value_or(0)},
      {"references", refs.value_or(0)},
      {"modules", modules.value_or(0)},
  };
}

// ────────────────────────────────────────────────────────────────
// Symbols
// ────────────────────────────────────────────────────────────────

QueryResult SqliteQueryEngine::search_symbols(const json& args) {
  auto query = string_arg(args, "query");
  if (!query.has_value()) {
    return fail(EngineErrorCode::kInvalidArguments, "query is required");
  }
  SearchRequest request{
      .query = query.value(),
      .scope = string_arg(args, "scope"),
      .kinds = {},
      .limit = int_arg(args, "limit", 20),
  };
  if (args.contains("kinds") && args["kinds"].is_array()) {
    for (const auto& kind : args["kinds"]) {
      if (kind.is_string()) {
        request.kinds.insert(kind.get<std::string>());
      }
    }
  }
  return run_search(*db_, request);
}

QueryResult SqliteQueryEngine::get_symbol(const json& args) {
  auto symbol_id = string_arg(args, "symbolId");
  if (!symbol_id.has_value()) {
    return fail(EngineErrorCode::kInvalidArguments, "symbolId is required");
  }
  std::string error;
  auto symbol = lookup_symbol(*db_, symbol_id.value(), &error);
  if (!error.empty()) {
    return fail(EngineErrorCode::kBackend, "index query failed: " + error);
  }
  if (!symbol.has_value()) {
    return fail(EngineErrorCode::kNotFound, "symbol not found: " + symbol_id.value());
  }
  return QueryResult::ok(json{{"symbol", symbol.value()}});
}

QueryResult SqliteQueryEngine::find_references(const json& args) {
  auto symbol_id = string_arg(args, "symbolId");
  if (!symbol_id.has_value()) {
    return fail(EngineErrorCode::kInvalidArguments, "symbolId is required");
  }
  std::string error;
  if (!lookup_symbol(*db_, symbol_id.value(), &error).has_value()) {
    if (!error.empty()) {
      return fail(EngineErrorCode::kBackend, "index query failed: " + error);
    }
    return fail(EngineErrorCode::kNotFound, "symbol not found: " + symbol_id.value());
  }

  const auto scope = string_arg(args, "scope");
  const auto limit = int_arg(args, "limit", 100);

  std::string sql =
      "SELECT file_path, line, col, kind, from_symbol_id FROM refs WHERE symbol_id = ?1";
  if (scope.has_value()) {
    sql += " AND file_path LIKE (SELECT path FROM modules WHERE module_id = ?2) || '%'";
  }
  sql += " ORDER BY file_path, line, col";

  Statement stmt(*db_, sql);
  if (!stmt.is_valid()) {
    return backend_failure(stmt);
  }
  stmt.bind(1, symbol_id.value());
  if (scope.has_value()) {
    stmt.bind(2, scope.value());
  }

  json references = json::array();
  std::int64_t total = 0;
  while (stmt.step()) {
    ++total;
    if (static_cast<std::int64_t>(references.size()) >= limit) {
      continue;
    }
    json ref{
        {"filePath", stmt.column_text(0)},
        {"line", stmt.column_int(1)},
        {"column", stmt.column_int(2)},
        {"kind", stmt.column_text(3)},
    };
    if (!stmt.column_is_null(4)) {
      ref["fromSymbolId"] = stmt.column_text(4);
    }
    references.push_back(ref);
  }
  if (stmt.failed()) {
    return backend_failure(stmt);
  }

  return QueryResult::ok(json{
      {"symbolId", symbol_id.value()},
      {"references", references},
      {"totalReferences", total},
      {"truncated", total > static_cast<std::int64_t>(references.size())},
      // Every stored reference was considered; completeness is bounded by the indexer.
      {"completeness", {{"mode", "index"}, {"isComplete", total <= limit}}},
  });
}

// ────────────────────────────────────────────────────────────────
// Modules & files
// ────────────────────────────────────────────────────────────────

QueryResult SqliteQueryEngine::module_overview(const json& args) {
  const auto path = string_arg(args, "path").value_or("");
  auto name = string_arg(args, "name");

  std::string module_id;
  std::string module_path = path;
  {
    Statement stmt(*db_, "SELECT module_id, path, name FROM modules WHERE path = ?1 OR module_id = ?1");
    if (!stmt.is_valid()) {
      return backend_failure(stmt);
    }
    stmt.bind(1, path);
    if (stmt.step()) {
      module_id = stmt.column_text(0);
      module_path = stmt.column_text(1);
      if (!name.has_value()) {
        name = stmt.column_text(2);
      }
    } else if (stmt.failed()) {
      return backend_failure(stmt);
    }
  }

  Statement stmt(*db_,
                 "SELECT kind, COUNT(*) FROM symbols "
                 "WHERE file_path LIKE ?1 || '%' GROUP BY kind ORDER BY kind");
  if (!stmt.is_valid()) {
    return backend_failure(stmt);
  }
  stmt.bind(1, module_path);

  json by_kind = json::object();
  std::int64_t symbol_count = 0;
  while (stmt.step()) {
    by_kind[stmt.column_text(0)] = stmt.column_int(1);
    symbol_count += stmt.column_int(1);
  }
  if (stmt.failed()) {
    return backend_failure(stmt);
  }
  if (module_id.empty() && symbol_count == 0) {
    return fail(EngineErrorCode::kNotFound, "module not found: " + path);
  }

  Statement file_stmt(
      *db_, "SELECT COUNT(DISTINCT file_path) FROM symbols WHERE file_path LIKE ?1 || '%'");
  if (!file_stmt.is_valid()) {
    return backend_failure(file_stmt);
  }
  file_stmt.bind(1, module_path);
  const std::int64_t file_count = file_stmt.step() ? file_stmt.column_int(0) : 0;
  if (file_stmt.failed()) {
    return backend_failure(file_stmt);
  }

  json module{{"path", module_path}, {"name", name.value_or(module_path)}};
  if (!module_id.empty()) {
    module["moduleId"] = module_id;
  }
  return QueryResult::ok(json{
      {"module", module},
      {"size", {{"files", file_count}, {"symbols", symbol_count}}},
      {"symbolsByKind", by_kind},
  });
}

QueryResult SqliteQueryEngine::architecture(const json& args) {
  const bool include_external = bool_arg(args, "includeExternalDeps");

  json modules = json::array();
  std::set<std::string> known;
  {
    Statement stmt(*db_,
                   "SELECT m.module_id, m.path, m.name, m.language, "
                   "(SELECT COUNT(*) FROM symbols s WHERE s.module_id = m.module_id) "
                   "FROM modules m ORDER BY m.module_id");
    if (!stmt.is_valid()) {
      return backend_failure(stmt);
    }
    while (stmt.step()) {
      json module{
          {"moduleId", stmt.column_text(0)},
          {"path", stmt.column_text(1)},
          {"name", stmt.column_text(2)},
          {"symbolCount", stmt.column_int(4)},
      };
      if (!stmt.column_is_null(3)) {
        module["language"] = stmt.column_text(3);
      }
      known.insert(stmt.column_text(0));
      modules.push_back(module);
    }
    if (stmt.failed()) {
      return backend_failure(stmt);
    }
  }

  json edges = json::array();
  json external = json::array();
  Statement stmt(*db_, "SELECT from_module, to_module, kind FROM module_deps ORDER BY from_module, to_module");
  if (!stmt.is_valid()) {
    return backend_failure(stmt);
  }
  while (stmt.step()) {
    const auto to = stmt.column_text(1);
    const bool is_external = known.count(to) == 0;
    if (is_external && !include_external) {
      continue;
    }
    edges.push_back(json{
        {"from", stmt.column_text(0)},
        {"to", to},
        {"kind", stmt.column_text(2)},
        {"external", is_external},
    });
    if (is_external) {
      external.push_back(to);
    }
  }
  if (stmt.failed()) {
    return backend_failure(stmt);
  }

  json result{
      {"modules", modules},
      {"dependencies", edges},
      {"depth", int_arg(args, "depth", 2)},
  };
  if (include_external) {
    result["externalDependencies"] = external;
  }
  return QueryResult::ok(result);
}

QueryResult SqliteQueryEngine::explain_file(const json& args) {
  auto file_path = string_arg(args, "filePath");
  if (!file_path.has_value()) {
    return fail(EngineErrorCode::kInvalidArguments, "filePath is required");
  }

  json defined = json::array();
  {
    Statement stmt(*db_, std::string("SELECT ") + kSymbolColumns +
                             " FROM symbols WHERE file_path = ? ORDER BY start_line, symbol_id");
    if (!stmt.is_valid()) {
      return backend_failure(stmt);
    }
    stmt.bind(1, file_path.value());
    while (stmt.step()) {
      defined.push_back(symbol_row(stmt));
    }
    if (stmt.failed()) {
      return backend_failure(stmt);
    }
  }

  // Files this one references, and files that reference symbols defined here.
  std::map<std::string, std::int64_t> depends_on;
  std::map<std::string, std::int64_t> used_by;
  {
    Statement stmt(*db_,
                   "SELECT s.file_path, COUNT(*) FROM refs r JOIN symbols s ON s.symbol_id = "
                   "r.symbol_id WHERE r.file_path = ?1 AND s.file_path <> ?1 GROUP BY s.file_path");
    if (!stmt.is_valid()) {
      return backend_failure(stmt);
    }
    stmt.bind(1, file_path.value());
    while (stmt.step()) {
      depends_on[stmt.column_text(0)] = stmt.column_int(1);
    }
    if (stmt.failed()) {
      return backend_failure(stmt);
    }
  }
  {
    Statement stmt(*db_,
                   "SELECT r.file_path, COUNT(*) FROM refs r JOIN symbols s ON s.symbol_id = "
                   "r.symbol_id WHERE s.file_path = ?1 AND r.file_path <> ?1 GROUP BY r.file_path");
    if (!stmt.is_valid()) {
      return backend_failure(stmt);
    }
    stmt.bind(1, file_path.value());
    while (stmt.step()) {
      used_by[stmt.column_text(0)] = stmt.column_int(1);
    }
    if (stmt.failed()) {
      return backend_failure(stmt);
    }
  }

  if (defined.empty() && depends_on.empty() && used_by.empty()) {
    return fail(EngineErrorCode::kNotFound, "file not indexed: " + file_path.value());
  }

  auto to_array = [](const std::map<std::string, std::int64_t>& counts) {
    json out = json::array();
    for (const auto& [path, count] : counts) {
      out.push_back(json{{"filePath", path}, {"references", count}});
    }
    return out;
  };

  return QueryResult::ok(json{
      {"filePath", file_path.value()},
      {"symbols", defined},
      {"dependsOn", to_array(depends_on)},
      {"usedBy", to_array(used_by)},
  });
}

// ────────────────────────────────────────────────────────────────
// Batches
// ────────────────────────────────────────────────────────────────

QueryResult SqliteQueryEngine::batch_get(const json& args) {
  if (!args.is_object() || !args.contains("symbolIds") || !args["symbolIds"].is_array()) {
    return fail(EngineErrorCode::kInvalidArguments, "symbolIds must be an array");
  }
  const json& ids = args["symbolIds"];
  if (ids.size() > kMaxBatchGet) {
    return fail(EngineErrorCode::kInvalidArguments,
                "too many symbolIds (max " + std::to_string(kMaxBatchGet) + ")");
  }

  json found = json::object();
  json errors = json::object();
  for (const auto& id : ids) {
    if (!id.is_string()) {
      continue;
    }
    const auto symbol_id = id.get<std::string>();
    std::string error;
    auto symbol = lookup_symbol(*db_, symbol_id, &error);
    if (symbol.has_value()) {
      found[symbol_id] = symbol.value();
    } else {
      errors[symbol_id] = error.empty() ? "symbol not found" : error;
    }
  }
  return QueryResult::ok(json{
      {"symbols", found},
      {"errors", errors},
      {"found", found.size()},
      {"requested", ids.size()},
  });
}

QueryResult SqliteQueryEngine::batch_search(const json& args) {
  if (!args.is_object() || !args.contains("queries") || !args["queries"].is_array()) {
    return fail(EngineErrorCode::kInvalidArguments, "queries must be an array");
  }
  const json& queries = args["queries"];
  if (queries.size() > kMaxBatchSearch) {
    return fail(EngineErrorCode::kInvalidArguments,
                "too many queries (max " + std::to_string(kMaxBatchSearch) + ")");
  }

  json results = json::array();
  for (const auto& entry : queries) {
    auto query = string_arg(entry, "query");
    if (!query.has_value()) {
      results.push_back(json{{"error", "query is required"}});
      continue;
    }
    SearchRequest request{
        .query = query.value(),
        .scope = std::nullopt,
        .kinds = {},
        .limit = int_arg(entry, "limit", 10),
    };
    if (auto kind = string_arg(entry, "kind")) {
      request.kinds.insert(kind.value());
    }
    auto result = run_search(*db_, request);
    if (!result.has_value()) {
      results.push_back(json{{"query", request.query}, {"error", result.error().message}});
      continue;
    }
    results.push_back(result.value());
  }
  return QueryResult::ok(json{{"results", results}});
}

}  // namespace ckmcp::engine
