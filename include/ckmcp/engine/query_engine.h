#pragma once

#include "ckmcp/core/result.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace ckmcp::engine {

enum class EngineErrorCode {
  kUnsupported,       // backend has no implementation of this operation
  kInvalidArguments,  // required argument missing or ill-typed
  kNotFound,          // symbol, file or module absent from the index
  kBackend,           // storage failure
};

[[nodiscard]] std::string_view engine_error_code_name(EngineErrorCode code);

struct EngineError {
  EngineErrorCode code{EngineErrorCode::kBackend};  // NOLINT(readability-identifier-naming)
  std::string message;                              // NOLINT(readability-identifier-naming)
};

using QueryResult = core::Result<nlohmann::json, EngineError>;

// IQueryEngine answers code-intelligence queries for one repository.
//
// Operations are named after the tools that reach them ("searchSymbols", "getSymbol", ...)
// and take the tool's arguments object verbatim. The result is an opaque JSON payload.
// Implementations must tolerate calls from more than one thread.
class IQueryEngine {
 public:
  virtual ~IQueryEngine() = default;

  [[nodiscard]] virtual QueryResult query(std::string_view operation,
                                          const nlohmann::json& arguments) = 0;

  // Cheap health summary for status reports; never fails.
  [[nodiscard]] virtual nlohmann::json status() = 0;

  [[nodiscard]] virtual const std::string& repo_path() const = 0;

 protected:
  IQueryEngine() = default;
  IQueryEngine(const IQueryEngine&) = default;
  IQueryEngine& operator=(const IQueryEngine&) = default;
  IQueryEngine(IQueryEngine&&) = default;
  IQueryEngine& operator=(IQueryEngine&&) = default;
};

}  // namespace ckmcp::engine
