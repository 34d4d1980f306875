#pragma once

#include "ckmcp/core/result.h"
#include "ckmcp/engine/query_engine.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ckmcp::engine {

enum class PoolErrorCode {
  kNoActiveRepo,  // acquire() before any repository was made active
  kOpenFailed,    // the engine factory could not open the repository
  kExhausted,     // at capacity and every entry is busy or active; retry later
  kUnsupported,   // operation needs multi-repo mode
};

[[nodiscard]] std::string_view pool_error_code_name(PoolErrorCode code);

struct PoolError {
  PoolErrorCode code{PoolErrorCode::kOpenFailed};  // NOLINT(readability-identifier-naming)
  std::string message;                             // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool retryable() const { return code == PoolErrorCode::kExhausted; }
};

// EngineInfo is a read-only view of one loaded engine.
struct EngineInfo {
  std::string repo_name;      // NOLINT(readability-identifier-naming)
  std::string repo_path;      // NOLINT(readability-identifier-naming)
  std::string loaded_at;      // NOLINT(readability-identifier-naming)
  std::int64_t idle_ms{0};    // NOLINT(readability-identifier-naming)
  int active_ops{0};          // NOLINT(readability-identifier-naming)
  bool active{false};         // NOLINT(readability-identifier-naming)
};

// EngineLease is a scoped borrow of an engine. The provider counts the lease as an
// in-flight operation until it is destroyed or release() is called; a leased engine is
// never closed. Move-only.
class EngineLease {
 public:
  using Releaser = std::function<void()>;

  EngineLease(std::shared_ptr<IQueryEngine> engine, std::string repo_name,
              std::string repo_path, Releaser releaser);
  ~EngineLease();

  EngineLease(const EngineLease&) = delete;
  EngineLease& operator=(const EngineLease&) = delete;
  EngineLease(EngineLease&& other) noexcept;
  EngineLease& operator=(EngineLease&& other) noexcept;

  [[nodiscard]] IQueryEngine& engine() const { return *engine_; }
  IQueryEngine* operator->() const { return engine_.get(); }

  [[nodiscard]] const std::string& repo_name() const { return repo_name_; }
  [[nodiscard]] const std::string& repo_path() const { return repo_path_; }

  // Idempotent.
  void release();

 private:
  std::shared_ptr<IQueryEngine> engine_;
  std::string repo_name_;
  std::string repo_path_;
  Releaser releaser_;
};

using LeaseResult = core::Result<EngineLease, PoolError>;

// IEngineProvider hands out engines to tool handlers. Two implementations exist: the
// legacy single-engine provider and the bounded multi-repo EnginePool.
class IEngineProvider {
 public:
  virtual ~IEngineProvider() = default;

  // Borrow the active repository's engine.
  [[nodiscard]] virtual LeaseResult acquire() = 0;

  // Borrow the engine for repo_path, opening it on a miss. The single-engine provider
  // ignores repo_path.
  [[nodiscard]] virtual LeaseResult acquire(const std::string& repo_path) = 0;

  // Make (name, path) the active repository, opening it if necessary.
  [[nodiscard]] virtual core::Result<EngineInfo, PoolError> switch_active(
      const std::string& repo_name, const std::string& repo_path) = 0;

  [[nodiscard]] virtual std::optional<EngineInfo> active() const = 0;
  [[nodiscard]] virtual std::vector<EngineInfo> loaded() const = 0;
  [[nodiscard]] virtual bool is_loaded(const std::string& repo_path) const = 0;

  [[nodiscard]] virtual bool multi_repo() const = 0;
  [[nodiscard]] virtual std::size_t capacity() const = 0;

  // Wait for in-flight leases to drain, then close every engine.
  virtual void close_all() = 0;

 protected:
  IEngineProvider() = default;
  IEngineProvider(const IEngineProvider&) = default;
  IEngineProvider& operator=(const IEngineProvider&) = default;
  IEngineProvider(IEngineProvider&&) = default;
  IEngineProvider& operator=(IEngineProvider&&) = default;
};

}  // namespace ckmcp::engine
