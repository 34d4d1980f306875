#include "ckmcp/engine/single_engine_provider.h"

#include <chrono>
#include <filesystem>
#include <utility>

namespace ckmcp::engine {

SingleEngineProvider::SingleEngineProvider(std::shared_ptr<IQueryEngine> engine,
                                           std::string repo_path, core::IClock& clock)
    : clock_(clock),
      repo_path_(std::move(repo_path)),
      repo_name_(std::filesystem::path(repo_path_).filename().string()),
      loaded_at_(clock.now_iso8601()),
      engine_(std::move(engine)),
      last_used_(clock.now()) {}

SingleEngineProvider::~SingleEngineProvider() {
  close_all();
}

LeaseResult SingleEngineProvider::acquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!engine_) {
    return LeaseResult::err(PoolError{
        .code = PoolErrorCode::kOpenFailed,
        .message = "engine closed",
    });
  }
  ++active_ops_;
  last_used_ = clock_.now();
  return LeaseResult::ok(EngineLease(engine_, repo_name_, repo_path_, [this]() {
    {
      std::lock_guard<std::mutex> release_lock(mutex_);
      --active_ops_;
    }
    drained_.notify_all();
  }));
}

LeaseResult SingleEngineProvider::acquire(const std::string& /*repo_path*/) {
  return acquire();
}

core::Result<EngineInfo, PoolError> SingleEngineProvider::switch_active(
    const std::string& /*repo_name*/, const std::string& /*repo_path*/) {
  return core::Result<EngineInfo, PoolError>::err(PoolError{
      .code = PoolErrorCode::kUnsupported,
      .message = "Multi-repo mode not enabled. Start MCP server with a registry.",
  });
}

EngineInfo SingleEngineProvider::info_locked() const {
  return EngineInfo{
      .repo_name = repo_name_,
      .repo_path = repo_path_,
      .loaded_at = loaded_at_,
      .idle_ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - last_used_)
                     .count(),
      .active_ops = active_ops_,
      .active = true,
  };
}

std::optional<EngineInfo> SingleEngineProvider::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!engine_) {
    return std::nullopt;
  }
  return info_locked();
}

std::vector<EngineInfo> SingleEngineProvider::loaded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!engine_) {
    return {};
  }
  return {info_locked()};
}

bool SingleEngineProvider::is_loaded(const std::string& /*repo_path*/) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_ != nullptr;
}

void SingleEngineProvider::close_all() {
  std::shared_ptr<IQueryEngine> closing;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this]() { return active_ops_ == 0; });
    closing = std::move(engine_);
  }
}

}  // namespace ckmcp::engine
