#pragma once

#include "ckmcp/core/clock.h"
#include "ckmcp/engine/engine_provider.h"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace ckmcp::engine {

// SingleEngineProvider is the legacy mode: one engine, opened at startup, handed out for
// every acquire regardless of the requested path. Repository switching is unsupported.
class SingleEngineProvider final : public IEngineProvider {
 public:
  SingleEngineProvider(std::shared_ptr<IQueryEngine> engine, std::string repo_path,
                       core::IClock& clock);
  ~SingleEngineProvider() override;

  SingleEngineProvider(const SingleEngineProvider&) = delete;
  SingleEngineProvider& operator=(const SingleEngineProvider&) = delete;
  SingleEngineProvider(SingleEngineProvider&&) = delete;
  SingleEngineProvider& operator=(SingleEngineProvider&&) = delete;

  [[nodiscard]] LeaseResult acquire() override;
  [[nodiscard]] LeaseResult acquire(const std::string& repo_path) override;
  [[nodiscard]] core::Result<EngineInfo, PoolError> switch_active(
      const std::string& repo_name, const std::string& repo_path) override;

  [[nodiscard]] std::optional<EngineInfo> active() const override;
  [[nodiscard]] std::vector<EngineInfo> loaded() const override;
  [[nodiscard]] bool is_loaded(const std::string& repo_path) const override;

  [[nodiscard]] bool multi_repo() const override { return false; }
  [[nodiscard]] std::size_t capacity() const override { return 1; }

  void close_all() override;

 private:
  EngineInfo info_locked() const;

  core::IClock& clock_;
  std::string repo_path_;
  std::string repo_name_;
  std::string loaded_at_;

  mutable std::mutex mutex_;
  std::condition_variable drained_;
  std::shared_ptr<IQueryEngine> engine_;
  core::TimePoint last_used_;
  int active_ops_{0};
};

}  // namespace ckmcp::engine
