#pragma once

#include "ckmcp/core/clock.h"
#include "ckmcp/engine/engine_provider.h"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ckmcp::engine {

constexpr std::size_t kDefaultMaxEngines = 5;

// Opens an engine for a repository root.
using EngineFactory =
    std::function<core::Result<std::shared_ptr<IQueryEngine>, std::string>(const std::string&)>;

// Called with the evicted entry's last view, outside the pool lock.
using EvictionListener = std::function<void(const EngineInfo&)>;

// EnginePool is a bounded cache of engines keyed by repository path.
//
// A miss opens the engine outside the lock. When the pool is full, the idle entry
// (no live leases) with the oldest last use is closed to make room; the active repository
// is never evicted. If no entry is idle the acquire is denied with a retryable kExhausted
// error rather than waiting or closing an engine in use.
class EnginePool final : public IEngineProvider {
 public:
  EnginePool(EngineFactory factory, core::IClock& clock,
             std::size_t capacity = kDefaultMaxEngines);
  ~EnginePool() override;

  EnginePool(const EnginePool&) = delete;
  EnginePool& operator=(const EnginePool&) = delete;
  EnginePool(EnginePool&&) = delete;
  EnginePool& operator=(EnginePool&&) = delete;

  [[nodiscard]] LeaseResult acquire() override;
  [[nodiscard]] LeaseResult acquire(const std::string& repo_path) override;
  [[nodiscard]] core::Result<EngineInfo, PoolError> switch_active(
      const std::string& repo_name, const std::string& repo_path) override;

  [[nodiscard]] std::optional<EngineInfo> active() const override;
  [[nodiscard]] std::vector<EngineInfo> loaded() const override;
  [[nodiscard]] bool is_loaded(const std::string& repo_path) const override;

  [[nodiscard]] bool multi_repo() const override { return true; }
  [[nodiscard]] std::size_t capacity() const override { return capacity_; }
  [[nodiscard]] std::size_t size() const;

  void set_eviction_listener(EvictionListener listener);

  void close_all() override;

 private:
  struct Entry {
    std::shared_ptr<IQueryEngine> engine;
    std::string repo_path;
    std::string repo_name;
    std::string loaded_at;
    core::TimePoint last_used{};
    int active_ops{0};
  };

  // Lease an entry; the pool lock is held.
  EngineLease lease_locked(const std::shared_ptr<Entry>& entry);
  void release(const std::shared_ptr<Entry>& entry);

  // Oldest idle, non-active entry; nullptr when none qualifies. Lock held.
  std::shared_ptr<Entry> eviction_candidate_locked() const;

  // Look up or open, then lease. When make_active is set, records the entry as active.
  LeaseResult open_and_lease(const std::string& repo_name, const std::string& repo_path,
                             bool make_active);

  EngineInfo info_locked(const Entry& entry) const;

  EngineFactory factory_;
  core::IClock& clock_;
  std::size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable drained_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
  std::string active_path_;
  EvictionListener on_evict_;
};

}  // namespace ckmcp::engine
