#include "ckmcp/engine/engine_pool.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <optional>
#include <utility>

namespace ckmcp::engine {

namespace {

std::string default_repo_name(const std::string& repo_path) {
  auto name = std::filesystem::path(repo_path).filename().string();
  return name.empty() ? repo_path : name;
}

}  // namespace

EnginePool::EnginePool(EngineFactory factory, core::IClock& clock, std::size_t capacity)
    : factory_(std::move(factory)), clock_(clock), capacity_(capacity == 0 ? 1 : capacity) {}

EnginePool::~EnginePool() {
  close_all();
}

void EnginePool::set_eviction_listener(EvictionListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_evict_ = std::move(listener);
}

// ────────────────────────────────────────────────────────────────
// Leasing
// ────────────────────────────────────────────────────────────────

EngineLease EnginePool::lease_locked(const std::shared_ptr<Entry>& entry) {
  ++entry->active_ops;
  entry->last_used = clock_.now();
  return EngineLease(entry->engine, entry->repo_name, entry->repo_path,
                     [this, entry]() { release(entry); });
}

void EnginePool::release(const std::shared_ptr<Entry>& entry) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry->active_ops > 0) {
      --entry->active_ops;
    }
  }
  drained_.notify_all();
}

std::shared_ptr<EnginePool::Entry> EnginePool::eviction_candidate_locked() const {
  std::shared_ptr<Entry> victim;
  for (const auto& [path, entry] : entries_) {
    if (path == active_path_ || entry->active_ops > 0) {
      continue;
    }
    if (!victim || entry->last_used < victim->last_used) {
      victim = entry;
    }
  }
  return victim;
}

LeaseResult EnginePool::open_and_lease(const std::string& repo_name,
                                       const std::string& repo_path, bool make_active) {
  auto exhausted = [this]() {
    return LeaseResult::err(PoolError{
        .code = PoolErrorCode::kExhausted,
        .message = "engine pool exhausted: all " + std::to_string(capacity_) +
                   " engines are in use; retry shortly",
    });
  };

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(repo_path);
    if (it != entries_.end()) {
      if (!repo_name.empty()) {
        it->second->repo_name = repo_name;
      }
      if (make_active) {
        active_path_ = repo_path;
      }
      return LeaseResult::ok(lease_locked(it->second));
    }
    if (entries_.size() >= capacity_ && !eviction_candidate_locked()) {
      return exhausted();
    }
  }

  // Opening touches the backend; never under the lock.
  auto opened = factory_(repo_path);
  if (!opened.has_value()) {
    return LeaseResult::err(PoolError{
        .code = PoolErrorCode::kOpenFailed,
        .message = opened.error(),
    });
  }

  // Declared outside the locked scope so an evicted engine is destroyed after unlocking.
  std::shared_ptr<Entry> evicted;
  std::optional<EngineInfo> evicted_info;
  EvictionListener listener;
  LeaseResult result = [&]() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(repo_path);
    if (it == entries_.end()) {
      if (entries_.size() >= capacity_) {
        evicted = eviction_candidate_locked();
        if (!evicted) {
          return exhausted();
        }
        evicted_info = info_locked(*evicted);
        entries_.erase(evicted->repo_path);
        listener = on_evict_;
      }
      auto entry = std::make_shared<Entry>();
      entry->engine = std::move(opened.value());
      entry->repo_path = repo_path;
      entry->repo_name = repo_name.empty() ? default_repo_name(repo_path) : repo_name;
      entry->loaded_at = clock_.now_iso8601();
      it = entries_.emplace(repo_path, std::move(entry)).first;
    }
    if (make_active) {
      active_path_ = repo_path;
    }
    return LeaseResult::ok(lease_locked(it->second));
  }();

  if (listener && evicted_info.has_value()) {
    listener(evicted_info.value());
  }
  return result;
}

LeaseResult EnginePool::acquire() {
  std::string path;
  std::string name;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_path_.empty()) {
      return LeaseResult::err(PoolError{
          .code = PoolErrorCode::kNoActiveRepo,
          .message = "No active repository. Call switchRepo first or set a default.",
      });
    }
    path = active_path_;
    auto it = entries_.find(path);
    if (it != entries_.end()) {
      name = it->second->repo_name;
    }
  }
  return open_and_lease(name, path, false);
}

LeaseResult EnginePool::acquire(const std::string& repo_path) {
  return open_and_lease("", repo_path, false);
}

core::Result<EngineInfo, PoolError> EnginePool::switch_active(const std::string& repo_name,
                                                              const std::string& repo_path) {
  using R = core::Result<EngineInfo, PoolError>;
  auto lease = open_and_lease(repo_name, repo_path, true);
  if (!lease.has_value()) {
    return R::err(lease.error());
  }
  lease.value().release();

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(repo_path);
  if (it == entries_.end()) {
    // Only reachable if close_all() ran concurrently.
    return R::err(PoolError{.code = PoolErrorCode::kOpenFailed, .message = "pool closed"});
  }
  return R::ok(info_locked(*it->second));
}

// ────────────────────────────────────────────────────────────────
// Introspection
// ────────────────────────────────────────────────────────────────

EngineInfo EnginePool::info_locked(const Entry& entry) const {
  const auto idle =
      std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - entry.last_used);
  return EngineInfo{
      .repo_name = entry.repo_name,
      .repo_path = entry.repo_path,
      .loaded_at = entry.loaded_at,
      .idle_ms = idle.count(),
      .active_ops = entry.active_ops,
      .active = entry.repo_path == active_path_,
  };
}

std::optional<EngineInfo> EnginePool::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(active_path_);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return info_locked(*it->second);
}

std::vector<EngineInfo> EnginePool::loaded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<EngineInfo> infos;
  infos.reserve(entries_.size());
  for (const auto& [path, entry] : entries_) {
    infos.push_back(info_locked(*entry));
  }
  std::sort(infos.begin(), infos.end(),
            [](const EngineInfo& a, const EngineInfo& b) { return a.repo_path < b.repo_path; });
  return infos;
}

bool EnginePool::is_loaded(const std::string& repo_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(repo_path) > 0;
}

std::size_t EnginePool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void EnginePool::close_all() {
  std::unordered_map<std::string, std::shared_ptr<Entry>> closing;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this]() {
      for (const auto& [path, entry] : entries_) {
        if (entry->active_ops > 0) {
          return false;
        }
      }
      return true;
    });
    closing.swap(entries_);
    active_path_.clear();
  }
}

}  // namespace ckmcp::engine
