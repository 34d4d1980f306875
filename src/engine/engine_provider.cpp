#include "ckmcp/engine/engine_provider.h"

#include <utility>

namespace ckmcp::engine {

std::string_view pool_error_code_name(PoolErrorCode code) {
  switch (code) {
    case PoolErrorCode::kNoActiveRepo:
      return "NO_ACTIVE_REPO";
    case PoolErrorCode::kOpenFailed:
      return "OPEN_FAILED";
    case PoolErrorCode::kExhausted:
      return "POOL_EXHAUSTED";
    case PoolErrorCode::kUnsupported:
      return "UNSUPPORTED";
  }
  return "OPEN_FAILED";
}

EngineLease::EngineLease(std::shared_ptr<IQueryEngine> engine, std::string repo_name,
                         std::string repo_path, Releaser releaser)
    : engine_(std::move(engine)),
      repo_name_(std::move(repo_name)),
      repo_path_(std::move(repo_path)),
      releaser_(std::move(releaser)) {}

EngineLease::~EngineLease() {
  release();
}

EngineLease::EngineLease(EngineLease&& other) noexcept
    : engine_(std::move(other.engine_)),
      repo_name_(std::move(other.repo_name_)),
      repo_path_(std::move(other.repo_path_)),
      releaser_(std::exchange(other.releaser_, nullptr)) {}

EngineLease& EngineLease::operator=(EngineLease&& other) noexcept {
  if (this != &other) {
    release();
    engine_ = std::move(other.engine_);
    repo_name_ = std::move(other.repo_name_);
    repo_path_ = std::move(other.repo_path_);
    releaser_ = std::exchange(other.releaser_, nullptr);
  }
  return *this;
}

void EngineLease::release() {
  if (releaser_) {
    auto releaser = std::exchange(releaser_, nullptr);
    releaser();
  }
}

}  // namespace ckmcp::engine
