#include "ckmcp/session/session.h"

#include "ckmcp/catalog/fingerprint.h"
#include "ckmcp/catalog/presets.h"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace ckmcp::session {

Session::Session(const std::vector<catalog::Tool>& catalog, std::string_view initial_preset)
    : catalog_(catalog) {
  if (!catalog::is_valid_preset(initial_preset)) {
    throw std::invalid_argument("unknown preset: " + std::string(initial_preset));
  }
  apply_preset_locked(initial_preset);
}

PresetChange Session::apply_preset_locked(std::string_view preset) {
  PresetChange change;
  change.previous = preset_;
  preset_ = std::string(preset);
  visible_ = catalog::filter_and_order_tools(catalog_, preset_);
  fingerprint_ = catalog::toolset_fingerprint(visible_);
  change.current = preset_;
  change.fingerprint = fingerprint_;
  change.tool_count = visible_.size();
  return change;
}

// ────────────────────────────────────────────────────────────────
// Preset state
// ────────────────────────────────────────────────────────────────

ToolsetView Session::toolset() const {
  std::shared_lock lock(mutex_);
  return ToolsetView{
      .preset = preset_,
      .fingerprint = fingerprint_,
      .tools = visible_,
      .expanded = expanded_,
  };
}

std::string Session::active_preset() const {
  std::shared_lock lock(mutex_);
  return preset_;
}

std::string Session::fingerprint() const {
  std::shared_lock lock(mutex_);
  return fingerprint_;
}

bool Session::expanded() const {
  std::shared_lock lock(mutex_);
  return expanded_;
}

core::Result<PresetChange, std::string> Session::set_preset(std::string_view preset) {
  using R = core::Result<PresetChange, std::string>;
  if (!catalog::is_valid_preset(preset)) {
    return R::err("invalid preset: " + std::string(preset));
  }
  std::unique_lock lock(mutex_);
  return R::ok(apply_preset_locked(preset));
}

core::Result<PresetChange, std::string> Session::expand_to(std::string_view preset) {
  using R = core::Result<PresetChange, std::string>;
  if (!catalog::is_valid_preset(preset)) {
    return R::err("invalid preset: " + std::string(preset));
  }
  std::unique_lock lock(mutex_);
  if (expanded_) {
    return R::err("toolset already expanded this session (active preset: " + preset_ + ")");
  }
  expanded_ = true;
  return R::ok(apply_preset_locked(preset));
}

// ────────────────────────────────────────────────────────────────
// Roots
// ────────────────────────────────────────────────────────────────

void Session::set_client_capabilities(const ClientCapabilities& caps) {
  std::unique_lock lock(mutex_);
  roots_supported_ = caps.roots;
  roots_list_changed_ = caps.roots_list_changed;
}

bool Session::roots_supported() const {
  std::shared_lock lock(mutex_);
  return roots_supported_;
}

bool Session::roots_list_changed() const {
  std::shared_lock lock(mutex_);
  return roots_list_changed_;
}

void Session::disable_roots() {
  std::unique_lock lock(mutex_);
  roots_supported_ = false;
}

void Session::set_roots(std::vector<Root> roots) {
  std::unique_lock lock(mutex_);
  roots_ = std::move(roots);
}

std::vector<Root> Session::roots() const {
  std::shared_lock lock(mutex_);
  return roots_;
}

// ────────────────────────────────────────────────────────────────
// Pending server-initiated requests
// ────────────────────────────────────────────────────────────────

std::int64_t Session::next_request_id() {
  std::unique_lock lock(mutex_);
  return pending_.next_id();
}

std::future<protocol::JsonRpcMessage> Session::register_pending(std::int64_t id) {
  std::unique_lock lock(mutex_);
  return pending_.register_request(id);
}

bool Session::resolve_pending(std::int64_t id, protocol::JsonRpcMessage message) {
  std::unique_lock lock(mutex_);
  return pending_.resolve(id, std::move(message));
}

bool Session::cancel_pending(std::int64_t id) {
  std::unique_lock lock(mutex_);
  return pending_.cancel(id);
}

std::size_t Session::cancel_all_pending() {
  std::unique_lock lock(mutex_);
  return pending_.cancel_all();
}

std::size_t Session::pending_count() const {
  std::shared_lock lock(mutex_);
  return pending_.size();
}

}  // namespace ckmcp::session
