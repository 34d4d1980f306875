#pragma once

#include "ckmcp/catalog/tool.h"
#include "ckmcp/core/result.h"
#include "ckmcp/protocol/jsonrpc.h"
#include "ckmcp/session/pending_requests.h"
#include "ckmcp/session/roots.h"

#include <cstddef>
#include <cstdint>
#include <future>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ckmcp::session {

// ToolsetView is a consistent snapshot of what tools/list exposes.
struct ToolsetView {
  std::string preset;                   // NOLINT(readability-identifier-naming)
  std::string fingerprint;              // NOLINT(readability-identifier-naming)
  std::vector<catalog::Tool> tools;     // NOLINT(readability-identifier-naming)
  bool expanded{false};                 // NOLINT(readability-identifier-naming)
};

struct PresetChange {
  std::string previous;     // NOLINT(readability-identifier-naming)
  std::string current;      // NOLINT(readability-identifier-naming)
  std::string fingerprint;  // NOLINT(readability-identifier-naming)
  std::size_t tool_count{};  // NOLINT(readability-identifier-naming)
};

// Session owns the mutable per-connection state: active preset with its filtered tool list
// and fingerprint, the one-way expansion latch, client roots, and the pending-request
// registry. One std::shared_mutex guards all of it; readers share, transitions are
// exclusive. No method calls out to an engine while holding the lock.
class Session {
 public:
  // catalog must outlive the session. Throws std::invalid_argument for an unknown preset.
  Session(const std::vector<catalog::Tool>& catalog, std::string_view initial_preset);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;
  Session(Session&&) = delete;
  Session& operator=(Session&&) = delete;

  // ─── Preset state ───

  [[nodiscard]] ToolsetView toolset() const;
  [[nodiscard]] std::string active_preset() const;
  [[nodiscard]] std::string fingerprint() const;
  [[nodiscard]] bool expanded() const;
  [[nodiscard]] std::size_t catalog_size() const { return catalog_.size(); }

  // Replace the active preset; the filtered list and fingerprint change with it.
  [[nodiscard]] core::Result<PresetChange, std::string> set_preset(std::string_view preset);

  // One-shot expansion: fails once the latch is set, otherwise switches preset and sets it.
  [[nodiscard]] core::Result<PresetChange, std::string> expand_to(std::string_view preset);

  // ─── Roots ───

  void set_client_capabilities(const ClientCapabilities& caps);
  [[nodiscard]] bool roots_supported() const;
  [[nodiscard]] bool roots_list_changed() const;
  // Permanent for the rest of the session.
  void disable_roots();
  // Wholesale replacement.
  void set_roots(std::vector<Root> roots);
  [[nodiscard]] std::vector<Root> roots() const;

  // ─── Pending server-initiated requests ───

  [[nodiscard]] std::int64_t next_request_id();
  [[nodiscard]] std::future<protocol::JsonRpcMessage> register_pending(std::int64_t id);
  bool resolve_pending(std::int64_t id, protocol::JsonRpcMessage message);
  bool cancel_pending(std::int64_t id);
  std::size_t cancel_all_pending();
  [[nodiscard]] std::size_t pending_count() const;

 private:
  // Caller holds the exclusive lock.
  PresetChange apply_preset_locked(std::string_view preset);

  const std::vector<catalog::Tool>& catalog_;

  mutable std::shared_mutex mutex_;
  std::string preset_;
  std::string fingerprint_;
  std::vector<catalog::Tool> visible_;
  bool expanded_{false};

  bool roots_supported_{false};
  bool roots_list_changed_{false};
  std::vector<Root> roots_;

  PendingRequests pending_;
};

}  // namespace ckmcp::session
