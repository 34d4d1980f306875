#pragma once

#include "ckmcp/core/clock.h"
#include "ckmcp/engine/engine_provider.h"
#include "ckmcp/repos/registry.h"
#include "ckmcp/session/session.h"

#include "config.h"
#include "message_writer.h"
#include "roots_exchange.h"

namespace ckmcp::mcp {

// ServerContext holds all process-lifetime service references passed to every handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  session::Session& session;          // NOLINT(readability-identifier-naming)
  engine::IEngineProvider& engines;   // NOLINT(readability-identifier-naming)
  // nullptr in legacy single-engine mode.
  const repos::RepoRegistry* registry;  // NOLINT(readability-identifier-naming)
  RootsExchange& roots;               // NOLINT(readability-identifier-naming)
  MessageWriter& writer;              // NOLINT(readability-identifier-naming)
  core::IClock& clock;                // NOLINT(readability-identifier-naming)
  McpServerConfig& config;            // NOLINT(readability-identifier-naming)
};

}  // namespace ckmcp::mcp
