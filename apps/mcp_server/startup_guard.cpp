#include "startup_guard.h"

#include "ckmcp/catalog/presets.h"

namespace ckmcp::mcp {

namespace {

std::string preset_list() {
  std::string joined;
  for (const auto& name : catalog::valid_presets()) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += name;
  }
  return joined;
}

}  // namespace

std::string validate_mcp_server_config(const McpServerConfig& config) {
  if (config.parse_error.has_value()) {
    return "Error: " + config.parse_error.value();
  }

  if (!catalog::is_valid_preset(config.preset)) {
    return "Error: --preset '" + config.preset +
           "' is not a known preset.\n"
           "       Valid presets: " +
           preset_list();
  }

  if (config.page_size <= 0) {
    return "Error: --page-size must be positive";
  }
  if (config.max_engines == 0) {
    return "Error: --max-engines must be at least 1";
  }
  if (config.roots_timeout_ms <= 0) {
    return "Error: --roots-timeout-ms must be positive";
  }
  if (config.max_message_bytes == 0) {
    return "Error: --max-message-bytes must be positive";
  }

  return "";
}

}  // namespace ckmcp::mcp
