#include "config.h"

#include <charconv>
#include <functional>
#include <iostream>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace ckmcp::mcp {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Definition
// ────────────────────────────────────────────────────────────────

struct Option {
  std::string name;         // NOLINT(readability-identifier-naming)
  bool requires_value;      // NOLINT(readability-identifier-naming)
  std::string description;  // NOLINT(readability-identifier-naming)
  std::function<bool(McpServerConfig& config, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Int>
bool parse_integer(const std::string& value, Int& out) {
  const char* first = value.data();
  const char* last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

bool reject(McpServerConfig& config, const std::string& message) {
  std::cerr << message << "\n";
  if (!config.parse_error.has_value()) {
    config.parse_error = message;
  }
  return false;
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_repo(McpServerConfig& config, const std::string& value) {
  config.repo = value;
  return true;
}

bool handle_registry(McpServerConfig& config, const std::string& value) {
  config.registry_path = value;
  return true;
}

bool handle_preset(McpServerConfig& config, const std::string& value) {
  config.preset = value;
  return true;
}

bool handle_page_size(McpServerConfig& config, const std::string& value) {
  if (!parse_integer(value, config.page_size)) {
    return reject(config, "Invalid --page-size: " + value);
  }
  return true;
}

bool handle_max_engines(McpServerConfig& config, const std::string& value) {
  long long parsed = 0;
  if (!parse_integer(value, parsed) || parsed < 0) {
    return reject(config, "Invalid --max-engines: " + value);
  }
  config.max_engines = static_cast<std::size_t>(parsed);
  return true;
}

bool handle_roots_timeout(McpServerConfig& config, const std::string& value) {
  if (!parse_integer(value, config.roots_timeout_ms)) {
    return reject(config, "Invalid --roots-timeout-ms: " + value);
  }
  return true;
}

bool handle_max_message_bytes(McpServerConfig& config, const std::string& value) {
  long long parsed = 0;
  if (!parse_integer(value, parsed) || parsed < 0) {
    return reject(config, "Invalid --max-message-bytes: " + value);
  }
  config.max_message_bytes = static_cast<std::size_t>(parsed);
  return true;
}

bool handle_list_presets(McpServerConfig& config, const std::string& /*value*/) {
  config.list_presets = true;
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<Option> build_option_registry() {
  return {
      {"--repo", true, "Repository path, or a name from the repository registry", handle_repo},
      {"--registry", true, "Path to the repository registry file", handle_registry},
      {"--preset", true, "Initial tool preset (core|review|refactor|federation|docs|ops|full)",
       handle_preset},
      {"--page-size", true, "tools/list page size", handle_page_size},
      {"--max-engines", true, "Maximum number of repository engines kept open",
       handle_max_engines},
      {"--roots-timeout-ms", true, "Timeout for the roots/list request", handle_roots_timeout},
      {"--max-message-bytes", true, "Maximum size of one JSON-RPC frame",
       handle_max_message_bytes},
      {"--list-presets", false, "Print the available presets and exit", handle_list_presets},
  };
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

McpServerConfig parse_args(int argc, char* argv[]) {
  McpServerConfig config;
  auto options = build_option_registry();

  // Build lookup map for O(1) option dispatch
  std::unordered_map<std::string, const Option*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      reject(config, "Unknown option: " + arg);
      continue;
    }

    const Option* opt = it->second;
    if (!opt->requires_value) {
      opt->handler(config, "");
      continue;
    }
    if (i + 1 >= argc) {
      reject(config, "Option " + arg + " requires a value");
      continue;
    }
    std::string value = argv[++i];
    opt->handler(config, value);
  }

  return config;
}

}  // namespace ckmcp::mcp
