#include <catch2/catch.hpp>

#include "config.h"
#include "startup_guard.h"

#include <string>
#include <vector>

using namespace ckmcp::mcp;

// Helper: run parse_args over a list of arguments (program name is prepended).
static McpServerConfig parse(std::vector<std::string> args) {
  args.insert(args.begin(), "ckmcp_mcp_server");
  std::vector<char*> argv;
  argv.reserve(args.size());
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return parse_args(static_cast<int>(argv.size()), argv.data());
}

// ── Defaults ────────────────────────────────────────────────────────────────

TEST_CASE("parse_args: defaults", "[startup][config]") {
  const auto config = parse({});
  CHECK_FALSE(config.repo.has_value());
  CHECK_FALSE(config.registry_path.has_value());
  CHECK(config.preset == "core");
  CHECK(config.page_size == 15);
  CHECK(config.max_engines == 5);
  CHECK(config.roots_timeout_ms == 10000);
  CHECK_FALSE(config.list_presets);
  CHECK_FALSE(config.parse_error.has_value());
  CHECK(validate_mcp_server_config(config).empty());
}

TEST_CASE("parse_args: every flag", "[startup][config]") {
  const auto config =
      parse({"--repo", "api", "--registry", "/tmp/repos.json", "--preset", "review",
             "--page-size", "20", "--max-engines", "3", "--roots-timeout-ms", "500",
             "--max-message-bytes", "4096", "--list-presets"});
  CHECK(config.repo == "api");
  CHECK(config.registry_path == "/tmp/repos.json");
  CHECK(config.preset == "review");
  CHECK(config.page_size == 20);
  CHECK(config.max_engines == 3);
  CHECK(config.roots_timeout_ms == 500);
  CHECK(config.max_message_bytes == 4096);
  CHECK(config.list_presets);
  CHECK(validate_mcp_server_config(config).empty());
}

// ── Parse failures surface through validation ───────────────────────────────

TEST_CASE("parse_args: unknown option is reported", "[startup][config]") {
  const auto config = parse({"--verbose"});
  REQUIRE(config.parse_error.has_value());
  CHECK(validate_mcp_server_config(config) == "Error: Unknown option: --verbose");
}

TEST_CASE("parse_args: non-numeric page size is reported", "[startup][config]") {
  const auto config = parse({"--page-size", "ten"});
  CHECK(validate_mcp_server_config(config) == "Error: Invalid --page-size: ten");
}

TEST_CASE("parse_args: missing value is reported", "[startup][config]") {
  const auto config = parse({"--preset"});
  CHECK(validate_mcp_server_config(config) == "Error: Option --preset requires a value");
}

TEST_CASE("parse_args: first parse error wins", "[startup][config]") {
  const auto config = parse({"--max-engines", "-1", "--page-size", "x"});
  CHECK(validate_mcp_server_config(config) == "Error: Invalid --max-engines: -1");
}

// ── Value checks ────────────────────────────────────────────────────────────

TEST_CASE("validate_mcp_server_config: unknown preset lists valid presets",
          "[startup][config]") {
  McpServerConfig config;
  config.preset = "everything";
  const auto error = validate_mcp_server_config(config);
  CHECK(error.find("'everything'") != std::string::npos);
  CHECK(error.find("core, review, refactor, federation, docs, ops, full") != std::string::npos);
}

TEST_CASE("validate_mcp_server_config: page size must be positive", "[startup][config]") {
  McpServerConfig config;
  config.page_size = 0;
  CHECK(validate_mcp_server_config(config) == "Error: --page-size must be positive");
}

TEST_CASE("validate_mcp_server_config: at least one engine", "[startup][config]") {
  McpServerConfig config;
  config.max_engines = 0;
  CHECK(validate_mcp_server_config(config) == "Error: --max-engines must be at least 1");
}

TEST_CASE("validate_mcp_server_config: roots timeout and frame limit must be positive",
          "[startup][config]") {
  McpServerConfig timeout;
  timeout.roots_timeout_ms = 0;
  CHECK_FALSE(validate_mcp_server_config(timeout).empty());

  McpServerConfig frame;
  frame.max_message_bytes = 0;
  CHECK_FALSE(validate_mcp_server_config(frame).empty());
}
