#include <catch2/catch.hpp>

#include "ckmcp/catalog/catalog.h"
#include "ckmcp/catalog/presets.h"
#include "ckmcp/protocol/jsonrpc.h"

#include "server_fixture.h"
#include "server_loop.h"

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using namespace ckmcp;
using test_support::ServerFixture;
using test_support::tool_payload;
using json = nlohmann::json;

static std::vector<std::string> tool_names(const json& reply) {
  std::vector<std::string> names;
  for (const auto& tool : reply["result"]["tools"]) {
    names.push_back(tool["name"].get<std::string>());
  }
  return names;
}

// ── Lifecycle ───────────────────────────────────────────────────────────────

TEST_CASE("dispatcher: initialize advertises tools and resources", "[dispatcher]") {
  ServerFixture fx;
  const auto reply = fx.call("initialize", {{"protocolVersion", "2024-11-05"},
                                            {"capabilities", json::object()},
                                            {"clientInfo", {{"name", "test"}}}});
  CHECK(reply["id"] == 1);
  const auto& result = reply["result"];
  CHECK(result["protocolVersion"] == "2024-11-05");
  CHECK(result["capabilities"]["tools"]["listChanged"] == true);
  CHECK(result["capabilities"].contains("resources"));
  CHECK(result["serverInfo"]["name"] == "ckmcp");
  CHECK_FALSE(fx.session.roots_supported());
}

TEST_CASE("dispatcher: string request ids are echoed", "[dispatcher]") {
  ServerFixture fx;
  const auto reply = fx.request({{"jsonrpc", "2.0"}, {"id", "abc-1"}, {"method", "tools/list"}});
  CHECK(reply["id"] == "abc-1");
  CHECK(reply.contains("result"));
}

TEST_CASE("dispatcher: unknown method", "[dispatcher]") {
  ServerFixture fx;
  const auto reply = fx.call("prompts/list", json::object(), 7);
  CHECK(reply["id"] == 7);
  CHECK(reply["error"]["code"] == protocol::kMethodNotFound);
}

// ── tools/list pagination ───────────────────────────────────────────────────

TEST_CASE("dispatcher: tools/list pages the core preset 15 then 4", "[dispatcher][paging]") {
  ServerFixture fx;
  const auto first = fx.call("tools/list", json::object(), 1);
  CHECK(first["result"]["tools"].size() == 15);
  REQUIRE(first["result"].contains("nextCursor"));

  const auto second =
      fx.call("tools/list", {{"cursor", first["result"]["nextCursor"]}}, 2);
  CHECK(second["result"]["tools"].size() == 4);
  CHECK_FALSE(second["result"].contains("nextCursor"));

  auto names = tool_names(first);
  const auto rest = tool_names(second);
  names.insert(names.end(), rest.begin(), rest.end());
  CHECK(names == catalog::canonical_tool_order());
}

TEST_CASE("dispatcher: walking the full preset visits every tool once", "[dispatcher][paging]") {
  ServerFixture fx("full");
  fx.config.page_size = 10;

  std::vector<std::string> names;
  json params = json::object();
  int pages = 0;
  while (true) {
    const auto reply = fx.call("tools/list", params, ++pages);
    REQUIRE(reply.contains("result"));
    const auto page = tool_names(reply);
    CHECK(page.size() <= 10);
    names.insert(names.end(), page.begin(), page.end());
    if (!reply["result"].contains("nextCursor")) {
      break;
    }
    params = {{"cursor", reply["result"]["nextCursor"]}};
  }
  CHECK(names.size() == catalog::kToolCount);
  CHECK(pages == 8);
}

TEST_CASE("dispatcher: cursor from before an expansion is rejected", "[dispatcher][paging]") {
  ServerFixture fx;
  const auto first = fx.call("tools/list", json::object(), 1);
  const auto cursor = first["result"]["nextCursor"];

  const auto expanded =
      fx.call_tool("expandToolset", {{"preset", "review"}, {"reason", "reviewing a PR"}}, 2);
  REQUIRE(expanded.contains("result"));

  const auto stale = fx.call("tools/list", {{"cursor", cursor}}, 3);
  CHECK(stale["error"]["code"] == protocol::kInvalidParams);
  CHECK(stale["error"]["message"] == "Invalid cursor: preset changed");
  CHECK(stale["error"]["data"]["reason"] == "preset changed");
}

TEST_CASE("dispatcher: malformed cursors are invalid params", "[dispatcher][paging]") {
  ServerFixture fx;
  const auto garbage = fx.call("tools/list", {{"cursor", "%%%"}}, 1);
  CHECK(garbage["error"]["code"] == protocol::kInvalidParams);
  CHECK(garbage["error"]["message"] == "Invalid cursor: invalid cursor encoding");

  const auto numeric = fx.call("tools/list", {{"cursor", 15}}, 2);
  CHECK(numeric["error"]["code"] == protocol::kInvalidParams);
}

// ── tools/call ──────────────────────────────────────────────────────────────

TEST_CASE("dispatcher: unknown tool is rejected before dispatch", "[dispatcher][tools]") {
  ServerFixture fx;
  const auto reply = fx.call_tool("nonexistentTool");
  CHECK(reply["error"]["code"] == protocol::kNotFound);
  CHECK(reply["error"]["message"] == "Tool not found");
  CHECK(reply["error"]["data"]["name"] == "nonexistentTool");
}

TEST_CASE("dispatcher: tools/call parameter validation", "[dispatcher][tools]") {
  ServerFixture fx;
  const auto no_params = fx.request({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"}});
  CHECK(no_params["error"]["code"] == protocol::kInvalidParams);

  const auto no_name = fx.call("tools/call", {{"arguments", json::object()}}, 2);
  CHECK(no_name["error"]["code"] == protocol::kInvalidParams);
  CHECK(no_name["error"]["message"] == "Invalid params: name is required");
}

TEST_CASE("dispatcher: engine query returns text content", "[dispatcher][tools]") {
  ServerFixture fx;
  const auto reply = fx.call_tool("searchSymbols", {{"query", "Token"}});
  REQUIRE(reply.contains("result"));
  CHECK(reply["result"]["content"][0]["type"] == "text");
  CHECK_FALSE(reply["result"].contains("isError"));
  const auto payload = tool_payload(reply);
  CHECK(payload["symbols"][0]["symbolId"] == "sym:auth:Token");
}

TEST_CASE("dispatcher: tools outside the active preset remain callable", "[dispatcher][tools]") {
  ServerFixture fx;
  const auto& core = catalog::preset_tools("core");
  REQUIRE(std::find(core.begin(), core.end(), "justifySymbol") == core.end());

  const auto reply = fx.call_tool("justifySymbol", {{"symbolId", "sym:auth:Token"}});
  REQUIRE(reply.contains("result"));
  // The SQLite backend does not implement it; that is a tool-level failure.
  CHECK(reply["result"]["isError"] == true);
  CHECK(tool_payload(reply)["error"]["code"] == "UNSUPPORTED");
}

TEST_CASE("dispatcher: not-found lookups are business failures", "[dispatcher][tools]") {
  ServerFixture fx;
  const auto reply = fx.call_tool("getSymbol", {{"symbolId", "sym:missing"}});
  REQUIRE(reply.contains("result"));
  CHECK(reply["result"]["isError"] == true);
  const auto payload = tool_payload(reply);
  CHECK(payload["error"]["code"] == "NOT_FOUND");
  CHECK(payload["error"]["message"] == "symbol not found: sym:missing");
}

TEST_CASE("dispatcher: missing required argument is invalid params", "[dispatcher][tools]") {
  ServerFixture fx;
  const auto reply = fx.call_tool("getSymbol", json::object());
  CHECK(reply["error"]["code"] == protocol::kInvalidParams);
}

TEST_CASE("dispatcher: expandToolset switches preset and notifies once", "[dispatcher][tools]") {
  ServerFixture fx;
  const auto reply =
      fx.call_tool("expandToolset", {{"preset", "refactor"}, {"reason", "dead code sweep"}});
  const auto payload = tool_payload(reply);
  CHECK(payload["expanded"] == true);
  CHECK(payload["previousPreset"] == "core");
  CHECK(payload["preset"] == "refactor");
  CHECK(payload["toolCount"] ==
        catalog::filter_and_order_tools(catalog::tool_catalog(), "refactor").size());

  const auto frames = fx.written();
  REQUIRE(frames.size() == 1);
  CHECK(frames[0]["method"] == "notifications/tools/list_changed");
  CHECK_FALSE(frames[0].contains("id"));

  // The latch holds for the rest of the session.
  const auto again = fx.call_tool("expandToolset", {{"preset", "full"}, {"reason", "more"}}, 2);
  CHECK(again["error"]["code"] == protocol::kInvalidParams);
  CHECK(fx.session.active_preset() == "refactor");
  CHECK(fx.written().size() == 1);
}

TEST_CASE("dispatcher: expandToolset argument errors", "[dispatcher][tools]") {
  ServerFixture fx;
  CHECK(fx.call_tool("expandToolset", {{"reason", "x"}})["error"]["code"] ==
        protocol::kInvalidParams);
  CHECK(fx.call_tool("expandToolset", {{"preset", "full"}})["error"]["code"] ==
        protocol::kInvalidParams);
  CHECK(fx.call_tool("expandToolset", {{"preset", "bogus"}, {"reason", "x"}})["error"]["code"] ==
        protocol::kInvalidParams);
  // None of the failures set the latch.
  CHECK_FALSE(fx.session.expanded());
  CHECK(fx.written().empty());
}

TEST_CASE("dispatcher: multi-repo tools in legacy mode", "[dispatcher][tools]") {
  ServerFixture fx;
  const auto reply = fx.call_tool("listRepos");
  CHECK(reply["error"]["code"] == protocol::kInvalidRequest);
  CHECK(reply["error"]["message"] ==
        "Multi-repo mode not enabled. Start MCP server with a registry.");
}

// ── Resources ───────────────────────────────────────────────────────────────

TEST_CASE("dispatcher: resources/list", "[dispatcher][resources]") {
  ServerFixture fx;
  const auto reply = fx.call("resources/list", json::object());
  const auto& result = reply["result"];
  REQUIRE(result["resources"].size() == 2);
  CHECK(result["resources"][0]["uri"] == "ckmcp://status");
  REQUIRE(result["resourceTemplates"].size() == 2);
  for (const auto& entry : result["resourceTemplates"]) {
    CHECK(entry["mimeType"] == "application/json");
  }
}

TEST_CASE("dispatcher: resources/read documents", "[dispatcher][resources]") {
  ServerFixture fx;

  const auto status = fx.call("resources/read", {{"uri", "ckmcp://status"}});
  REQUIRE(status.contains("result"));
  const auto& content = status["result"]["contents"][0];
  CHECK(content["uri"] == "ckmcp://status");
  CHECK(content["mimeType"] == "application/json");
  const auto doc = json::parse(content["text"].get<std::string>());
  CHECK(doc["toolset"]["preset"] == "core");

  const auto symbol = fx.call("resources/read", {{"uri", "ckmcp://symbol/sym:auth:Token"}}, 2);
  REQUIRE(symbol.contains("result"));
  const auto symbol_doc =
      json::parse(symbol["result"]["contents"][0]["text"].get<std::string>());
  CHECK(symbol_doc["symbol"]["name"] == "Token");

  const auto module = fx.call("resources/read", {{"uri", "ckmcp://module/auth"}}, 3);
  REQUIRE(module.contains("result"));
}

TEST_CASE("dispatcher: resources/read errors", "[dispatcher][resources]") {
  ServerFixture fx;
  CHECK(fx.call("resources/read", {{"uri", "file:///etc/passwd"}})["error"]["code"] ==
        protocol::kInvalidParams);
  CHECK(fx.call("resources/read", {{"uri", "ckmcp://module/"}})["error"]["code"] ==
        protocol::kInvalidParams);
  CHECK(fx.call("resources/read", {{"uri", "ckmcp://widgets/1"}})["error"]["code"] ==
        protocol::kNotFound);
  CHECK(fx.call("resources/read", {{"uri", "ckmcp://symbol/sym:none"}})["error"]["code"] ==
        protocol::kNotFound);
  CHECK(fx.call("resources/read", json::object())["error"]["code"] == protocol::kInvalidParams);
}

// ── Framing ─────────────────────────────────────────────────────────────────

TEST_CASE("dispatcher: frames that get no reply", "[dispatcher][framing]") {
  ServerFixture fx;
  CHECK_FALSE(fx.dispatcher.handle_line("").has_value());
  CHECK_FALSE(fx.dispatcher.handle_line("   \r").has_value());
  CHECK_FALSE(fx.dispatcher.handle_line("{this is not json").has_value());
  CHECK_FALSE(fx.dispatcher.handle_line(R"({"jsonrpc":"2.0","method":"notifications/unknown"})")
                  .has_value());
  CHECK_FALSE(
      fx.dispatcher.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")
          .has_value());
}

TEST_CASE("dispatcher: non-object JSON is an invalid request with null id",
          "[dispatcher][framing]") {
  ServerFixture fx;
  auto reply = fx.dispatcher.handle_line("[1,2,3]");
  REQUIRE(reply.has_value());
  const auto parsed = json::parse(reply.value());
  CHECK(parsed["id"].is_null());
  CHECK(parsed["error"]["code"] == protocol::kInvalidRequest);
}

TEST_CASE("dispatcher: ambiguous message is answered at its id", "[dispatcher][framing]") {
  ServerFixture fx;
  auto reply = fx.dispatcher.handle_line(R"({"jsonrpc":"2.0","id":5,"method":"m","result":{}})");
  REQUIRE(reply.has_value());
  const auto parsed = json::parse(reply.value());
  CHECK(parsed["id"] == 5);
  CHECK(parsed["error"]["code"] == protocol::kInvalidRequest);
}

TEST_CASE("dispatcher: oversized frame is answered when its id is readable",
          "[dispatcher][framing]") {
  ServerFixture fx;
  fx.config.max_message_bytes = 64;
  const json frame = {{"jsonrpc", "2.0"},
                      {"id", 9},
                      {"method", "tools/call"},
                      {"params", {{"name", "searchSymbols"},
                                  {"arguments", {{"query", std::string(100, 'x')}}}}}};
  auto reply = fx.dispatcher.handle_line(frame.dump());
  REQUIRE(reply.has_value());
  const auto parsed = json::parse(reply.value());
  CHECK(parsed["id"] == 9);
  CHECK(parsed["error"]["code"] == protocol::kParseError);
}

TEST_CASE("dispatcher: response for an unknown id is dropped", "[dispatcher][framing]") {
  ServerFixture fx;
  CHECK_FALSE(fx.dispatcher.handle_line(R"({"jsonrpc":"2.0","id":42,"result":{"roots":[]}})")
                  .has_value());
  CHECK_FALSE(fx.dispatcher.handle_line(R"({"jsonrpc":"2.0","id":"x","result":{}})").has_value());
  CHECK(fx.session.pending_count() == 0);
}

// ── Roots handshake ─────────────────────────────────────────────────────────

TEST_CASE("dispatcher: roots/list round trip after initialized", "[dispatcher][roots]") {
  ServerFixture fx;
  fx.call("initialize", {{"capabilities", {{"roots", {{"listChanged", true}}}}}});
  REQUIRE(fx.session.roots_supported());

  CHECK_FALSE(
      fx.dispatcher.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")
          .has_value());
  const auto frames = fx.written();
  REQUIRE(frames.size() == 1);
  CHECK(frames[0]["method"] == "roots/list");
  const auto id = frames[0]["id"].get<std::int64_t>();

  const json response = {
      {"jsonrpc", "2.0"},
      {"id", id},
      {"result", {{"roots", json::array({{{"uri", "file:///work/repo"}, {"name", "repo"}}})}}},
  };
  CHECK_FALSE(fx.dispatcher.handle_line(response.dump()).has_value());
  fx.roots.wait_for_workers();

  const auto roots = fx.session.roots();
  REQUIRE(roots.size() == 1);
  CHECK(roots[0].path() == "/work/repo");
  CHECK(fx.session.pending_count() == 0);

  // The status snapshot reflects the client's roots.
  const auto status = tool_payload(fx.call_tool("getStatus", json::object(), 5));
  CHECK(status["roots"]["supported"] == true);
  CHECK(status["roots"]["roots"].size() == 1);
}

// ── Server loop ─────────────────────────────────────────────────────────────

TEST_CASE("run_server_loop: replies in order and closes engines at end of input",
          "[dispatcher][loop]") {
  ServerFixture fx;
  std::istringstream in(
      R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"
      "\n\n"
      R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
      "\n"
      R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"
      "\n");
  mcp::run_server_loop(fx.ctx, in);

  const auto frames = fx.written();
  REQUIRE(frames.size() == 2);
  CHECK(frames[0]["id"] == 1);
  CHECK(frames[1]["id"] == 2);
  CHECK(frames[1]["result"]["tools"].size() == 15);
  CHECK_FALSE(fx.engines->active().has_value());
}

TEST_CASE("run_server_loop: oversized line is rejected and the next frame is served",
          "[dispatcher][loop]") {
  ServerFixture fx;
  fx.config.max_message_bytes = 128;
  const std::string oversized =
      R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"searchSymbols",)"
      R"("arguments":{"query":")" +
      std::string(100000, 'x') + R"("}}})";
  std::istringstream in(oversized + "\n" +
                        R"({"jsonrpc":"2.0","id":8,"method":"tools/list"})" + "\n");
  mcp::run_server_loop(fx.ctx, in);

  const auto frames = fx.written();
  REQUIRE(frames.size() == 2);
  CHECK(frames[0]["id"] == 7);
  CHECK(frames[0]["error"]["code"] == protocol::kParseError);
  CHECK(frames[1]["id"] == 8);
  CHECK(frames[1]["result"]["tools"].size() == 15);
}
