#include "ckmcp/session/roots.h"

#include <catch2/catch.hpp>

using namespace ckmcp;
using json = nlohmann::json;

// ── URI validation ──────────────────────────────────────────────────────────

TEST_CASE("is_valid_root_uri: absolute file URIs are accepted", "[roots]") {
  CHECK(session::is_valid_root_uri("file:///home/dev/project"));
  CHECK(session::is_valid_root_uri("file:///"));
  CHECK(session::is_valid_root_uri("file:///home/dev/my%20project"));
}

TEST_CASE("is_valid_root_uri: rejects other schemes, hosts and traversal", "[roots]") {
  CHECK_FALSE(session::is_valid_root_uri("https://example.com/repo"));
  CHECK_FALSE(session::is_valid_root_uri("/home/dev/project"));
  CHECK_FALSE(session::is_valid_root_uri("file://server/share"));
  CHECK_FALSE(session::is_valid_root_uri("file:///home/dev/../etc"));
  CHECK_FALSE(session::is_valid_root_uri("file:///home/%2E%2E/etc"));
  CHECK_FALSE(session::is_valid_root_uri("file://"));
  CHECK_FALSE(session::is_valid_root_uri("file:///bad%zzescape"));
}

TEST_CASE("Root::path: percent-decodes the file URI path", "[roots]") {
  const session::Root root{.uri = "file:///home/dev/my%20project", .name = "proj"};
  CHECK(root.path() == "/home/dev/my project");
}

// ── Client capabilities ─────────────────────────────────────────────────────

TEST_CASE("parse_client_capabilities: roots with listChanged", "[roots]") {
  const json params = {{"capabilities", {{"roots", {{"listChanged", true}}}}}};
  const auto caps = session::parse_client_capabilities(params);
  CHECK(caps.roots);
  CHECK(caps.roots_list_changed);
}

TEST_CASE("parse_client_capabilities: absent roots capability", "[roots]") {
  CHECK_FALSE(session::parse_client_capabilities(json::object()).roots);
  CHECK_FALSE(
      session::parse_client_capabilities(json{{"capabilities", {{"sampling", json::object()}}}})
          .roots);
  CHECK_FALSE(session::parse_client_capabilities(json("not an object")).roots);
}

// ── roots/list result ───────────────────────────────────────────────────────

TEST_CASE("parse_roots_result: keeps valid roots and skips invalid entries", "[roots]") {
  const json result = {{"roots", json::array({
                                     {{"uri", "file:///work/api"}, {"name", "api"}},
                                     {{"uri", "https://example.com"}},
                                     "just a string",
                                     {{"name", "no uri"}},
                                     {{"uri", "file:///work/web"}},
                                 })}};
  auto roots = session::parse_roots_result(result);
  REQUIRE(roots.has_value());
  REQUIRE(roots->size() == 2);
  CHECK(roots->at(0).uri == "file:///work/api");
  CHECK(roots->at(0).name == "api");
  CHECK(roots->at(1).uri == "file:///work/web");
  CHECK(roots->at(1).name.empty());
}

TEST_CASE("parse_roots_result: empty array is a valid empty set", "[roots]") {
  auto roots = session::parse_roots_result(json{{"roots", json::array()}});
  REQUIRE(roots.has_value());
  CHECK(roots->empty());
}

TEST_CASE("parse_roots_result: missing roots array is rejected", "[roots]") {
  CHECK_FALSE(session::parse_roots_result(json::object()).has_value());
  CHECK_FALSE(session::parse_roots_result(json{{"roots", "x"}}).has_value());
  CHECK_FALSE(session::parse_roots_result(json()).has_value());
}

TEST_CASE("roots_to_json: includes decoded path", "[roots]") {
  const std::vector<session::Root> roots = {{.uri = "file:///a%20b", .name = ""}};
  const auto out = session::roots_to_json(roots);
  REQUIRE(out.size() == 1);
  CHECK(out[0]["uri"] == "file:///a%20b");
  CHECK(out[0]["path"] == "/a b");
  CHECK_FALSE(out[0].contains("name"));
}
