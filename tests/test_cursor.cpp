#include "ckmcp/core/base64.h"
#include "ckmcp/pagination/cursor.h"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace ckmcp;
using json = nlohmann::json;

static constexpr const char* kFingerprint = "0123456789abcdef";

static std::string raw_cursor(const json& payload) {
  return core::base64url_encode(payload.dump());
}

TEST_CASE("decode_cursor: empty cursor is offset zero", "[cursor]") {
  auto offset = pagination::decode_cursor("", "core", kFingerprint);
  REQUIRE(offset.has_value());
  CHECK(offset.value() == 0);
}

TEST_CASE("decode_cursor: accepts a cursor for the same preset and fingerprint", "[cursor]") {
  const auto cursor = pagination::encode_cursor("core", 15, kFingerprint);
  auto offset = pagination::decode_cursor(cursor, "core", kFingerprint);
  REQUIRE(offset.has_value());
  CHECK(offset.value() == 15);
}

TEST_CASE("encode_cursor: opaque URL-safe payload", "[cursor]") {
  const auto cursor = pagination::encode_cursor("review", 30, kFingerprint);
  CHECK(cursor.find_first_of("+/=") == std::string::npos);

  auto decoded = core::base64url_decode(cursor);
  REQUIRE(decoded.has_value());
  const auto payload = json::parse(decoded.value());
  CHECK(payload["v"] == pagination::kCursorVersion);
  CHECK(payload["p"] == "review");
  CHECK(payload["o"] == 30);
  CHECK(payload["h"] == kFingerprint);
}

TEST_CASE("decode_cursor: preset change invalidates the cursor", "[cursor]") {
  const auto cursor = pagination::encode_cursor("core", 15, kFingerprint);
  auto offset = pagination::decode_cursor(cursor, "full", kFingerprint);
  REQUIRE_FALSE(offset.has_value());
  CHECK(offset.error() == "preset changed");
}

TEST_CASE("decode_cursor: toolset change invalidates the cursor", "[cursor]") {
  const auto cursor = pagination::encode_cursor("core", 15, kFingerprint);
  auto offset = pagination::decode_cursor(cursor, "core", "fedcba9876543210");
  REQUIRE_FALSE(offset.has_value());
  CHECK(offset.error() == "toolset changed");
}

TEST_CASE("decode_cursor: version mismatch", "[cursor]") {
  const auto cursor = raw_cursor({{"v", 2}, {"p", "core"}, {"o", 15}, {"h", kFingerprint}});
  auto offset = pagination::decode_cursor(cursor, "core", kFingerprint);
  REQUIRE_FALSE(offset.has_value());
  CHECK(offset.error() == "cursor version mismatch");
}

TEST_CASE("decode_cursor: wide version values do not alias the current one", "[cursor]") {
  // 2^32 + 1 truncates to 1 in 32 bits.
  const auto wide =
      raw_cursor({{"v", 4294967297LL}, {"p", "core"}, {"o", 15}, {"h", kFingerprint}});
  auto offset = pagination::decode_cursor(wide, "core", kFingerprint);
  REQUIRE_FALSE(offset.has_value());
  CHECK(offset.error() == "cursor version mismatch");
}

TEST_CASE("decode_cursor: negative offset", "[cursor]") {
  const auto cursor = raw_cursor({{"v", 1}, {"p", "core"}, {"o", -1}, {"h", kFingerprint}});
  auto offset = pagination::decode_cursor(cursor, "core", kFingerprint);
  REQUIRE_FALSE(offset.has_value());
  CHECK(offset.error() == "invalid offset");
}

TEST_CASE("decode_cursor: malformed input", "[cursor]") {
  SECTION("not base64url") {
    auto offset = pagination::decode_cursor("!!!not-a-cursor", "core", kFingerprint);
    REQUIRE_FALSE(offset.has_value());
    CHECK(offset.error() == "invalid cursor encoding");
  }
  SECTION("base64url of non-JSON") {
    auto offset = pagination::decode_cursor(core::base64url_encode("hello"), "core", kFingerprint);
    REQUIRE_FALSE(offset.has_value());
    CHECK(offset.error() == "invalid cursor format");
  }
  SECTION("missing field") {
    auto offset =
        pagination::decode_cursor(raw_cursor({{"v", 1}, {"p", "core"}, {"o", 15}}), "core",
                                  kFingerprint);
    REQUIRE_FALSE(offset.has_value());
    CHECK(offset.error() == "invalid cursor format");
  }
  SECTION("wrong field type") {
    auto offset = pagination::decode_cursor(
        raw_cursor({{"v", 1}, {"p", "core"}, {"o", "15"}, {"h", kFingerprint}}), "core",
        kFingerprint);
    REQUIRE_FALSE(offset.has_value());
    CHECK(offset.error() == "invalid cursor format");
  }
}
