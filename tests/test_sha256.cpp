#include "ckmcp/core/sha256.h"

#include <catch2/catch.hpp>

#include <string>

using namespace ckmcp;

TEST_CASE("sha256_hex: FIPS 180-2 vectors", "[sha256]") {
  CHECK(core::sha256_hex("") ==
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  CHECK(core::sha256_hex("abc") ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  CHECK(core::sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
        "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("Sha256: incremental updates match a single update", "[sha256]") {
  core::Sha256 hasher;
  hasher.update("abcdbcdecdefdefg");
  hasher.update('e');
  hasher.update("fghfghighijhijkijkljklmklmnlmnomnopnopq");
  CHECK(hasher.hex_digest() ==
        "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("Sha256: input spanning several blocks", "[sha256]") {
  const std::string million(1000000, 'a');
  CHECK(core::sha256_hex(million) ==
        "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST_CASE("Sha256: hex_digest is stable once finalized", "[sha256]") {
  core::Sha256 hasher;
  hasher.update("abc");
  const auto first = hasher.hex_digest();
  CHECK(hasher.hex_digest() == first);
}
