#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ckmcp::core {

// Sha256 is an incremental FIPS 180-4 SHA-256 hasher.
//
// Feed bytes with update() any number of times, then call hex_digest() once.
// After hex_digest() the hasher is finalized; further update() calls are ignored.
class Sha256 {
 public:
  Sha256();

  void update(std::string_view data);
  void update(char byte);

  // Lower-case, 64-character hex digest.
  [[nodiscard]] std::string hex_digest();

 private:
  void process_block(const std::uint8_t* block);

  std::array<std::uint32_t, 8> state_;
  std::array<std::uint8_t, 64> buffer_{};
  std::size_t buffered_{0};
  std::uint64_t total_bytes_{0};
  bool finalized_{false};
  std::string digest_;
};

// sha256_hex returns the SHA-256 digest of input as a lower-case hex string.
[[nodiscard]] std::string sha256_hex(std::string_view input);

}  // namespace ckmcp::core
