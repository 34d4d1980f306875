#include "ckmcp/core/sha256.h"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace ckmcp::core {

namespace {

// FIPS 180-4 §5.3.3 initial hash value.
constexpr std::array<std::uint32_t, 8> kInitialState = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
};

// FIPS 180-4 §4.2.2 round constants.
constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u,
    0xab1c5ed5u, 0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu,
    0x9bdc06a7u, 0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu,
    0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u,
    0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u, 0xa2bfe8a1u, 0xa81a664bu,
    0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u,
    0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u,
    0xc67178f2u,
};

constexpr std::uint32_t rotr(std::uint32_t x, unsigned n) noexcept {
  return (x >> n) | (x << (32u - n));
}

}  // namespace

Sha256::Sha256() : state_(kInitialState) {}

void Sha256::update(std::string_view data) {
  if (finalized_) {
    return;
  }
  total_bytes_ += data.size();

  std::size_t pos = 0;
  while (pos < data.size()) {
    const std::size_t take = std::min(data.size() - pos, buffer_.size() - buffered_);
    std::memcpy(buffer_.data() + buffered_, data.data() + pos, take);
    buffered_ += take;
    pos += take;
    if (buffered_ == buffer_.size()) {
      process_block(buffer_.data());
      buffered_ = 0;
    }
  }
}

void Sha256::update(char byte) {
  update(std::string_view(&byte, 1));
}

void Sha256::process_block(const std::uint8_t* block) {
  std::array<std::uint32_t, 64> w{};
  for (unsigned i = 0; i < 16u; ++i) {
    w[i] = (static_cast<std::uint32_t>(block[i * 4u]) << 24u) |
           (static_cast<std::uint32_t>(block[i * 4u + 1u]) << 16u) |
           (static_cast<std::uint32_t>(block[i * 4u + 2u]) << 8u) |
           static_cast<std::uint32_t>(block[i * 4u + 3u]);
  }
  for (unsigned i = 16u; i < 64u; ++i) {
    const std::uint32_t s0 = rotr(w[i - 15u], 7u) ^ rotr(w[i - 15u], 18u) ^ (w[i - 15u] >> 3u);
    const std::uint32_t s1 = rotr(w[i - 2u], 17u) ^ rotr(w[i - 2u], 19u) ^ (w[i - 2u] >> 10u);
    w[i] = w[i - 16u] + s0 + w[i - 7u] + s1;
  }

  auto v = state_;
  for (unsigned i = 0; i < 64u; ++i) {
    const std::uint32_t big_s1 = rotr(v[4], 6u) ^ rotr(v[4], 11u) ^ rotr(v[4], 25u);
    const std::uint32_t choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
    const std::uint32_t t1 = v[7] + big_s1 + choose + kRoundConstants[i] + w[i];
    const std::uint32_t big_s0 = rotr(v[0], 2u) ^ rotr(v[0], 13u) ^ rotr(v[0], 22u);
    const std::uint32_t majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
    const std::uint32_t t2 = big_s0 + majority;

    v[7] = v[6];
    v[6] = v[5];
    v[5] = v[4];
    v[4] = v[3] + t1;
    v[3] = v[2];
    v[2] = v[1];
    v[1] = v[0];
    v[0] = t1 + t2;
  }

  for (std::size_t i = 0; i < state_.size(); ++i) {
    state_[i] += v[i];
  }
}

std::string Sha256::hex_digest() {
  if (finalized_) {
    return digest_;
  }

  // §5.1.1 padding: 0x80, zeroes, then the message length in bits as big-endian u64.
  const std::uint64_t bit_len = total_bytes_ * 8u;
  buffer_[buffered_++] = 0x80u;
  if (buffered_ > 56u) {
    std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_), buffer_.end(), 0u);
    process_block(buffer_.data());
    buffered_ = 0;
  }
  std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_), buffer_.begin() + 56, 0u);
  for (unsigned i = 0; i < 8u; ++i) {
    buffer_[56u + i] = static_cast<std::uint8_t>(bit_len >> ((7u - i) * 8u));
  }
  process_block(buffer_.data());
  finalized_ = true;

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (const std::uint32_t word : state_) {
    oss << std::setw(8) << word;
  }
  digest_ = oss.str();
  return digest_;
}

std::string sha256_hex(std::string_view input) {
  Sha256 hasher;
  hasher.update(input);
  return hasher.hex_digest();
}

}  // namespace ckmcp::core
