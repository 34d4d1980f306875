#include "ckmcp/core/base64.h"

#include <cstdint>

namespace ckmcp::core {

namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int decode_char(char c) {
  if (c >= 'A' && c <= 'Z') {
    return c - 'A';
  }
  if (c >= 'a' && c <= 'z') {
    return c - 'a' + 26;
  }
  if (c >= '0' && c <= '9') {
    return c - '0' + 52;
  }
  if (c == '-') {
    return 62;
  }
  if (c == '_') {
    return 63;
  }
  return -1;
}

}  // namespace

std::string base64url_encode(std::string_view input) {
  std::string out;
  out.reserve((input.size() + 2) / 3 * 4);

  std::size_t i = 0;
  for (; i + 3 <= input.size(); i += 3) {
    const std::uint32_t n = (static_cast<std::uint8_t>(input[i]) << 16u) |
                            (static_cast<std::uint8_t>(input[i + 1]) << 8u) |
                            static_cast<std::uint8_t>(input[i + 2]);
    out.push_back(kAlphabet[(n >> 18u) & 0x3Fu]);
    out.push_back(kAlphabet[(n >> 12u) & 0x3Fu]);
    out.push_back(kAlphabet[(n >> 6u) & 0x3Fu]);
    out.push_back(kAlphabet[n & 0x3Fu]);
  }

  const std::size_t rest = input.size() - i;
  if (rest == 1) {
    const std::uint32_t n = static_cast<std::uint8_t>(input[i]) << 16u;
    out.push_back(kAlphabet[(n >> 18u) & 0x3Fu]);
    out.push_back(kAlphabet[(n >> 12u) & 0x3Fu]);
  } else if (rest == 2) {
    const std::uint32_t n = (static_cast<std::uint8_t>(input[i]) << 16u) |
                            (static_cast<std::uint8_t>(input[i + 1]) << 8u);
    out.push_back(kAlphabet[(n >> 18u) & 0x3Fu]);
    out.push_back(kAlphabet[(n >> 12u) & 0x3Fu]);
    out.push_back(kAlphabet[(n >> 6u) & 0x3Fu]);
  }
  return out;
}

std::optional<std::string> base64url_decode(std::string_view input) {
  if (input.size() % 4 == 1) {
    return std::nullopt;
  }

  std::string out;
  out.reserve(input.size() * 3 / 4);

  std::uint32_t accumulator = 0;
  int bits = 0;
  for (const char c : input) {
    const int value = decode_char(c);
    if (value < 0) {
      return std::nullopt;
    }
    accumulator = (accumulator << 6u) | static_cast<std::uint32_t>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((accumulator >> static_cast<unsigned>(bits)) & 0xFFu));
    }
  }
  return out;
}

}  // namespace ckmcp::core
