#include "alog/core/binary_id.h"

#include <algorithm>
#include <cstring>
#include <iterator>

namespace alog::core {

namespace {

constexpr std::string_view kBase64UrlAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
constexpr std::string_view kHexDigits = "0123456789abcdef";

constexpr std::size_t kBase64UrlLength = 22;
constexpr std::size_t kHexLength = 32;
constexpr std::size_t kUuidLength = 36;

int base64url_value(const char c) {
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

int hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

Result<BinaryId, Error> invalid(std::string_view text, const char* reason) {
  return fail<BinaryId>(ErrorCode::kInvalidIdentifier,
                        "Invalid identifier '" + std::string(text) + "': " + reason);
}

Result<BinaryId, Error> parse_base64url(std::string_view text) {
  BinaryId id;
  unsigned int buffer = 0;
  int bits = 0;
  std::size_t out = 0;
  for (const char c : text) {
    const int v = base64url_value(c);
    if (v < 0) {
      return invalid(text, "non base64url character");
    }
    buffer = (buffer << 6) | static_cast<unsigned int>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      id.bytes[out++] = static_cast<std::uint8_t>((buffer >> bits) & 0xFFU);
    }
  }
  // 22 characters carry 132 bits; the 4 trailing bits must be zero for a canonical encoding.
  if (out != id.bytes.size() || (buffer & ((1U << bits) - 1U)) != 0) {
    return invalid(text, "non canonical base64url encoding");
  }
  return Result<BinaryId, Error>::ok(id);
}

Result<BinaryId, Error> parse_hex(std::string_view text) {
  BinaryId id;
  for (std::size_t i = 0; i < id.bytes.size(); ++i) {
    const int hi = hex_value(text[2 * i]);
    const int lo = hex_value(text[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return invalid(text, "non hex character");
    }
    id.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return Result<BinaryId, Error>::ok(id);
}

}  // namespace

Result<BinaryId, Error> BinaryId::parse(std::string_view text) {
  if (text.empty()) {
    return Result<BinaryId, Error>::ok(BinaryId{});
  }

  // Tolerate "==" padding on the canonical form.
  if (text.size() == kBase64UrlLength + 2 && text.ends_with("==")) {
    text.remove_suffix(2);
  }

  switch (text.size()) {
    case kBase64UrlLength:
      return parse_base64url(text);
    case kHexLength:
      return parse_hex(text);
    case kUuidLength: {
      if (text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
        return invalid(text, "malformed UUID");
      }
      std::string compact;
      compact.reserve(kHexLength);
      std::copy_if(text.begin(), text.end(), std::back_inserter(compact),
                   [](char c) { return c != '-'; });
      if (compact.size() != kHexLength) {
        return invalid(text, "malformed UUID");
      }
      return parse_hex(compact);
    }
    default:
      return invalid(text, "unexpected length");
  }
}

Result<BinaryId, Error> BinaryId::from_bytes(const void* data, const std::size_t size) {
  BinaryId id;
  if (data == nullptr || size != id.bytes.size()) {
    return fail<BinaryId>(ErrorCode::kInvalidIdentifier,
                          "Invalid identifier: expected 16 bytes, got " + std::to_string(size));
  }
  std::memcpy(id.bytes.data(), data, id.bytes.size());
  return Result<BinaryId, Error>::ok(id);
}

bool BinaryId::is_nil() const {
  return std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0; });
}

std::string BinaryId::to_string() const {
  if (is_nil()) {
    return {};
  }

  std::string out;
  out.reserve(kBase64UrlLength);
  unsigned int buffer = 0;
  int bits = 0;
  for (const std::uint8_t b : bytes) {
    buffer = (buffer << 8) | b;
    bits += 8;
    while (bits >= 6) {
      bits -= 6;
      out.push_back(kBase64UrlAlphabet[(buffer >> bits) & 0x3FU]);
    }
  }
  if (bits > 0) {
    out.push_back(kBase64UrlAlphabet[(buffer << (6 - bits)) & 0x3FU]);
  }
  return out;
}

std::string BinaryId::to_uuid_string() const {
  std::string out;
  out.reserve(kUuidLength);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHexDigits[bytes[i] >> 4]);
    out.push_back(kHexDigits[bytes[i] & 0x0F]);
  }
  return out;
}

}  // namespace alog::core
