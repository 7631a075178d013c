#include "alog/net/ip_address.h"

#include <arpa/inet.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>

namespace alog::net {

namespace {

constexpr std::size_t kMappedPrefixLength = 12;
constexpr std::size_t kIpv4Offset = 12;
constexpr unsigned int kIpv4Width = 32;
constexpr unsigned int kIpv6Width = 128;

bool is_ipv4_mapped(const core::Bytes16& bytes) {
  for (std::size_t i = 0; i < 10; ++i) {
    if (bytes[i] != 0) {
      return false;
    }
  }
  return bytes[10] == 0xFF && bytes[11] == 0xFF;
}

core::Bytes16 map_ipv4(const std::uint8_t* octets) {
  core::Bytes16 bytes{};
  bytes[10] = 0xFF;
  bytes[11] = 0xFF;
  std::memcpy(bytes.data() + kMappedPrefixLength, octets, 4);
  return bytes;
}

}  // namespace

core::Result<IpAddress, core::Error> IpAddress::parse(std::string_view text) {
  const std::string input(text);

  std::array<std::uint8_t, 4> v4{};
  if (inet_pton(AF_INET, input.c_str(), v4.data()) == 1) {
    return core::Result<IpAddress, core::Error>::ok(
        IpAddress(AddressFamily::kIpv4, map_ipv4(v4.data())));
  }

  core::Bytes16 v6{};
  if (inet_pton(AF_INET6, input.c_str(), v6.data()) == 1) {
    // "::ffff:a.b.c.d" is the storage form of an IPv4 address and is treated as one.
    return core::Result<IpAddress, core::Error>::ok(from_storage(v6));
  }

  return core::fail<IpAddress>(core::ErrorCode::kInvalidAddress,
                               "Invalid network address: '" + input + "'");
}

IpAddress IpAddress::from_storage(const core::Bytes16& bytes) {
  if (is_ipv4_mapped(bytes)) {
    return IpAddress(AddressFamily::kIpv4, bytes);
  }
  return IpAddress(AddressFamily::kIpv6, bytes);
}

core::Result<IpAddress, core::Error> IpAddress::from_storage(const void* data,
                                                             const std::size_t size) {
  core::Bytes16 bytes{};
  if (data == nullptr || size != bytes.size()) {
    return core::fail<IpAddress>(
        core::ErrorCode::kInvalidAddress,
        "Invalid stored network address: expected 16 bytes, got " + std::to_string(size));
  }
  std::memcpy(bytes.data(), data, bytes.size());
  return core::Result<IpAddress, core::Error>::ok(from_storage(bytes));
}

IpAddress IpAddress::ipv4(const std::uint8_t a, const std::uint8_t b, const std::uint8_t c,
                          const std::uint8_t d) {
  const std::array<std::uint8_t, 4> octets{a, b, c, d};
  return IpAddress(AddressFamily::kIpv4, map_ipv4(octets.data()));
}

std::string IpAddress::to_string() const {
  std::array<char, INET6_ADDRSTRLEN> buffer{};
  switch (family_) {
    case AddressFamily::kIpv4:
      if (inet_ntop(AF_INET, bytes_.data() + kIpv4Offset, buffer.data(), buffer.size()) ==
          nullptr) {
        return {};
      }
      return buffer.data();
    case AddressFamily::kIpv6:
      if (inet_ntop(AF_INET6, bytes_.data(), buffer.data(), buffer.size()) == nullptr) {
        return {};
      }
      return buffer.data();
    case AddressFamily::kUnspecified:
      break;
  }
  return {};
}

std::string IpAddress::to_exploded() const {
  if (family_ != AddressFamily::kIpv6) {
    return to_string();
  }

  std::string out;
  out.reserve(39);
  for (std::size_t group = 0; group < 8; ++group) {
    if (group != 0) {
      out.push_back(':');
    }
    std::array<char, 5> hex{};
    std::snprintf(hex.data(), hex.size(), "%02x%02x", bytes_[2 * group], bytes_[2 * group + 1]);
    out.append(hex.data());
  }
  return out;
}

IpAddress IpAddress::with_host_bits_cleared(unsigned int host_bits) const {
  IpAddress result = *this;
  switch (family_) {
    case AddressFamily::kIpv4:
      host_bits = std::min(host_bits, kIpv4Width);
      break;
    case AddressFamily::kIpv6:
      host_bits = std::min(host_bits, kIpv6Width);
      break;
    case AddressFamily::kUnspecified:
      return result;
  }

  // Both families keep their low-order address bytes at the end of the 16-byte layout.
  const std::size_t full_bytes = host_bits / 8;
  const unsigned int partial_bits = host_bits % 8;
  for (std::size_t i = 0; i < full_bytes; ++i) {
    result.bytes_[result.bytes_.size() - 1 - i] = 0;
  }
  if (partial_bits != 0) {
    auto& byte = result.bytes_[result.bytes_.size() - 1 - full_bytes];
    byte = static_cast<std::uint8_t>(byte & ~((1U << partial_bits) - 1U));
  }
  return result;
}

core::Result<IpAddress, core::Error> anonymize(const IpAddress& address) {
  switch (address.family()) {
    case AddressFamily::kIpv4:
      return core::Result<IpAddress, core::Error>::ok(
          address.with_host_bits_cleared(kIpv4AnonymizedHostBits));
    case AddressFamily::kIpv6:
      return core::Result<IpAddress, core::Error>::ok(
          address.with_host_bits_cleared(kIpv6AnonymizedHostBits));
    case AddressFamily::kUnspecified:
      break;
  }
  return core::fail<IpAddress>(core::ErrorCode::kUnsupportedAddressFamily,
                               "Encountered unsupported address family");
}

}  // namespace alog::net
