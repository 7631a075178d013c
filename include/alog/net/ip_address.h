#pragma once

#include "alog/core/result.h"
#include "alog/core/types.h"

#include <string>
#include <string_view>

namespace alog::net {

enum class AddressFamily {
  kUnspecified,
  kIpv4,
  kIpv6,
};

// IpAddress is a parsed network origin held in the fixed 16-byte storage layout.
// IPv4 addresses occupy the IPv4-mapped IPv6 range (::ffff:a.b.c.d), so a stored
// value decodes back to the family it was written with.
// A default-constructed address has family kUnspecified and cannot be anonymized.
class IpAddress {
 public:
  IpAddress() = default;

  [[nodiscard]] static core::Result<IpAddress, core::Error> parse(std::string_view text);

  // Decode the 16-byte storage form.
  [[nodiscard]] static IpAddress from_storage(const core::Bytes16& bytes);
  [[nodiscard]] static core::Result<IpAddress, core::Error> from_storage(const void* data,
                                                                         std::size_t size);

  [[nodiscard]] static IpAddress ipv4(std::uint8_t a, std::uint8_t b, std::uint8_t c,
                                      std::uint8_t d);
  [[nodiscard]] static IpAddress loopback() { return ipv4(127, 0, 0, 1); }

  [[nodiscard]] AddressFamily family() const { return family_; }
  [[nodiscard]] bool is_v4() const { return family_ == AddressFamily::kIpv4; }
  [[nodiscard]] bool is_v6() const { return family_ == AddressFamily::kIpv6; }

  [[nodiscard]] const core::Bytes16& storage_bytes() const { return bytes_; }

  // Compressed text form ("1.2.3.4", "2001:db8::1").
  [[nodiscard]] std::string to_string() const;

  // Fully expanded text form; IPv6 renders all eight zero-padded groups.
  [[nodiscard]] std::string to_exploded() const;

  // Copy with the low `host_bits` bits of the address cleared.
  // host_bits counts within the family's own width (32 for IPv4, 128 for IPv6).
  [[nodiscard]] IpAddress with_host_bits_cleared(unsigned int host_bits) const;

  bool operator==(const IpAddress&) const = default;

 private:
  IpAddress(AddressFamily family, const core::Bytes16& bytes) : family_(family), bytes_(bytes) {}

  AddressFamily family_{AddressFamily::kUnspecified};
  core::Bytes16 bytes_{};
};

// Host bits cleared by origin anonymization.
constexpr unsigned int kIpv4AnonymizedHostBits = 16;
constexpr unsigned int kIpv6AnonymizedHostBits = 80;

// anonymize coarsens an origin: IPv4 keeps its top 16 bits, IPv6 its top 48 bits.
// Fails with kUnsupportedAddressFamily for any other family.
[[nodiscard]] core::Result<IpAddress, core::Error> anonymize(const IpAddress& address);

}  // namespace alog::net
