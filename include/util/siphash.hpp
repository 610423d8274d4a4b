// Copyright (c) 2016-present The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license.

#ifndef NETDASH_UTIL_SIPHASH_HPP
#define NETDASH_UTIL_SIPHASH_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace netdash {
namespace util {

// SipHash-2-4 over a byte stream.
// Condenses the network identity payload (subnets, addresses, gateway, Wi-Fi
// identity) into a short fingerprint that changes when the host roams.
//
// Writes may be split at any byte boundary; the digest only depends on the
// concatenated input.
class SipHasher {
public:
  SipHasher(uint64_t k0, uint64_t k1);

  SipHasher& Write(const uint8_t* data, size_t len);
  SipHasher& Write(std::string_view text);

  // 64-bit digest of everything written so far. The hasher stays usable.
  uint64_t Finalize() const;

  // Finalize() as 16 lowercase hex digits.
  std::string HexDigest() const;

private:
  static constexpr uint64_t C0{0x736f6d6570736575ULL};
  static constexpr uint64_t C1{0x646f72616e646f6dULL};
  static constexpr uint64_t C2{0x6c7967656e657261ULL};
  static constexpr uint64_t C3{0x7465646279746573ULL};

  std::array<uint64_t, 4> v_;
  // Bytes of the current, incomplete word
  uint64_t pending_{0};
  uint64_t length_{0};
};

}  // namespace util
}  // namespace netdash

#endif  // NETDASH_UTIL_SIPHASH_HPP
