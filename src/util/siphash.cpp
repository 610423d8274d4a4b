// Copyright (c) 2016-present The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license.

#include "util/siphash.hpp"

#include <bit>

#include <fmt/format.h>

namespace netdash {
namespace util {

namespace {

using State = std::array<uint64_t, 4>;

void SipRound(State& v) {
  v[0] += v[1];
  v[1] = std::rotl(v[1], 13) ^ v[0];
  v[0] = std::rotl(v[0], 32);
  v[2] += v[3];
  v[3] = std::rotl(v[3], 16) ^ v[2];
  v[0] += v[3];
  v[3] = std::rotl(v[3], 21) ^ v[0];
  v[2] += v[1];
  v[1] = std::rotl(v[1], 17) ^ v[2];
  v[2] = std::rotl(v[2], 32);
}

// Absorb one little-endian message word (c = 2 rounds).
void Compress(State& v, uint64_t m) {
  v[3] ^= m;
  SipRound(v);
  SipRound(v);
  v[0] ^= m;
}

}  // namespace

SipHasher::SipHasher(uint64_t k0, uint64_t k1) : v_{C0 ^ k0, C1 ^ k1, C2 ^ k0, C3 ^ k1} {}

SipHasher& SipHasher::Write(const uint8_t* data, size_t len) {
  for (size_t i = 0; i < len; ++i) {
    pending_ |= static_cast<uint64_t>(data[i]) << (8 * (length_ % 8));
    ++length_;
    if (length_ % 8 == 0) {
      Compress(v_, pending_);
      pending_ = 0;
    }
  }
  return *this;
}

SipHasher& SipHasher::Write(std::string_view text) {
  return Write(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

uint64_t SipHasher::Finalize() const {
  State v = v_;
  // Final block: pending tail bytes, message length mod 256 in the top byte
  Compress(v, pending_ | (static_cast<uint64_t>(length_ & 0xff) << 56));
  v[2] ^= 0xff;
  for (int i = 0; i < 4; ++i) {
    SipRound(v);
  }
  return v[0] ^ v[1] ^ v[2] ^ v[3];
}

std::string SipHasher::HexDigest() const {
  return fmt::format("{:016x}", Finalize());
}

}  // namespace util
}  // namespace netdash
