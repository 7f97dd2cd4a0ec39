#pragma once
#include <tentacle/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <vector>

// Schema type: claim bitmap.
// Lock workflow: per-position outstanding set, one bit per claim type. Bit `i`
// lives in byte `i / 8` under mask `1 << (i % 8)`. The all-zero value is the
// same as an absent entry.
namespace tentacle::schema {

struct claim_bitmap_t final {
  std::array<uint8_t, kClaimTypeCount / 8> bits{};

  bool operator==(const claim_bitmap_t&) const = default;
};

constexpr bool is_set(const claim_bitmap_t& bitmap, const claim_type_id_t id) {
  return (bitmap.bits[id >> 3u] & static_cast<uint8_t>(1u << (id & 7u))) != 0;
}

constexpr claim_bitmap_t set(claim_bitmap_t bitmap, const claim_type_id_t id) {
  bitmap.bits[id >> 3u] |= static_cast<uint8_t>(1u << (id & 7u));
  return bitmap;
}

constexpr claim_bitmap_t clear(claim_bitmap_t bitmap,
                               const claim_type_id_t id) {
  bitmap.bits[id >> 3u] &= static_cast<uint8_t>(~(1u << (id & 7u)));
  return bitmap;
}

constexpr bool none(const claim_bitmap_t& bitmap) {
  for (const auto byte : bitmap.bits) {
    if (byte != 0) {
      return false;
    }
  }
  return true;
}

constexpr std::size_t count(const claim_bitmap_t& bitmap) {
  auto total = std::size_t{0};
  for (auto byte : bitmap.bits) {
    while (byte != 0) {
      byte &= static_cast<uint8_t>(byte - 1u);
      ++total;
    }
  }
  return total;
}

/// Claim types whose bit is set, ascending.
std::vector<claim_type_id_t> set_bits(const claim_bitmap_t& bitmap);

}  // namespace tentacle::schema
