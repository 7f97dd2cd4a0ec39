#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tentacle::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
// Contract, helper and caller identity. All-zero is the null reference.
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
using position_id_t = uint64_t;
using claim_type_id_t = uint8_t;

inline constexpr std::size_t kClaimTypeCount = 256;

bytes_t make_bytes(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

address_t make_address(std::string_view hex);
std::optional<address_t> try_make_address(std::string_view hex);
std::string to_string(const address_t& address);

constexpr bool is_null(const address_t& address) {
  for (const auto byte : address) {
    if (byte != 0) {
      return false;
    }
  }
  return true;
}

hash32_t make_zero_hash();

}  // namespace tentacle::schema
