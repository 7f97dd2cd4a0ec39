#include <blake3.h>
#include <tentacle/blake3/hash.hpp>

namespace tentacle::blake3 {

tentacle::schema::hash32_t fold(const tentacle::schema::hash32_t& seed,
                                const std::span<const uint8_t>& material) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, seed.data(), seed.size());
  blake3_hasher_update(&hasher, material.data(), material.size());
  auto output = tentacle::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace tentacle::blake3
