#pragma once
#include <tentacle/schema/primitives.hpp>
#include <cstdint>
#include <span>

namespace tentacle::blake3 {

/// Chain `material` onto `seed`: blake3(seed || material).
tentacle::schema::hash32_t fold(const tentacle::schema::hash32_t& seed,
                                const std::span<const uint8_t>& material);

}  // namespace tentacle::blake3
