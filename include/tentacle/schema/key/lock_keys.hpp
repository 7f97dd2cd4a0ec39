#pragma once

#include <tentacle/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: lock keys.
// Lock workflow: canonical key prefixes and key codecs for the outstanding
// bitmaps and the claim registry.
namespace tentacle::schema::key {

inline constexpr std::string_view kBitmapKeyPrefix{"SYS|STATE|BITMAP|"};
inline constexpr std::string_view kClaimTypeKeyPrefix{"SYS|STATE|CLAIM_TYPE|"};
inline constexpr std::string_view kDefaultHelperKeyPrefix{
    "SYS|STATE|DEFAULT_HELPER|"};

template <typename Encoder, typename T>
tentacle::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
tentacle::schema::bytes_t make_bitmap_key(
    Encoder& encoder,
    const tentacle::schema::position_id_t position_id) {
  return make_prefixed_key(encoder, kBitmapKeyPrefix, position_id);
}

template <typename Encoder>
tentacle::schema::bytes_t make_claim_type_key(
    Encoder& encoder,
    const tentacle::schema::claim_type_id_t claim_type_id) {
  return make_prefixed_key(encoder, kClaimTypeKeyPrefix, claim_type_id);
}

template <typename Encoder>
tentacle::schema::bytes_t make_default_helper_key(
    Encoder& encoder,
    const tentacle::schema::claim_type_id_t claim_type_id) {
  return make_prefixed_key(encoder, kDefaultHelperKeyPrefix, claim_type_id);
}

}  // namespace tentacle::schema::key
