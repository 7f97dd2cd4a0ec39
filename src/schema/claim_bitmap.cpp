#include <tentacle/schema/claim_bitmap.hpp>

namespace tentacle::schema {

std::vector<claim_type_id_t> set_bits(const claim_bitmap_t& bitmap) {
  auto out = std::vector<claim_type_id_t>{};
  out.reserve(count(bitmap));
  for (auto i = std::size_t{0}; i < kClaimTypeCount; ++i) {
    const auto id = static_cast<claim_type_id_t>(i);
    if (is_set(bitmap, id)) {
      out.push_back(id);
    }
  }
  return out;
}

}  // namespace tentacle::schema
