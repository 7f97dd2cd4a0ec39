#include <gtest/gtest.h>
#include <tentacle/schema/claim_bitmap.hpp>

using namespace tentacle::schema;

TEST(claim_bitmap, default_is_empty) {
  auto bitmap = claim_bitmap_t{};
  EXPECT_TRUE(none(bitmap));
  EXPECT_EQ(count(bitmap), 0u);
  for (auto i = 0u; i < kClaimTypeCount; ++i) {
    EXPECT_FALSE(is_set(bitmap, static_cast<claim_type_id_t>(i)));
  }
}

TEST(claim_bitmap, set_touches_only_the_named_bit) {
  for (auto i = 0u; i < kClaimTypeCount; ++i) {
    const auto id = static_cast<claim_type_id_t>(i);
    auto bitmap = set(claim_bitmap_t{}, id);
    EXPECT_TRUE(is_set(bitmap, id));
    EXPECT_EQ(count(bitmap), 1u);
    EXPECT_EQ(set_bits(bitmap), std::vector<claim_type_id_t>{id});
  }
}

TEST(claim_bitmap, set_is_idempotent_and_clear_restores) {
  auto bitmap = set(set(claim_bitmap_t{}, 7), 200);
  auto before = bitmap;
  bitmap = set(bitmap, 7);
  EXPECT_EQ(bitmap, before);

  bitmap = set(bitmap, 255);
  bitmap = clear(bitmap, 255);
  EXPECT_EQ(bitmap, before);

  bitmap = clear(bitmap, 3);
  EXPECT_EQ(bitmap, before);
}

TEST(claim_bitmap, edges_of_the_id_range_are_distinct) {
  auto bitmap = set(set(claim_bitmap_t{}, 0), 255);
  EXPECT_TRUE(is_set(bitmap, 0));
  EXPECT_TRUE(is_set(bitmap, 255));
  EXPECT_FALSE(is_set(bitmap, 1));
  EXPECT_FALSE(is_set(bitmap, 254));
  EXPECT_EQ(bitmap.bits.front(), 0x01u);
  EXPECT_EQ(bitmap.bits.back(), 0x80u);

  bitmap = clear(bitmap, 0);
  EXPECT_FALSE(is_set(bitmap, 0));
  EXPECT_TRUE(is_set(bitmap, 255));
}

TEST(claim_bitmap, set_bits_is_ascending) {
  auto bitmap = claim_bitmap_t{};
  for (const auto id : {claim_type_id_t{200}, claim_type_id_t{2},
                        claim_type_id_t{64}, claim_type_id_t{0}}) {
    bitmap = set(bitmap, id);
  }
  EXPECT_EQ(set_bits(bitmap),
            (std::vector<claim_type_id_t>{0, 2, 64, 200}));
  EXPECT_EQ(count(bitmap), 4u);
  EXPECT_FALSE(none(bitmap));
}

TEST(claim_bitmap, usable_in_constant_expressions) {
  constexpr auto bitmap = set(claim_bitmap_t{}, 9);
  static_assert(is_set(bitmap, 9));
  static_assert(!is_set(clear(bitmap, 9), 9));
  static_assert(count(bitmap) == 1);
  SUCCEED();
}
