#include <gtest/gtest.h>
#include <tentacle/schema/primitives.hpp>

TEST(primitives, make_address_accepts_prefixed_hex) {
  auto address = tentacle::schema::make_address(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f1011121314"});
  EXPECT_EQ(address[0], 0x01);
  EXPECT_EQ(address[19], 0x14);
  EXPECT_EQ(tentacle::schema::to_string(address),
            "0x0102030405060708090a0b0c0d0e0f1011121314");
}

TEST(primitives, try_make_address_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(tentacle::schema::try_make_address("0x0102").has_value());
  EXPECT_FALSE(tentacle::schema::try_make_address(
                   "zz02030405060708090a0b0c0d0e0f1011121314")
                   .has_value());
  EXPECT_FALSE(tentacle::schema::try_make_address("abc").has_value());
}

TEST(primitives, zero_address_is_null) {
  EXPECT_TRUE(tentacle::schema::is_null(tentacle::schema::address_t{}));
  auto address = tentacle::schema::address_t{};
  address[19] = 1;
  EXPECT_FALSE(tentacle::schema::is_null(address));
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = tentacle::schema::bytes_t{0x00, 0x7F, 0x80, 0xFF};
  auto encoded = tentacle::schema::to_hex(
      tentacle::schema::bytes_view_t{payload.data(), payload.size()});
  EXPECT_EQ(encoded, "007f80ff");
  EXPECT_EQ(tentacle::schema::from_hex(encoded), payload);
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = tentacle::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}
