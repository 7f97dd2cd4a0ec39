#include <gtest/gtest.h>
#include <tentacle/testing/engine_fixture.hpp>

using tentacle::schema::lock_error_code;
using tentacle::testing::engine_fixture;
using tentacle::testing::make_address;

namespace {

const auto kOwner = make_address(0x01);
const auto kBeneficiary = make_address(0x02);
const auto kDerivative = make_address(0x30);

}  // namespace

TEST(engine_destroy, missing_claim_is_rejected) {
  auto fixture = engine_fixture{"tentacle_destroy_missing"};
  auto& derivative = fixture.add_claim_type(3, kDerivative);
  fixture.stake(42, kOwner, 1000);

  auto result = fixture.engine().destroy(kOwner, 3, 42, kBeneficiary);
  EXPECT_EQ(result.code, static_cast<uint32_t>(lock_error_code::not_created));
  EXPECT_TRUE(derivative.burns.empty());
}

TEST(engine_destroy, burns_the_current_balance) {
  auto fixture = engine_fixture{"tentacle_destroy_burn"};
  auto& derivative = fixture.add_claim_type(3, kDerivative);
  fixture.stake(42, kOwner, 1000);
  ASSERT_TRUE(
      fixture.engine().create(kOwner, 3, 42, kBeneficiary, std::nullopt).ok());

  fixture.authority().set_balance(42, 600);
  auto result = fixture.engine().destroy(kOwner, 3, 42, kBeneficiary);
  ASSERT_EQ(result.code, 0u) << result.log;
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, "claim_destroyed");

  ASSERT_EQ(derivative.burns.size(), 1u);
  EXPECT_EQ(derivative.burns[0].caller, kOwner);
  EXPECT_EQ(derivative.burns[0].from, kBeneficiary);
  EXPECT_EQ(derivative.burns[0].amount, 600);
  EXPECT_EQ(derivative.balances[kBeneficiary], 400);
  EXPECT_FALSE(fixture.engine().is_outstanding(42, 3));
}

TEST(engine_destroy, failed_burn_keeps_the_claim) {
  auto fixture = engine_fixture{"tentacle_destroy_burn_fails"};
  auto& derivative = fixture.add_claim_type(3, kDerivative);
  fixture.stake(42, kOwner, 1000);
  ASSERT_TRUE(
      fixture.engine().create(kOwner, 3, 42, kBeneficiary, std::nullopt).ok());

  fixture.authority().set_balance(42, 1500);
  auto result = fixture.engine().destroy(kOwner, 3, 42, kBeneficiary);
  EXPECT_EQ(result.code,
            static_cast<uint32_t>(lock_error_code::external_call_failed));
  EXPECT_TRUE(fixture.engine().is_outstanding(42, 3));
  EXPECT_TRUE(derivative.burns.empty());
}

TEST(engine_destroy, only_owner_or_approved_operator_may_destroy) {
  auto fixture = engine_fixture{"tentacle_destroy_auth"};
  fixture.add_claim_type(3, kDerivative);
  fixture.stake(42, kOwner, 1000);
  ASSERT_TRUE(
      fixture.engine().create(kOwner, 3, 42, kBeneficiary, std::nullopt).ok());

  auto result =
      fixture.engine().destroy(make_address(0x77), 3, 42, kBeneficiary);
  EXPECT_EQ(result.code,
            static_cast<uint32_t>(lock_error_code::not_approved_or_owner));
  EXPECT_TRUE(fixture.engine().is_outstanding(42, 3));
}

TEST(engine_destroy, create_then_destroy_restores_the_bitmap) {
  auto fixture = engine_fixture{"tentacle_destroy_round_trip"};
  fixture.add_claim_type(3, kDerivative);
  fixture.add_claim_type(7, make_address(0x31));
  fixture.stake(42, kOwner, 1000);
  ASSERT_TRUE(
      fixture.engine().create(kOwner, 7, 42, kBeneficiary, std::nullopt).ok());
  const auto before = fixture.engine().outstanding(42);

  ASSERT_TRUE(
      fixture.engine().create(kOwner, 3, 42, kBeneficiary, std::nullopt).ok());
  ASSERT_TRUE(fixture.engine().destroy(kOwner, 3, 42, kBeneficiary).ok());
  EXPECT_EQ(fixture.engine().outstanding(42), before);

  EXPECT_TRUE(
      fixture.engine().create(kOwner, 3, 42, kBeneficiary, std::nullopt).ok());
}

TEST(engine_destroy, unconfigured_claim_type_keeps_the_claim) {
  auto fixture = engine_fixture{"tentacle_destroy_unconfigured"};
  auto& derivative = fixture.add_claim_type(3, kDerivative);
  fixture.stake(42, kOwner, 1000);
  ASSERT_TRUE(
      fixture.engine().create(kOwner, 3, 42, kOwner, std::nullopt).ok());

  auto cleared = fixture.engine().configure(engine_fixture::admin(), 3, {},
                                            std::nullopt);
  ASSERT_TRUE(cleared.ok()) << cleared.log;

  auto destroyed = fixture.engine().destroy(kOwner, 3, 42, kOwner);
  EXPECT_EQ(destroyed.code,
            static_cast<uint32_t>(lock_error_code::claim_type_not_configured));
  auto redeemed = fixture.engine().on_redemption(
      fixture.authority().identity(), 42, kOwner);
  EXPECT_EQ(redeemed.code,
            static_cast<uint32_t>(lock_error_code::claim_type_not_configured));
  EXPECT_TRUE(fixture.engine().is_outstanding(42, 3));
  EXPECT_TRUE(derivative.burns.empty());
}

TEST(engine_destroy, unreachable_derivative_keeps_the_claim) {
  auto fixture = engine_fixture{"tentacle_destroy_missing"};
  auto& derivative = fixture.add_claim_type(3, kDerivative);
  fixture.stake(42, kOwner, 1000);
  ASSERT_TRUE(
      fixture.engine().create(kOwner, 3, 42, kOwner, std::nullopt).ok());

  auto repointed = fixture.engine().configure(
      engine_fixture::admin(), 3, {.derivative_contract = make_address(0x31)},
      std::nullopt);
  ASSERT_TRUE(repointed.ok()) << repointed.log;

  auto result = fixture.engine().destroy(kOwner, 3, 42, kOwner);
  EXPECT_EQ(result.code,
            static_cast<uint32_t>(lock_error_code::call_target_missing));
  EXPECT_TRUE(fixture.engine().is_outstanding(42, 3));
  EXPECT_TRUE(derivative.burns.empty());
}
