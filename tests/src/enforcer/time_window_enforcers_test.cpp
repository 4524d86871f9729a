#include <gtest/gtest.h>
#include <mandate/enforcer/block_height_enforcer.hpp>
#include <mandate/enforcer/timestamp_enforcer.hpp>
#include <mandate/testing/delegation_builder.hpp>
#include <mandate/testing/world.hpp>

namespace {

using mandate::enforcer::block_height_enforcer;
using mandate::enforcer::timestamp_enforcer;
using mandate::testing::kAlice;
using mandate::testing::kBob;
using mandate::testing::kToken;

mandate::schema::result_t redeem_once(
    mandate::testing::world_t& world,
    const mandate::schema::caveat_t& caveat) {
  auto root = mandate::testing::make_root_delegation(kAlice, kBob, {caveat});
  return world.redeem(kBob, {root},
                      mandate::testing::make_token_transfer(kToken, kBob, 1));
}

}  // namespace

TEST(timestamp_enforcer, window_bounds_are_inclusive) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);
  auto caveat = world.caveat(
      timestamp_enforcer::kName,
      timestamp_enforcer::encode_terms({.after = 2000, .before = 3000}));

  world.set_time(1999);
  EXPECT_EQ(redeem_once(world, caveat).log, "timestamp:early-delegation");

  world.set_time(2000);
  EXPECT_EQ(redeem_once(world, caveat).code, 0u);

  world.set_time(3000);
  EXPECT_EQ(redeem_once(world, caveat).code, 0u);

  world.set_time(3001);
  auto result = redeem_once(world, caveat);
  EXPECT_EQ(result.log, "timestamp:expired-delegation");
  EXPECT_EQ(mandate::schema::code_of(result),
            mandate::schema::error_code::expired_delegation);
  EXPECT_EQ(world.balance(kToken, kBob), 2);
}

TEST(timestamp_enforcer, zero_leaves_a_side_open) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);

  auto only_before = world.caveat(
      timestamp_enforcer::kName,
      timestamp_enforcer::encode_terms({.after = 0, .before = 500}));
  world.set_time(1);
  EXPECT_EQ(redeem_once(world, only_before).code, 0u);

  auto only_after = world.caveat(
      timestamp_enforcer::kName,
      timestamp_enforcer::encode_terms({.after = 500, .before = 0}));
  world.set_time(4'000'000'000);
  EXPECT_EQ(redeem_once(world, only_after).code, 0u);
}

TEST(timestamp_enforcer, terms_are_two_uint128s) {
  auto enforcer = timestamp_enforcer{};
  EXPECT_EQ(timestamp_enforcer::encode_terms({.after = 1, .before = 2}).size(),
            32u);
  EXPECT_EQ(enforcer.check_terms(mandate::schema::bytes_t(31, 0x00)).log,
            "timestamp:invalid-terms-length");
}

TEST(block_height_enforcer, window_bounds_are_inclusive) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);
  auto caveat = world.caveat(
      block_height_enforcer::kName,
      block_height_enforcer::encode_terms({.after = 10, .before = 20}));

  world.set_height(9);
  EXPECT_EQ(redeem_once(world, caveat).log, "block_height:early-delegation");
  world.set_height(10);
  EXPECT_EQ(redeem_once(world, caveat).code, 0u);
  world.set_height(20);
  EXPECT_EQ(redeem_once(world, caveat).code, 0u);
  world.set_height(21);
  EXPECT_EQ(redeem_once(world, caveat).log, "block_height:expired-delegation");
}

TEST(block_height_enforcer, terms_are_two_uint64s) {
  auto enforcer = block_height_enforcer{};
  EXPECT_EQ(block_height_enforcer::encode_terms({.after = 1, .before = 2}).size(),
            16u);
  EXPECT_EQ(enforcer.check_terms(mandate::schema::bytes_t(17, 0x00)).log,
            "block_height:invalid-terms-length");
}
