#include <gtest/gtest.h>
#include <mandate/enforcer/caveat_enforcer.hpp>
#include <mandate/schema/encoding/scale/balance_lock.hpp>
#include <mandate/schema/encoding/scale/balance_tracker.hpp>
#include <mandate/schema/encoding/scale/period_state.hpp>
#include <mandate/schema/delegation.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>
#include <mandate/schema/execution.hpp>
#include <mandate/testing/common.hpp>
#include <mandate/testing/delegation_builder.hpp>

namespace {

mandate::schema::delegation_t make_sample_delegation() {
  auto caveat = mandate::schema::caveat_t{
      .enforcer = mandate::testing::make_address(0xE1),
      .terms = mandate::schema::bytes_t{0x01, 0x02, 0x03},
      .args = mandate::schema::bytes_t{0x09}};
  auto delegation = mandate::testing::make_root_delegation(
      mandate::testing::kAlice, mandate::testing::kBob, {caveat}, 7);
  delegation.signature = mandate::schema::bytes_t{0xAA, 0xBB};
  return delegation;
}

}  // namespace

TEST(encoding_types, delegation_scale_round_trips) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto delegation = make_sample_delegation();
  auto encoded = encoder.encode(delegation);
  auto decoded = encoder.try_decode<mandate::schema::delegation_t>(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, delegation);
}

TEST(encoding_types, delegation_fields_keep_their_wire_order) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(make_sample_delegation());
  ASSERT_EQ(encoded.size(), 138u);

  // version, delegate, delegator, authority
  EXPECT_EQ(encoded[0], 0x01);
  EXPECT_EQ(encoded[1], 0x00);
  EXPECT_EQ(encoded[2], 0x22);
  EXPECT_EQ(encoded[21], 0x22);
  EXPECT_EQ(encoded[22], 0x11);
  EXPECT_EQ(encoded[41], 0x11);
  // one caveat: version, enforcer, terms, args
  EXPECT_EQ(encoded[74], 0x04);
  EXPECT_EQ(encoded[75], 0x01);
  EXPECT_EQ(encoded[77], 0xE1);
  EXPECT_EQ(encoded[97], 0x0C);
  EXPECT_EQ(encoded[98], 0x01);
  EXPECT_EQ(encoded[101], 0x04);
  EXPECT_EQ(encoded[102], 0x09);
  // salt, little endian, then the signature
  EXPECT_EQ(encoded[103], 0x07);
  EXPECT_EQ(encoded[135], 0x08);
  EXPECT_EQ(encoded[136], 0xAA);
  EXPECT_EQ(encoded[137], 0xBB);
}

TEST(encoding_types, enforcer_state_fields_keep_their_wire_order) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto tracker = mandate::enforcer::balance_tracker_t{.balance_before = 1,
                                                      .expected_increase = 2,
                                                      .expected_decrease = 3,
                                                      .pending = 4};
  auto encoded = encoder.encode(tracker);
  ASSERT_EQ(encoded.size(), (3u * 32u) + 8u);
  EXPECT_EQ(encoded[0], 1);
  EXPECT_EQ(encoded[32], 2);
  EXPECT_EQ(encoded[64], 3);
  EXPECT_EQ(encoded[96], 4);
  auto tracker_back =
      encoder.try_decode<mandate::enforcer::balance_tracker_t>(encoded);
  ASSERT_TRUE(tracker_back.has_value());
  EXPECT_EQ(tracker_back->expected_decrease, 3);
  EXPECT_EQ(tracker_back->pending, 4u);

  encoded = encoder.encode(mandate::enforcer::period_state_t{
      .last_claim_period = 5, .claimed_in_period = 6});
  ASSERT_EQ(encoded.size(), 64u);
  EXPECT_EQ(encoded[0], 5);
  EXPECT_EQ(encoded[32], 6);

  encoded = encoder.encode(mandate::enforcer::token_balance_gte_enforcer::lock_t{
      .locked = true, .balance_before = 9});
  ASSERT_EQ(encoded.size(), 33u);
  EXPECT_EQ(encoded[0], 1);
  EXPECT_EQ(encoded[1], 9);
}

TEST(encoding_types, execution_payload_scale_round_trips) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto batch = mandate::schema::execution_batch_t{
      mandate::schema::make_execution(mandate::testing::kToken, 0,
                                      mandate::schema::bytes_t{0x01}),
      mandate::schema::make_execution(mandate::testing::kCarol, 10, {})};
  auto encoded = encoder.encode(batch);
  auto decoded = encoder.try_decode<mandate::schema::execution_batch_t>(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, batch);
}

TEST(encoding_types, try_decode_rejects_garbage) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto garbage = mandate::schema::bytes_t{0xFF, 0xFF, 0xFF};
  EXPECT_FALSE(
      encoder.try_decode<mandate::schema::delegation_t>(garbage).has_value());
}

TEST(encoding_types, decode_exact_rejects_trailing_bytes) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto batch = mandate::schema::execution_batch_t{
      mandate::schema::make_execution(mandate::testing::kToken, 1, {})};
  auto encoded = encoder.encode(batch);
  EXPECT_TRUE(
      mandate::enforcer::decode_exact<mandate::schema::execution_batch_t>(
          encoded)
          .has_value());

  encoded.push_back(0x00);
  EXPECT_FALSE(
      mandate::enforcer::decode_exact<mandate::schema::execution_batch_t>(
          encoded)
          .has_value());
}

TEST(encoding_types, delegation_hash_ignores_args_and_signature) {
  auto delegation = make_sample_delegation();
  auto hash = mandate::schema::hash_delegation(delegation);

  auto redeemed = delegation;
  redeemed.caveats[0].args = mandate::schema::bytes_t{0x42, 0x43};
  redeemed.signature.clear();
  EXPECT_EQ(mandate::schema::hash_delegation(redeemed), hash);
}

TEST(encoding_types, delegation_hash_covers_terms_and_salt) {
  auto delegation = make_sample_delegation();
  auto hash = mandate::schema::hash_delegation(delegation);

  auto other_terms = delegation;
  other_terms.caveats[0].terms.push_back(0x04);
  EXPECT_NE(mandate::schema::hash_delegation(other_terms), hash);

  auto other_salt = delegation;
  other_salt.salt = 8;
  EXPECT_NE(mandate::schema::hash_delegation(other_salt), hash);
}

TEST(encoding_types, signing_digest_binds_the_manager) {
  auto hash = mandate::schema::hash_delegation(make_sample_delegation());
  auto first = mandate::schema::make_signing_digest(
      mandate::testing::make_address(0xA0), hash);
  auto second = mandate::schema::make_signing_digest(
      mandate::testing::make_address(0xA2), hash);
  EXPECT_NE(first, second);
  EXPECT_NE(first, hash);
}

TEST(encoding_types, child_delegation_points_at_parent_hash) {
  auto parent = make_sample_delegation();
  auto child = mandate::testing::make_child_delegation(parent,
                                                       mandate::testing::kCarol);
  EXPECT_EQ(child.authority, mandate::schema::hash_delegation(parent));
  EXPECT_EQ(child.delegator, mandate::testing::kBob);
  EXPECT_EQ(child.delegate, mandate::testing::kCarol);
}
