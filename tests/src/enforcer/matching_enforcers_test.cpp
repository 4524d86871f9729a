#include <gtest/gtest.h>
#include <mandate/enforcer/allowed_calldata_enforcer.hpp>
#include <mandate/enforcer/allowed_methods_enforcer.hpp>
#include <mandate/enforcer/allowed_targets_enforcer.hpp>
#include <mandate/enforcer/exact_calldata_batch_enforcer.hpp>
#include <mandate/enforcer/exact_calldata_enforcer.hpp>
#include <mandate/enforcer/exact_execution_batch_enforcer.hpp>
#include <mandate/enforcer/exact_execution_enforcer.hpp>
#include <mandate/enforcer/no_calldata_enforcer.hpp>
#include <mandate/enforcer/redeemer_enforcer.hpp>
#include <mandate/enforcer/value_lte_enforcer.hpp>
#include <mandate/schema/terms.hpp>
#include <mandate/testing/delegation_builder.hpp>
#include <mandate/testing/world.hpp>

namespace {

using mandate::testing::kAlice;
using mandate::testing::kBob;
using mandate::testing::kCarol;
using mandate::testing::kDave;
using mandate::testing::kOtherToken;
using mandate::testing::kToken;

struct matching_fixture_t {
  matching_fixture_t() {
    world.fund(kToken, kAlice, 1000);
    world.fund(kOtherToken, kAlice, 1000);
    world.fund(mandate::schema::kNativeAsset, kAlice, 1000);
  }

  mandate::schema::result_t redeem_with(
      const mandate::schema::caveat_t& caveat,
      mandate::schema::execution_payload_t payload,
      const mandate::schema::execution_mode_t& mode =
          mandate::schema::kSingleDefaultMode) {
    auto root = mandate::testing::make_root_delegation(kAlice, kBob, {caveat});
    return world.redeem(kBob, {root}, std::move(payload), mode);
  }

  mandate::testing::world_t world;
};

}  // namespace

TEST(allowed_targets_enforcer, accepts_listed_targets_only) {
  auto fixture = matching_fixture_t{};
  auto caveat = fixture.world.caveat(
      mandate::enforcer::allowed_targets_enforcer::kName,
      mandate::enforcer::allowed_targets_enforcer::encode_terms(
          {.targets = {kToken, kDave}}));

  auto result = fixture.redeem_with(
      caveat, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(result.code, 0u) << result.log;

  result = fixture.redeem_with(
      caveat, mandate::testing::make_token_transfer(kOtherToken, kBob, 1));
  EXPECT_EQ(result.log, "allowed_targets:target-address-not-allowed");
  EXPECT_EQ(result.codespace, "mandate.enforcer");
  EXPECT_EQ(fixture.world.balance(kOtherToken, kBob), 0);
}

TEST(allowed_targets_enforcer, requires_single_default_mode) {
  auto fixture = matching_fixture_t{};
  auto caveat = fixture.world.caveat(
      mandate::enforcer::allowed_targets_enforcer::kName,
      mandate::enforcer::allowed_targets_enforcer::encode_terms(
          {.targets = {kToken}}));

  auto result = fixture.redeem_with(
      caveat, mandate::testing::make_token_transfer(kToken, kBob, 1),
      mandate::schema::kSingleTryMode);
  EXPECT_EQ(result.log, "allowed_targets:invalid-execution-type");

  result = fixture.redeem_with(
      caveat,
      mandate::schema::execution_batch_t{
          mandate::testing::make_token_transfer(kToken, kBob, 1)},
      mandate::schema::kBatchDefaultMode);
  EXPECT_EQ(result.log, "allowed_targets:invalid-call-type");
}

TEST(allowed_targets_enforcer, rejects_ragged_terms) {
  auto enforcer = mandate::enforcer::allowed_targets_enforcer{};
  auto terms = mandate::schema::bytes_t(21, 0x01);
  EXPECT_EQ(enforcer.check_terms(terms).log,
            "allowed_targets:invalid-terms-length");
  EXPECT_NE(enforcer.check_terms(mandate::schema::bytes_t{}).code, 0u);
}

TEST(allowed_methods_enforcer, matches_the_selector) {
  auto fixture = matching_fixture_t{};
  auto caveat = fixture.world.caveat(
      mandate::enforcer::allowed_methods_enforcer::kName,
      mandate::enforcer::allowed_methods_enforcer::encode_terms(
          {.selectors = {mandate::schema::transfer_selector()}}));

  auto result = fixture.redeem_with(
      caveat, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(result.code, 0u) << result.log;

  result = fixture.redeem_with(
      caveat, mandate::schema::make_execution(
                  kDave, 0,
                  mandate::schema::encode_call(
                      mandate::schema::make_selector("approve(address,uint256)"),
                      {})));
  EXPECT_EQ(result.log, "allowed_methods:method-not-allowed");

  result = fixture.redeem_with(
      caveat, mandate::schema::make_execution(
                  kDave, 0, mandate::schema::bytes_t{0x01, 0x02}));
  EXPECT_EQ(result.log, "allowed_methods:invalid-execution-data-length");
}

TEST(allowed_calldata_enforcer, matches_bytes_at_offset) {
  auto fixture = matching_fixture_t{};
  auto recipient_word = mandate::schema::to_word(kBob);
  auto caveat = fixture.world.caveat(
      mandate::enforcer::allowed_calldata_enforcer::kName,
      mandate::enforcer::allowed_calldata_enforcer::encode_terms(
          {.start = mandate::schema::kSelectorWidth,
           .value = mandate::schema::bytes_t{std::begin(recipient_word),
                                             std::end(recipient_word)}}));

  auto result = fixture.redeem_with(
      caveat, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(result.code, 0u) << result.log;

  result = fixture.redeem_with(
      caveat, mandate::testing::make_token_transfer(kToken, kCarol, 1));
  EXPECT_EQ(result.log, "allowed_calldata:invalid-calldata");

  // A window past the end of the payload never matches.
  result = fixture.redeem_with(
      caveat, mandate::schema::make_execution(
                  kDave, 0, mandate::schema::bytes_t{0x01, 0x02, 0x03, 0x04}));
  EXPECT_EQ(result.log, "allowed_calldata:invalid-calldata");
}

TEST(allowed_calldata_enforcer, requires_a_value) {
  auto enforcer = mandate::enforcer::allowed_calldata_enforcer{};
  auto terms = mandate::enforcer::allowed_calldata_enforcer::encode_terms(
      {.start = 0});
  EXPECT_EQ(enforcer.check_terms(terms).log,
            "allowed_calldata:invalid-terms-length");
}

TEST(exact_calldata_enforcer, compares_whole_payload) {
  auto fixture = matching_fixture_t{};
  auto payload = mandate::schema::encode_transfer(kBob, 5);
  auto caveat = fixture.world.caveat(
      mandate::enforcer::exact_calldata_enforcer::kName, payload);

  auto result = fixture.redeem_with(
      caveat, mandate::schema::make_execution(kToken, 0, payload));
  EXPECT_EQ(result.code, 0u) << result.log;

  result = fixture.redeem_with(
      caveat, mandate::testing::make_token_transfer(kToken, kBob, 6));
  EXPECT_EQ(result.log, "exact_calldata:invalid-calldata");
}

TEST(exact_calldata_batch_enforcer, compares_payloads_per_index) {
  auto fixture = matching_fixture_t{};
  auto signed_batch = mandate::schema::execution_batch_t{
      mandate::testing::make_token_transfer(kToken, kBob, 1),
      mandate::testing::make_token_transfer(kToken, kCarol, 2)};
  auto caveat = fixture.world.caveat(
      mandate::enforcer::exact_calldata_batch_enforcer::kName,
      mandate::enforcer::exact_calldata_batch_enforcer::encode_terms(
          signed_batch));

  // Targets may differ; only payloads are compared.
  auto batch = signed_batch;
  batch[1].target = kOtherToken;
  auto result = fixture.redeem_with(caveat, batch,
                                    mandate::schema::kBatchDefaultMode);
  EXPECT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(fixture.world.balance(kOtherToken, kCarol), 2);

  batch.pop_back();
  result = fixture.redeem_with(caveat, batch,
                               mandate::schema::kBatchDefaultMode);
  EXPECT_EQ(result.log, "exact_calldata_batch:invalid-batch-size");

  batch = signed_batch;
  batch[0].payload = mandate::schema::encode_transfer(kDave, 1);
  result = fixture.redeem_with(caveat, batch,
                               mandate::schema::kBatchDefaultMode);
  EXPECT_EQ(result.log, "exact_calldata_batch:invalid-calldata");

  result = fixture.redeem_with(caveat, signed_batch,
                               mandate::schema::kBatchTryMode);
  EXPECT_EQ(result.log, "exact_calldata_batch:invalid-execution-type");
}

TEST(exact_execution_enforcer, compares_target_value_and_payload) {
  auto fixture = matching_fixture_t{};
  auto expected = mandate::schema::make_execution(kCarol, 3, {});
  auto caveat = fixture.world.caveat(
      mandate::enforcer::exact_execution_enforcer::kName,
      mandate::enforcer::exact_execution_enforcer::encode_terms(expected));

  auto result = fixture.redeem_with(caveat, expected);
  EXPECT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(fixture.world.balance(mandate::schema::kNativeAsset, kCarol), 3);

  result = fixture.redeem_with(caveat,
                               mandate::schema::make_execution(kCarol, 4, {}));
  EXPECT_EQ(result.log, "exact_execution:invalid-execution");
  result = fixture.redeem_with(caveat,
                               mandate::schema::make_execution(kDave, 3, {}));
  EXPECT_EQ(result.log, "exact_execution:invalid-execution");
}

TEST(exact_execution_batch_enforcer, compares_every_execution) {
  auto fixture = matching_fixture_t{};
  auto signed_batch = mandate::schema::execution_batch_t{
      mandate::schema::make_execution(kCarol, 1, {}),
      mandate::testing::make_token_transfer(kToken, kDave, 2)};
  auto caveat = fixture.world.caveat(
      mandate::enforcer::exact_execution_batch_enforcer::kName,
      mandate::enforcer::exact_execution_batch_enforcer::encode_terms(
          signed_batch));

  auto result = fixture.redeem_with(caveat, signed_batch,
                                    mandate::schema::kBatchDefaultMode);
  EXPECT_EQ(result.code, 0u) << result.log;

  auto batch = signed_batch;
  batch[1].target = kOtherToken;
  result = fixture.redeem_with(caveat, batch,
                               mandate::schema::kBatchDefaultMode);
  EXPECT_EQ(result.log, "exact_execution_batch:invalid-execution");

  EXPECT_NE(
      fixture.world.enforcers
          .find(fixture.world.enforcers.at(
              mandate::enforcer::exact_execution_batch_enforcer::kName))
          ->check_terms(mandate::schema::bytes_t{0xFF, 0xFF})
          .code,
      0u);
}

TEST(no_calldata_enforcer, rejects_any_payload) {
  auto fixture = matching_fixture_t{};
  auto caveat =
      fixture.world.caveat(mandate::enforcer::no_calldata_enforcer::kName, {});

  auto result = fixture.redeem_with(
      caveat, mandate::schema::make_execution(kCarol, 5, {}));
  EXPECT_EQ(result.code, 0u) << result.log;

  result = fixture.redeem_with(
      caveat,
      mandate::schema::execution_batch_t{
          mandate::schema::make_execution(kCarol, 1, {}),
          mandate::testing::make_token_transfer(kToken, kCarol, 1)},
      mandate::schema::kBatchDefaultMode);
  EXPECT_EQ(result.log, "no_calldata:invalid-calldata");
  EXPECT_EQ(fixture.world.balance(mandate::schema::kNativeAsset, kCarol), 5);
}

TEST(redeemer_enforcer, restricts_open_delegations) {
  auto fixture = matching_fixture_t{};
  auto caveat = fixture.world.caveat(
      mandate::enforcer::redeemer_enforcer::kName,
      mandate::enforcer::redeemer_enforcer::encode_terms(
          {.redeemers = {kCarol}}));
  auto open = mandate::testing::make_root_delegation(
      kAlice, mandate::schema::kAnyDelegate, {caveat});

  auto result = fixture.world.redeem(
      kCarol, {open}, mandate::testing::make_token_transfer(kToken, kCarol, 1));
  EXPECT_EQ(result.code, 0u) << result.log;

  result = fixture.world.redeem(
      kDave, {open}, mandate::testing::make_token_transfer(kToken, kDave, 1));
  EXPECT_EQ(result.log, "redeemer:unauthorized-redeemer");
  EXPECT_EQ(mandate::schema::category_of(mandate::schema::code_of(result)),
            mandate::schema::error_category::policy);
}

TEST(value_lte_enforcer, caps_native_value) {
  auto fixture = matching_fixture_t{};
  auto caveat = fixture.world.caveat(
      mandate::enforcer::value_lte_enforcer::kName,
      mandate::enforcer::value_lte_enforcer::encode_terms({.max_value = 10}));

  auto result = fixture.redeem_with(
      caveat, mandate::schema::make_execution(kCarol, 10, {}));
  EXPECT_EQ(result.code, 0u) << result.log;

  result = fixture.redeem_with(
      caveat, mandate::schema::make_execution(kCarol, 11, {}));
  EXPECT_EQ(result.log, "value_lte:value-too-high");
  EXPECT_EQ(fixture.world.balance(mandate::schema::kNativeAsset, kCarol), 10);
}
