#include <gtest/gtest.h>
#include <mandate/enforcer/balance_change_enforcer.hpp>
#include <mandate/enforcer/block_height_enforcer.hpp>
#include <mandate/enforcer/id_enforcer.hpp>
#include <mandate/enforcer/limited_calls_enforcer.hpp>
#include <mandate/enforcer/multi_operation_increase_balance_enforcer.hpp>
#include <mandate/enforcer/native_token_payment_enforcer.hpp>
#include <mandate/enforcer/native_token_transfer_amount_enforcer.hpp>
#include <mandate/enforcer/nonce_enforcer.hpp>
#include <mandate/enforcer/period_transfer_enforcer.hpp>
#include <mandate/enforcer/streaming_enforcer.hpp>
#include <mandate/enforcer/timestamp_enforcer.hpp>
#include <mandate/enforcer/token_balance_gte_enforcer.hpp>
#include <mandate/enforcer/token_swap_offer_enforcer.hpp>
#include <mandate/enforcer/token_transfer_amount_enforcer.hpp>
#include <mandate/enforcer/value_lte_enforcer.hpp>
#include <mandate/testing/common.hpp>

#include <string>

namespace {

using namespace mandate::enforcer;
using mandate::testing::kBob;
using mandate::testing::kCarol;
using mandate::testing::kOtherToken;
using mandate::testing::kToken;

// Every field carried on the wire is set away from its default, so a field
// the decoder drops shows up as a mismatch.
template <typename Enforcer>
struct sample_terms;

template <>
struct sample_terms<native_balance_change_enforcer> {
  static native_balance_change_enforcer::terms_t make() {
    return {.direction = balance_change_t::decrease,
            .recipient = kCarol,
            .amount = 42};
  }
};

template <>
struct sample_terms<token_balance_change_enforcer> {
  static token_balance_change_enforcer::terms_t make() {
    return {.direction = balance_change_t::decrease,
            .token = kToken,
            .recipient = kCarol,
            .amount = 42};
  }
};

template <>
struct sample_terms<multi_token_balance_change_enforcer> {
  static multi_token_balance_change_enforcer::terms_t make() {
    return {.direction = balance_change_t::decrease,
            .token = kToken,
            .recipient = kCarol,
            .token_id = 9,
            .amount = 42};
  }
};

template <>
struct sample_terms<native_token_multi_operation_increase_balance_enforcer> {
  static native_token_multi_operation_increase_balance_enforcer::terms_t
  make() {
    return {.recipient = kCarol, .amount = 42};
  }
};

template <>
struct sample_terms<token_multi_operation_increase_balance_enforcer> {
  static token_multi_operation_increase_balance_enforcer::terms_t make() {
    return {.token = kToken, .recipient = kCarol, .amount = 42};
  }
};

template <>
struct sample_terms<token_balance_gte_enforcer> {
  static token_balance_gte_enforcer::terms_t make() {
    return {.token = kToken, .recipient = kCarol, .amount = 42};
  }
};

template <>
struct sample_terms<limited_calls_enforcer> {
  static limited_calls_enforcer::terms_t make() { return {.limit = 3}; }
};

template <>
struct sample_terms<redeemer_limited_calls_enforcer> {
  static redeemer_limited_calls_enforcer::terms_t make() {
    return {.limit = 3};
  }
};

template <>
struct sample_terms<native_token_transfer_amount_enforcer> {
  static native_token_transfer_amount_enforcer::terms_t make() {
    return {.allowance = 500};
  }
};

template <>
struct sample_terms<token_transfer_amount_enforcer> {
  static token_transfer_amount_enforcer::terms_t make() {
    return {.token = kToken, .max_amount = 500};
  }
};

template <>
struct sample_terms<native_token_streaming_enforcer> {
  static native_token_streaming_enforcer::terms_t make() {
    return {.initial_amount = 10,
            .max_amount = 100,
            .amount_per_second = 2,
            .start_time = 1000};
  }
};

template <>
struct sample_terms<token_streaming_enforcer> {
  static token_streaming_enforcer::terms_t make() {
    return {.token = kToken,
            .stream = sample_terms<native_token_streaming_enforcer>::make()};
  }
};

template <>
struct sample_terms<native_token_period_transfer_enforcer> {
  static native_token_period_transfer_enforcer::terms_t make() {
    return {.period_amount = 100, .period_duration = 60, .start_date = 1000};
  }
};

template <>
struct sample_terms<token_period_transfer_enforcer> {
  static token_period_transfer_enforcer::terms_t make() {
    return {.token = kToken,
            .period =
                sample_terms<native_token_period_transfer_enforcer>::make()};
  }
};

template <>
struct sample_terms<value_lte_enforcer> {
  static value_lte_enforcer::terms_t make() { return {.max_value = 77}; }
};

template <>
struct sample_terms<id_enforcer> {
  static id_enforcer::terms_t make() { return {.id = 1234}; }
};

template <>
struct sample_terms<nonce_enforcer> {
  static nonce_enforcer::terms_t make() { return {.nonce = 5}; }
};

template <>
struct sample_terms<block_height_enforcer> {
  static block_height_enforcer::terms_t make() {
    return {.after = 100, .before = 200};
  }
};

template <>
struct sample_terms<timestamp_enforcer> {
  static timestamp_enforcer::terms_t make() {
    return {.after = 1000, .before = 2000};
  }
};

template <>
struct sample_terms<native_token_payment_enforcer> {
  static native_token_payment_enforcer::terms_t make() {
    return {.recipient = kCarol, .amount = 4};
  }
};

template <>
struct sample_terms<token_swap_offer_enforcer> {
  static token_swap_offer_enforcer::terms_t make() {
    return {.token_in = kToken,
            .token_out = kOtherToken,
            .amount_in = 50,
            .amount_out = 100,
            .recipient = kBob};
  }
};

template <typename Enforcer>
class fixed_width_terms : public ::testing::Test {};

using fixed_width_enforcers = ::testing::Types<
    native_balance_change_enforcer,
    token_balance_change_enforcer,
    multi_token_balance_change_enforcer,
    native_token_multi_operation_increase_balance_enforcer,
    token_multi_operation_increase_balance_enforcer,
    token_balance_gte_enforcer,
    limited_calls_enforcer,
    redeemer_limited_calls_enforcer,
    native_token_transfer_amount_enforcer,
    token_transfer_amount_enforcer,
    native_token_streaming_enforcer,
    token_streaming_enforcer,
    native_token_period_transfer_enforcer,
    token_period_transfer_enforcer,
    value_lte_enforcer,
    id_enforcer,
    nonce_enforcer,
    block_height_enforcer,
    timestamp_enforcer,
    native_token_payment_enforcer,
    token_swap_offer_enforcer>;

}  // namespace

TYPED_TEST_SUITE(fixed_width_terms, fixed_width_enforcers);

TYPED_TEST(fixed_width_terms, decoding_inverts_encoding) {
  auto sample = sample_terms<TypeParam>::make();
  auto encoded = TypeParam::encode_terms(sample);

  auto error = mandate::schema::make_ok();
  auto decoded = TypeParam::get_terms_info(encoded, error);
  ASSERT_TRUE(decoded.has_value()) << error.log;
  EXPECT_EQ(error.code, 0u);
  EXPECT_TRUE(*decoded == sample);
  EXPECT_EQ(TypeParam::encode_terms(*decoded), encoded);

  auto enforcer = TypeParam{};
  EXPECT_EQ(enforcer.check_terms(encoded).code, 0u);
}

TYPED_TEST(fixed_width_terms, rejects_one_byte_off_the_width) {
  auto encoded = TypeParam::encode_terms(sample_terms<TypeParam>::make());
  auto shorter = encoded;
  shorter.pop_back();
  auto longer = encoded;
  longer.push_back(0);

  auto enforcer = TypeParam{};
  const auto expected = std::string{TypeParam::kName} + ":invalid-terms-length";
  for (const auto& terms : {shorter, longer}) {
    auto result = enforcer.check_terms(terms);
    EXPECT_EQ(result.log, expected) << terms.size();
    EXPECT_EQ(mandate::schema::code_of(result),
              mandate::schema::error_code::invalid_terms_length);

    auto error = mandate::schema::make_ok();
    EXPECT_FALSE(TypeParam::get_terms_info(terms, error).has_value());
    EXPECT_EQ(error.log, expected);
  }
}
