#pragma once

#include <cstdint>
#include <string_view>

namespace mandate::schema {

enum class error_code : uint32_t {
  ok = 0,

  // Malformed configuration.
  invalid_terms_length = 1,
  invalid_terms = 2,
  invalid_args = 3,

  // Execution shape and mode.
  invalid_call_type = 10,
  invalid_execution_type = 11,
  invalid_execution = 12,
  invalid_calldata = 13,
  invalid_batch_size = 14,
  execution_failed = 15,
  batch_length_mismatch = 16,

  // Policy violations.
  allowance_exceeded = 20,
  limit_exceeded = 21,
  insufficient_balance_change = 22,
  excessive_balance_decrease = 23,
  zero_expected_change = 24,
  early_delegation = 25,
  expired_delegation = 26,
  unauthorized_target = 27,
  unauthorized_method = 28,
  unauthorized_redeemer = 29,
  claim_amount_exceeded = 30,
  claim_not_started = 31,
  id_already_used = 32,
  invalid_nonce = 33,
  invalid_group_index = 34,
  invalid_caveat_args_length = 35,
  invalid_token = 36,
  invalid_method = 37,
  exceeds_output_amount = 38,
  args_mismatch = 39,
  value_exceeded = 40,
  delegation_already_used = 41,
  payment_not_received = 42,

  // Reentrant misuse of a single-use tracker.
  enforcer_locked = 50,

  arithmetic_error = 60,

  // Authority and delegation chain.
  invalid_signature = 70,
  invalid_authority = 71,
  invalid_delegate = 72,
  invalid_delegator = 73,
  disabled_delegation = 74,
  unknown_enforcer = 75,
  already_disabled = 76,
  already_enabled = 77,
  paused = 78,
  unauthorized_caller = 79,
};

enum class error_category : uint8_t {
  none = 0,
  terms = 1,
  policy = 2,
  state_conflict = 3,
  arithmetic = 4,
  authority = 5,
  execution = 6,
};

error_category category_of(error_code code);
std::string_view to_string(error_code code);
std::string_view to_string(error_category category);

}  // namespace mandate::schema
