#include <mandate/schema/error_code.hpp>

namespace mandate::schema {

error_category category_of(const error_code code) {
  switch (code) {
    case error_code::ok:
      return error_category::none;
    case error_code::invalid_terms_length:
    case error_code::invalid_terms:
    case error_code::invalid_args:
      return error_category::terms;
    case error_code::invalid_call_type:
    case error_code::invalid_execution_type:
    case error_code::execution_failed:
    case error_code::batch_length_mismatch:
      return error_category::execution;
    case error_code::enforcer_locked:
      return error_category::state_conflict;
    case error_code::arithmetic_error:
      return error_category::arithmetic;
    case error_code::invalid_signature:
    case error_code::invalid_authority:
    case error_code::invalid_delegate:
    case error_code::invalid_delegator:
    case error_code::disabled_delegation:
    case error_code::unknown_enforcer:
    case error_code::already_disabled:
    case error_code::already_enabled:
    case error_code::paused:
    case error_code::unauthorized_caller:
      return error_category::authority;
    default:
      return error_category::policy;
  }
}

std::string_view to_string(const error_code code) {
  switch (code) {
    case error_code::ok:
      return "ok";
    case error_code::invalid_terms_length:
      return "invalid_terms_length";
    case error_code::invalid_terms:
      return "invalid_terms";
    case error_code::invalid_args:
      return "invalid_args";
    case error_code::invalid_call_type:
      return "invalid_call_type";
    case error_code::invalid_execution_type:
      return "invalid_execution_type";
    case error_code::invalid_execution:
      return "invalid_execution";
    case error_code::invalid_calldata:
      return "invalid_calldata";
    case error_code::invalid_batch_size:
      return "invalid_batch_size";
    case error_code::execution_failed:
      return "execution_failed";
    case error_code::batch_length_mismatch:
      return "batch_length_mismatch";
    case error_code::allowance_exceeded:
      return "allowance_exceeded";
    case error_code::limit_exceeded:
      return "limit_exceeded";
    case error_code::insufficient_balance_change:
      return "insufficient_balance_change";
    case error_code::excessive_balance_decrease:
      return "excessive_balance_decrease";
    case error_code::zero_expected_change:
      return "zero_expected_change";
    case error_code::early_delegation:
      return "early_delegation";
    case error_code::expired_delegation:
      return "expired_delegation";
    case error_code::unauthorized_target:
      return "unauthorized_target";
    case error_code::unauthorized_method:
      return "unauthorized_method";
    case error_code::unauthorized_redeemer:
      return "unauthorized_redeemer";
    case error_code::claim_amount_exceeded:
      return "claim_amount_exceeded";
    case error_code::claim_not_started:
      return "claim_not_started";
    case error_code::id_already_used:
      return "id_already_used";
    case error_code::invalid_nonce:
      return "invalid_nonce";
    case error_code::invalid_group_index:
      return "invalid_group_index";
    case error_code::invalid_caveat_args_length:
      return "invalid_caveat_args_length";
    case error_code::invalid_token:
      return "invalid_token";
    case error_code::invalid_method:
      return "invalid_method";
    case error_code::exceeds_output_amount:
      return "exceeds_output_amount";
    case error_code::args_mismatch:
      return "args_mismatch";
    case error_code::value_exceeded:
      return "value_exceeded";
    case error_code::delegation_already_used:
      return "delegation_already_used";
    case error_code::payment_not_received:
      return "payment_not_received";
    case error_code::enforcer_locked:
      return "enforcer_locked";
    case error_code::arithmetic_error:
      return "arithmetic_error";
    case error_code::invalid_signature:
      return "invalid_signature";
    case error_code::invalid_authority:
      return "invalid_authority";
    case error_code::invalid_delegate:
      return "invalid_delegate";
    case error_code::invalid_delegator:
      return "invalid_delegator";
    case error_code::disabled_delegation:
      return "disabled_delegation";
    case error_code::unknown_enforcer:
      return "unknown_enforcer";
    case error_code::already_disabled:
      return "already_disabled";
    case error_code::already_enabled:
      return "already_enabled";
    case error_code::paused:
      return "paused";
    case error_code::unauthorized_caller:
      return "unauthorized_caller";
  }
  return "unknown";
}

std::string_view to_string(const error_category category) {
  switch (category) {
    case error_category::none:
      return "none";
    case error_category::terms:
      return "terms";
    case error_category::policy:
      return "policy";
    case error_category::state_conflict:
      return "state_conflict";
    case error_category::arithmetic:
      return "arithmetic";
    case error_category::authority:
      return "authority";
    case error_category::execution:
      return "execution";
  }
  return "unknown";
}

}  // namespace mandate::schema
