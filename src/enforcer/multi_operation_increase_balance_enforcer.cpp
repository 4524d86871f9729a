#include <mandate/enforcer/balance_tracker.hpp>
#include <mandate/enforcer/multi_operation_increase_balance_enforcer.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

namespace {

mandate::schema::bytes_t make_tracker_key(
    const std::string_view enforcer,
    const mandate::schema::address_t& caller,
    const increase_balance_terms_t& terms) {
  auto key = make_state_key(enforcer, caller);
  key.write(terms.token).write(terms.recipient);
  return key.data;
}

mandate::schema::result_t track(hook_context_t& context,
                                const std::string_view enforcer,
                                const hook_call_t& call,
                                const increase_balance_terms_t& terms) {
  auto guard = require_default_exec_type(enforcer, call.mode);
  if (guard.code != 0) {
    return guard;
  }
  return track_expected_change(
      context, enforcer, make_tracker_key(enforcer, context.caller, terms),
      context.ledger.balance_of(terms.token, terms.recipient), false,
      terms.amount);
}

mandate::schema::result_t validate(hook_context_t& context,
                                   const std::string_view enforcer,
                                   const increase_balance_terms_t& terms) {
  return validate_expected_change(
      context, enforcer, make_tracker_key(enforcer, context.caller, terms),
      context.ledger.balance_of(terms.token, terms.recipient));
}

}  // namespace

std::optional<native_token_multi_operation_increase_balance_enforcer::terms_t>
native_token_multi_operation_increase_balance_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() !=
      mandate::schema::kAddressWidth + mandate::schema::kWordWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto recipient = reader.read_address();
  auto amount = reader.read_uint256();
  return terms_t{.token = mandate::schema::kNativeAsset,
                 .recipient = recipient,
                 .amount = amount};
}

mandate::schema::bytes_t
native_token_multi_operation_increase_balance_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_address(terms.recipient).write_uint256(terms.amount);
  return writer.release();
}

mandate::schema::result_t
native_token_multi_operation_increase_balance_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t
native_token_multi_operation_increase_balance_enforcer::before_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return track(context, kName, call, *terms);
}

mandate::schema::result_t
native_token_multi_operation_increase_balance_enforcer::after_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return validate(context, kName, *terms);
}

std::optional<token_multi_operation_increase_balance_enforcer::terms_t>
token_multi_operation_increase_balance_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() !=
      (2 * mandate::schema::kAddressWidth) + mandate::schema::kWordWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto token = reader.read_address();
  auto recipient = reader.read_address();
  auto amount = reader.read_uint256();
  return terms_t{.token = token, .recipient = recipient, .amount = amount};
}

mandate::schema::bytes_t
token_multi_operation_increase_balance_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_address(terms.token)
      .write_address(terms.recipient)
      .write_uint256(terms.amount);
  return writer.release();
}

mandate::schema::result_t
token_multi_operation_increase_balance_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t
token_multi_operation_increase_balance_enforcer::before_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return track(context, kName, call, *terms);
}

mandate::schema::result_t
token_multi_operation_increase_balance_enforcer::after_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return validate(context, kName, *terms);
}

}  // namespace mandate::enforcer
