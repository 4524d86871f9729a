#include <mandate/common/checked_math.hpp>
#include <mandate/enforcer/allowance.hpp>
#include <mandate/enforcer/payment.hpp>
#include <mandate/enforcer/token_swap_offer_enforcer.hpp>
#include <mandate/schema/call_data.hpp>
#include <mandate/schema/terms.hpp>

#include <spdlog/spdlog.h>

namespace mandate::enforcer {

namespace {

inline constexpr auto kTermsLength = (3 * mandate::schema::kAddressWidth) +
                                     (2 * mandate::schema::kWordWidth);

mandate::schema::bytes_t make_claimed_key(
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) {
  auto key = make_state_key(token_swap_offer_enforcer::kName, caller);
  key.write(delegation_hash);
  return key.data;
}

std::optional<mandate::schema::amount_t> claimed_amount_of(
    const token_swap_offer_enforcer::terms_t& terms,
    const mandate::schema::execution_t& execution,
    mandate::schema::result_t& error) {
  if (terms.token_out == mandate::schema::kNativeAsset) {
    if (!execution.payload.empty()) {
      error = enforcer_error(token_swap_offer_enforcer::kName,
                             mandate::schema::error_code::invalid_method,
                             "invalid-method");
      return std::nullopt;
    }
    return execution.value;
  }
  if (execution.value != 0) {
    error = enforcer_error(token_swap_offer_enforcer::kName,
                           mandate::schema::error_code::invalid_execution,
                           "invalid-value");
    return std::nullopt;
  }
  if (execution.target != terms.token_out) {
    error = enforcer_error(token_swap_offer_enforcer::kName,
                           mandate::schema::error_code::invalid_token,
                           "invalid-token");
    return std::nullopt;
  }
  auto transfer = mandate::schema::decode_transfer(execution.payload);
  if (!transfer) {
    error = enforcer_error(token_swap_offer_enforcer::kName,
                           mandate::schema::error_code::invalid_method,
                           "invalid-method");
    return std::nullopt;
  }
  return transfer->amount;
}

}  // namespace

std::optional<token_swap_offer_enforcer::terms_t>
token_swap_offer_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != kTermsLength) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto info = terms_t{};
  info.token_in = reader.read_address();
  info.token_out = reader.read_address();
  info.amount_in = reader.read_uint256();
  info.amount_out = reader.read_uint256();
  info.recipient = reader.read_address();
  if (info.amount_in == 0 || info.amount_out == 0) {
    error = enforcer_error(kName, mandate::schema::error_code::invalid_terms,
                           "invalid-zero-amount");
    return std::nullopt;
  }
  return info;
}

mandate::schema::bytes_t token_swap_offer_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_address(terms.token_in)
      .write_address(terms.token_out)
      .write_uint256(terms.amount_in)
      .write_uint256(terms.amount_out)
      .write_address(terms.recipient);
  return writer.release();
}

mandate::schema::amount_t token_swap_offer_enforcer::required_input(
    const terms_t& terms,
    const mandate::schema::amount_t& claimed_out) {
  auto scaled = mandate::common::checked_mul(claimed_out, terms.amount_in);
  auto rounded = mandate::common::checked_add(
      scaled, mandate::schema::amount_t{terms.amount_out - 1});
  return mandate::schema::amount_t{rounded / terms.amount_out};
}

mandate::schema::result_t token_swap_offer_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::amount_t token_swap_offer_enforcer::claimed(
    const mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) const {
  return load_amount(store, make_claimed_key(caller, delegation_hash));
}

mandate::schema::result_t token_swap_offer_enforcer::before_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto guard = require_single_default(kName, call.mode);
  if (guard.code != 0) {
    return guard;
  }
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  auto claim = claimed_amount_of(*terms, single_execution(call), error);
  if (!claim) {
    return error;
  }

  auto key = make_claimed_key(context.caller, call.delegation_hash);
  auto total = mandate::common::checked_add(load_amount(context.store, key),
                                            *claim);
  if (total > terms->amount_out) {
    return enforcer_error(kName,
                          mandate::schema::error_code::exceeds_output_amount,
                          "exceeds-output-amount");
  }
  context.store.put(key, total);

  auto allowance = decode_allowance(kName, call.args, error);
  if (!allowance) {
    return error;
  }
  bind_allowance(context.enforcers, *allowance,
                 encode_payment_binding(call.delegation_hash, call.redeemer));

  auto required = required_input(*terms, *claim);
  spdlog::debug("{}: claim of {} requires {} from {}", kName, claim->str(),
                required.str(), mandate::schema::to_hex(call.redeemer));

  auto payment =
      terms->token_in == mandate::schema::kNativeAsset
          ? mandate::schema::make_execution(terms->recipient, required, {})
          : mandate::schema::make_execution(
                terms->token_in, 0,
                mandate::schema::encode_transfer(terms->recipient, required));
  return collect_payment(context, kName, call.enforcer, *allowance,
                         terms->token_in, terms->recipient, required, payment);
}

}  // namespace mandate::enforcer
