#include <mandate/enforcer/native_token_payment_enforcer.hpp>
#include <mandate/enforcer/payment.hpp>
#include <mandate/schema/terms.hpp>

#include <spdlog/spdlog.h>

namespace mandate::enforcer {

std::optional<native_token_payment_enforcer::terms_t>
native_token_payment_enforcer::get_terms_info(
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
  return terms_t{.recipient = recipient, .amount = amount};
}

mandate::schema::bytes_t native_token_payment_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_address(terms.recipient).write_uint256(terms.amount);
  return writer.release();
}

mandate::schema::result_t native_token_payment_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t native_token_payment_enforcer::after_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }

  auto allowance = decode_allowance(kName, call.args, error);
  if (!allowance) {
    return error;
  }
  bind_allowance(context.enforcers, *allowance,
                 encode_payment_binding(call.delegation_hash, call.redeemer));

  spdlog::debug("{}: collecting {} for {}", kName, terms->amount.str(),
                mandate::schema::to_hex(terms->recipient));
  return collect_payment(
      context, kName, call.enforcer, *allowance, mandate::schema::kNativeAsset,
      terms->recipient, terms->amount,
      mandate::schema::make_execution(terms->recipient, terms->amount, {}));
}

}  // namespace mandate::enforcer
