#include <mandate/enforcer/allowance.hpp>
#include <mandate/enforcer/token_transfer_amount_enforcer.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

namespace {

mandate::schema::bytes_t make_spent_key(
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) {
  auto key = make_state_key(token_transfer_amount_enforcer::kName, caller);
  key.write(delegation_hash);
  return key.data;
}

}  // namespace

std::optional<token_transfer_amount_enforcer::terms_t>
token_transfer_amount_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() !=
      mandate::schema::kAddressWidth + mandate::schema::kWordWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto token = reader.read_address();
  auto max_amount = reader.read_uint256();
  return terms_t{.token = token, .max_amount = max_amount};
}

mandate::schema::bytes_t token_transfer_amount_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_address(terms.token).write_uint256(terms.max_amount);
  return writer.release();
}

mandate::schema::result_t token_transfer_amount_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::amount_t token_transfer_amount_enforcer::spent(
    const mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) const {
  return load_amount(store, make_spent_key(caller, delegation_hash));
}

mandate::schema::result_t token_transfer_amount_enforcer::before_hook(
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
  auto amount = token_transfer_amount_of(kName, single_execution(call),
                                         terms->token, error);
  if (!amount) {
    return error;
  }
  return spend_within(context, kName,
                      make_spent_key(context.caller, call.delegation_hash),
                      *amount, terms->max_amount);
}

}  // namespace mandate::enforcer
