#include <mandate/enforcer/allowance.hpp>
#include <mandate/enforcer/native_token_transfer_amount_enforcer.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

namespace {

mandate::schema::bytes_t make_spent_key(
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) {
  auto key = make_state_key(native_token_transfer_amount_enforcer::kName,
                            caller);
  key.write(delegation_hash);
  return key.data;
}

}  // namespace

std::optional<native_token_transfer_amount_enforcer::terms_t>
native_token_transfer_amount_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != mandate::schema::kWordWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  return terms_t{.allowance = reader.read_uint256()};
}

mandate::schema::bytes_t native_token_transfer_amount_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint256(terms.allowance);
  return writer.release();
}

mandate::schema::result_t native_token_transfer_amount_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::amount_t native_token_transfer_amount_enforcer::spent(
    const mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) const {
  return load_amount(store, make_spent_key(caller, delegation_hash));
}

mandate::schema::result_t native_token_transfer_amount_enforcer::before_hook(
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
  return spend_within(context, kName,
                      make_spent_key(context.caller, call.delegation_hash),
                      single_execution(call).value, terms->allowance);
}

}  // namespace mandate::enforcer
