#include <mandate/enforcer/specific_action_token_transfer_batch_enforcer.hpp>
#include <mandate/schema/call_data.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

namespace {

inline constexpr auto kFixedTermsWidth = (3 * mandate::schema::kAddressWidth) +
                                         mandate::schema::kWordWidth;

mandate::schema::bytes_t make_used_key(
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) {
  auto key = make_state_key(
      specific_action_token_transfer_batch_enforcer::kName, caller);
  key.write(delegation_hash);
  return key.data;
}

}  // namespace

std::optional<specific_action_token_transfer_batch_enforcer::terms_t>
specific_action_token_transfer_batch_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() < kFixedTermsWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto decoded = terms_t{};
  decoded.token = reader.read_address();
  decoded.recipient = reader.read_address();
  decoded.amount = reader.read_uint256();
  decoded.first_target = reader.read_address();
  decoded.first_payload = mandate::schema::make_bytes(reader.read_rest());
  return decoded;
}

mandate::schema::bytes_t
specific_action_token_transfer_batch_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_address(terms.token)
      .write_address(terms.recipient)
      .write_uint256(terms.amount)
      .write_address(terms.first_target)
      .write_bytes(terms.first_payload);
  return writer.release();
}

mandate::schema::result_t
specific_action_token_transfer_batch_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

bool specific_action_token_transfer_batch_enforcer::is_used(
    const mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) const {
  return store.contains(make_used_key(caller, delegation_hash));
}

mandate::schema::result_t
specific_action_token_transfer_batch_enforcer::before_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto guard = require_batch_default(kName, call.mode);
  if (guard.code != 0) {
    return guard;
  }
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }

  auto key = make_used_key(context.caller, call.delegation_hash);
  if (context.store.contains(key)) {
    return enforcer_error(kName,
                          mandate::schema::error_code::delegation_already_used,
                          "delegation-already-used");
  }

  const auto& batch = batch_execution(call);
  if (batch.size() != 2) {
    return enforcer_error(kName,
                          mandate::schema::error_code::invalid_batch_size,
                          "invalid-batch-size");
  }

  const auto& first = batch[0];
  if (first.target != terms->first_target || first.value != 0 ||
      first.payload != terms->first_payload) {
    return enforcer_error(kName,
                          mandate::schema::error_code::invalid_execution,
                          "invalid-first-transaction");
  }

  const auto& second = batch[1];
  if (second.target != terms->token || second.value != 0 ||
      second.payload !=
          mandate::schema::encode_transfer(terms->recipient, terms->amount)) {
    return enforcer_error(kName,
                          mandate::schema::error_code::invalid_execution,
                          "invalid-second-transaction");
  }

  context.store.put(key, true);
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
