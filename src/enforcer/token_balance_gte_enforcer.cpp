#include <mandate/common/checked_math.hpp>
#include <mandate/enforcer/token_balance_gte_enforcer.hpp>
#include <mandate/schema/encoding/scale/balance_lock.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

namespace {

mandate::schema::bytes_t make_lock_key(
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash,
    const token_balance_gte_enforcer::terms_t& terms) {
  auto key = make_state_key(token_balance_gte_enforcer::kName, caller);
  key.write(delegation_hash).write(terms.token).write(terms.recipient);
  return key.data;
}

}  // namespace

std::optional<token_balance_gte_enforcer::terms_t>
token_balance_gte_enforcer::get_terms_info(
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

mandate::schema::bytes_t token_balance_gte_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_address(terms.token)
      .write_address(terms.recipient)
      .write_uint256(terms.amount);
  return writer.release();
}

mandate::schema::result_t token_balance_gte_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

bool token_balance_gte_enforcer::is_locked(
    const mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash,
    const terms_t& terms) const {
  auto lock = store.get<lock_t>(make_lock_key(caller, delegation_hash, terms));
  return lock && lock->locked;
}

mandate::schema::result_t token_balance_gte_enforcer::before_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto guard = require_default_exec_type(kName, call.mode);
  if (guard.code != 0) {
    return guard;
  }
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  if (terms->amount == 0) {
    return enforcer_error(kName,
                          mandate::schema::error_code::zero_expected_change,
                          "zero-expected-change");
  }

  auto key = make_lock_key(context.caller, call.delegation_hash, *terms);
  auto lock = context.store.get<lock_t>(key);
  if (lock && lock->locked) {
    return enforcer_error(kName, mandate::schema::error_code::enforcer_locked,
                          "enforcer-is-locked");
  }
  context.store.put(
      key, lock_t{.locked = true,
                  .balance_before = context.ledger.balance_of(
                      terms->token, terms->recipient)});
  return mandate::schema::make_ok();
}

mandate::schema::result_t token_balance_gte_enforcer::after_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }

  auto key = make_lock_key(context.caller, call.delegation_hash, *terms);
  auto lock = context.store.get<lock_t>(key);
  if (!lock || !lock->locked) {
    return enforcer_error(kName, mandate::schema::error_code::enforcer_locked,
                          "enforcer-not-locked");
  }
  context.store.erase(key);

  auto required =
      mandate::common::checked_add(lock->balance_before, terms->amount);
  if (context.ledger.balance_of(terms->token, terms->recipient) < required) {
    return enforcer_error(
        kName, mandate::schema::error_code::insufficient_balance_change,
        "balance-not-gt");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
