#include <mandate/common/checked_math.hpp>
#include <mandate/enforcer/nonce_enforcer.hpp>
#include <mandate/schema/terms.hpp>

#include <spdlog/spdlog.h>

namespace mandate::enforcer {

namespace {

mandate::schema::bytes_t make_nonce_key(
    const mandate::schema::address_t& caller,
    const mandate::schema::address_t& delegator) {
  auto key = make_state_key(nonce_enforcer::kName, caller);
  key.write(delegator);
  return key.data;
}

}  // namespace

std::optional<nonce_enforcer::terms_t> nonce_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != mandate::schema::kWordWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  return terms_t{.nonce = reader.read_uint256()};
}

mandate::schema::bytes_t nonce_enforcer::encode_terms(const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint256(terms.nonce);
  return writer.release();
}

mandate::schema::result_t nonce_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::amount_t nonce_enforcer::current_nonce(
    const mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::address_t& delegator) const {
  return store.get<mandate::schema::amount_t>(make_nonce_key(caller, delegator))
      .value_or(0);
}

void nonce_enforcer::increment_nonce(
    mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::address_t& delegator) {
  auto next = mandate::common::checked_add(
      current_nonce(store, caller, delegator), 1);
  store.put(make_nonce_key(caller, delegator), next);
  spdlog::info("Nonce of {} advanced to {}",
               mandate::schema::to_hex(delegator), next.str());
}

mandate::schema::result_t nonce_enforcer::before_hook(hook_context_t& context,
                                                      const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  if (terms->nonce != current_nonce(context.store, context.caller,
                                    call.delegator)) {
    return enforcer_error(kName, mandate::schema::error_code::invalid_nonce,
                          "invalid-nonce");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
