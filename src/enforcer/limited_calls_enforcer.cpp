#include <mandate/common/checked_math.hpp>
#include <mandate/enforcer/limited_calls_enforcer.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

namespace {

mandate::schema::result_t count_call(hook_context_t& context,
                                     const std::string_view enforcer,
                                     const mandate::schema::bytes_view_t& key,
                                     const mandate::schema::amount_t& limit) {
  auto count =
      context.store.get<mandate::schema::amount_t>(key).value_or(0);
  if (count >= limit) {
    return enforcer_error(enforcer,
                          mandate::schema::error_code::limit_exceeded,
                          "limit-exceeded");
  }
  context.store.put(key, mandate::common::checked_add(count, 1));
  return mandate::schema::make_ok();
}

mandate::schema::bytes_t make_count_key(
    const std::string_view enforcer,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) {
  auto key = make_state_key(enforcer, caller);
  key.write(delegation_hash);
  return key.data;
}

}  // namespace

std::optional<call_limit_terms_t> get_call_limit_terms(
    const std::string_view enforcer,
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != mandate::schema::kWordWidth) {
    error = invalid_terms_length(enforcer);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  return call_limit_terms_t{.limit = reader.read_uint256()};
}

mandate::schema::bytes_t encode_call_limit_terms(
    const call_limit_terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint256(terms.limit);
  return writer.release();
}

std::optional<limited_calls_enforcer::terms_t>
limited_calls_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  return get_call_limit_terms(kName, terms, error);
}

mandate::schema::bytes_t limited_calls_enforcer::encode_terms(
    const terms_t& terms) {
  return encode_call_limit_terms(terms);
}

mandate::schema::result_t limited_calls_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::amount_t limited_calls_enforcer::call_count(
    const mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) const {
  return store
      .get<mandate::schema::amount_t>(
          make_count_key(kName, caller, delegation_hash))
      .value_or(0);
}

mandate::schema::result_t limited_calls_enforcer::before_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return count_call(context, kName,
                    make_count_key(kName, context.caller, call.delegation_hash),
                    terms->limit);
}

std::optional<redeemer_limited_calls_enforcer::terms_t>
redeemer_limited_calls_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  return get_call_limit_terms(kName, terms, error);
}

mandate::schema::bytes_t redeemer_limited_calls_enforcer::encode_terms(
    const terms_t& terms) {
  return encode_call_limit_terms(terms);
}

mandate::schema::result_t redeemer_limited_calls_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::amount_t redeemer_limited_calls_enforcer::call_count(
    const mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash,
    const mandate::schema::address_t& redeemer) const {
  auto key = make_state_key(kName, caller);
  key.write(delegation_hash).write(redeemer);
  return store.get<mandate::schema::amount_t>(key.data).value_or(0);
}

mandate::schema::result_t redeemer_limited_calls_enforcer::before_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  auto key = make_state_key(kName, context.caller);
  key.write(call.delegation_hash).write(call.redeemer);
  return count_call(context, kName, key.data, terms->limit);
}

}  // namespace mandate::enforcer
