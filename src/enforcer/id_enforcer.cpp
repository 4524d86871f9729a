#include <mandate/enforcer/id_enforcer.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

namespace {

mandate::schema::bytes_t make_id_key(
    const mandate::schema::address_t& caller,
    const mandate::schema::address_t& delegator,
    const mandate::schema::amount_t& id) {
  auto key = make_state_key(id_enforcer::kName, caller);
  key.write(delegator).write(id);
  return key.data;
}

}  // namespace

std::optional<id_enforcer::terms_t> id_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != mandate::schema::kWordWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  return terms_t{.id = reader.read_uint256()};
}

mandate::schema::bytes_t id_enforcer::encode_terms(const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint256(terms.id);
  return writer.release();
}

mandate::schema::result_t id_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

bool id_enforcer::is_used(const mandate::state::store& store,
                          const mandate::schema::address_t& caller,
                          const mandate::schema::address_t& delegator,
                          const mandate::schema::amount_t& id) const {
  return store.contains(make_id_key(caller, delegator, id));
}

mandate::schema::result_t id_enforcer::before_hook(hook_context_t& context,
                                                   const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  auto key = make_id_key(context.caller, call.delegator, terms->id);
  if (context.store.contains(key)) {
    return enforcer_error(kName, mandate::schema::error_code::id_already_used,
                          "id-already-used");
  }
  context.store.put(key, true);
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
