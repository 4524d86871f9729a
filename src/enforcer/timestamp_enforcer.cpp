#include <mandate/enforcer/timestamp_enforcer.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

std::optional<timestamp_enforcer::terms_t> timestamp_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != 2 * mandate::schema::kUint128Width) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto after = reader.read_uint128();
  auto before = reader.read_uint128();
  return terms_t{.after = after, .before = before};
}

mandate::schema::bytes_t timestamp_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint128(terms.after).write_uint128(terms.before);
  return writer.release();
}

mandate::schema::result_t timestamp_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t timestamp_enforcer::before_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  auto now = mandate::schema::uint128_t{context.environment.timestamp};
  if (terms->after > 0 && now < terms->after) {
    return enforcer_error(kName, mandate::schema::error_code::early_delegation,
                          "early-delegation");
  }
  if (terms->before > 0 && now > terms->before) {
    return enforcer_error(kName,
                          mandate::schema::error_code::expired_delegation,
                          "expired-delegation");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
