#include <mandate/enforcer/value_lte_enforcer.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

std::optional<value_lte_enforcer::terms_t> value_lte_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != mandate::schema::kWordWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  return terms_t{.max_value = reader.read_uint256()};
}

mandate::schema::bytes_t value_lte_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint256(terms.max_value);
  return writer.release();
}

mandate::schema::result_t value_lte_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t value_lte_enforcer::before_hook(
    hook_context_t&,
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
  if (single_execution(call).value > terms->max_value) {
    return enforcer_error(kName, mandate::schema::error_code::value_exceeded,
                          "value-too-high");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
