#include <mandate/enforcer/exact_execution_enforcer.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

std::optional<exact_execution_enforcer::terms_t>
exact_execution_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() <
      mandate::schema::kAddressWidth + mandate::schema::kWordWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto target = reader.read_address();
  auto value = reader.read_uint256();
  return mandate::schema::make_execution(
      target, value, mandate::schema::make_bytes(reader.read_rest()));
}

mandate::schema::bytes_t exact_execution_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_address(terms.target)
      .write_uint256(terms.value)
      .write_bytes(terms.payload);
  return writer.release();
}

mandate::schema::result_t exact_execution_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t exact_execution_enforcer::before_hook(
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
  if (single_execution(call) != *terms) {
    return enforcer_error(kName,
                          mandate::schema::error_code::invalid_execution,
                          "invalid-execution");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
