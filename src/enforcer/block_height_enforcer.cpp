#include <mandate/enforcer/block_height_enforcer.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

std::optional<block_height_enforcer::terms_t>
block_height_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != 2 * mandate::schema::kUint64Width) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto after = reader.read_uint64();
  auto before = reader.read_uint64();
  return terms_t{.after = after, .before = before};
}

mandate::schema::bytes_t block_height_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint64(terms.after).write_uint64(terms.before);
  return writer.release();
}

mandate::schema::result_t block_height_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t block_height_enforcer::before_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  auto height = context.environment.height;
  if (terms->after > 0 && height < terms->after) {
    return enforcer_error(kName, mandate::schema::error_code::early_delegation,
                          "early-delegation");
  }
  if (terms->before > 0 && height > terms->before) {
    return enforcer_error(kName,
                          mandate::schema::error_code::expired_delegation,
                          "expired-delegation");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
