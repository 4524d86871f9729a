#include <mandate/enforcer/redeemer_enforcer.hpp>
#include <mandate/schema/terms.hpp>

#include <algorithm>

namespace mandate::enforcer {

std::optional<redeemer_enforcer::terms_t> redeemer_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.empty() || terms.size() % mandate::schema::kAddressWidth != 0) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto decoded = terms_t{};
  while (!reader.done()) {
    decoded.redeemers.push_back(reader.read_address());
  }
  return decoded;
}

mandate::schema::bytes_t redeemer_enforcer::encode_terms(const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  for (const auto& redeemer : terms.redeemers) {
    writer.write_address(redeemer);
  }
  return writer.release();
}

mandate::schema::result_t redeemer_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t redeemer_enforcer::before_hook(
    hook_context_t&,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  if (std::find(std::begin(terms->redeemers), std::end(terms->redeemers),
                call.redeemer) == std::end(terms->redeemers)) {
    return enforcer_error(kName,
                          mandate::schema::error_code::unauthorized_redeemer,
                          "unauthorized-redeemer");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
