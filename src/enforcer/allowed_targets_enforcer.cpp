#include <mandate/enforcer/allowed_targets_enforcer.hpp>
#include <mandate/schema/terms.hpp>

#include <algorithm>

namespace mandate::enforcer {

std::optional<allowed_targets_enforcer::terms_t>
allowed_targets_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.empty() || terms.size() % mandate::schema::kAddressWidth != 0) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto decoded = terms_t{};
  while (!reader.done()) {
    decoded.targets.push_back(reader.read_address());
  }
  return decoded;
}

mandate::schema::bytes_t allowed_targets_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  for (const auto& target : terms.targets) {
    writer.write_address(target);
  }
  return writer.release();
}

mandate::schema::result_t allowed_targets_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t allowed_targets_enforcer::before_hook(
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

  const auto& target = single_execution(call).target;
  if (std::find(std::begin(terms->targets), std::end(terms->targets),
                target) == std::end(terms->targets)) {
    return enforcer_error(kName,
                          mandate::schema::error_code::unauthorized_target,
                          "target-address-not-allowed");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
