#include <mandate/enforcer/allowed_methods_enforcer.hpp>
#include <mandate/schema/call_data.hpp>
#include <mandate/schema/terms.hpp>

#include <algorithm>

namespace mandate::enforcer {

std::optional<allowed_methods_enforcer::terms_t>
allowed_methods_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.empty() || terms.size() % mandate::schema::kSelectorWidth != 0) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto decoded = terms_t{};
  while (!reader.done()) {
    decoded.selectors.push_back(reader.read_selector());
  }
  return decoded;
}

mandate::schema::bytes_t allowed_methods_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  for (const auto& selector : terms.selectors) {
    writer.write_selector(selector);
  }
  return writer.release();
}

mandate::schema::result_t allowed_methods_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t allowed_methods_enforcer::before_hook(
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

  auto selector = mandate::schema::selector_of(single_execution(call).payload);
  if (!selector) {
    return enforcer_error(kName,
                          mandate::schema::error_code::invalid_execution,
                          "invalid-execution-data-length");
  }
  if (std::find(std::begin(terms->selectors), std::end(terms->selectors),
                *selector) == std::end(terms->selectors)) {
    return enforcer_error(kName,
                          mandate::schema::error_code::unauthorized_method,
                          "method-not-allowed");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
