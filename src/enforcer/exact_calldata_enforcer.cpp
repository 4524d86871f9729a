#include <mandate/enforcer/exact_calldata_enforcer.hpp>

#include <algorithm>

namespace mandate::enforcer {

mandate::schema::result_t exact_calldata_enforcer::check_terms(
    const mandate::schema::bytes_view_t&) const {
  return mandate::schema::make_ok();
}

mandate::schema::result_t exact_calldata_enforcer::before_hook(
    hook_context_t&,
    const hook_call_t& call) {
  auto guard = require_single_default(kName, call.mode);
  if (guard.code != 0) {
    return guard;
  }
  const auto& payload = single_execution(call).payload;
  if (!std::equal(std::begin(call.terms), std::end(call.terms),
                  std::begin(payload), std::end(payload))) {
    return enforcer_error(kName, mandate::schema::error_code::invalid_calldata,
                          "invalid-calldata");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
