#include <mandate/enforcer/no_calldata_enforcer.hpp>

namespace mandate::enforcer {

mandate::schema::result_t no_calldata_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  if (!terms.empty()) {
    return invalid_terms_length(kName);
  }
  return mandate::schema::make_ok();
}

mandate::schema::result_t no_calldata_enforcer::before_hook(
    hook_context_t&,
    const hook_call_t& call) {
  auto guard = require_default_exec_type(kName, call.mode);
  if (guard.code != 0) {
    return guard;
  }
  auto terms = check_terms(call.terms);
  if (terms.code != 0) {
    return terms;
  }
  for (const auto& execution : mandate::schema::executions_of(call.payload)) {
    if (!execution.payload.empty()) {
      return enforcer_error(kName,
                            mandate::schema::error_code::invalid_calldata,
                            "invalid-calldata");
    }
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
