#include <mandate/enforcer/args_equality_check_enforcer.hpp>

#include <algorithm>

namespace mandate::enforcer {

mandate::schema::result_t args_equality_check_enforcer::check_terms(
    const mandate::schema::bytes_view_t&) const {
  return mandate::schema::make_ok();
}

mandate::schema::result_t args_equality_check_enforcer::before_hook(
    hook_context_t&,
    const hook_call_t& call) {
  if (!std::equal(std::begin(call.terms), std::end(call.terms),
                  std::begin(call.args), std::end(call.args))) {
    return enforcer_error(kName, mandate::schema::error_code::args_mismatch,
                          "different-args-and-terms");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
