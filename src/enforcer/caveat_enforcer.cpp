#include <mandate/enforcer/caveat_enforcer.hpp>
#include <mandate/schema/terms.hpp>

#include <spdlog/fmt/fmt.h>

#include <variant>

namespace mandate::enforcer {

mandate::schema::result_t caveat_enforcer::before_all_hook(hook_context_t&,
                                                           const hook_call_t&) {
  return mandate::schema::make_ok();
}

mandate::schema::result_t caveat_enforcer::before_hook(hook_context_t&,
                                                       const hook_call_t&) {
  return mandate::schema::make_ok();
}

mandate::schema::result_t caveat_enforcer::after_hook(hook_context_t&,
                                                      const hook_call_t&) {
  return mandate::schema::make_ok();
}

mandate::schema::result_t caveat_enforcer::after_all_hook(hook_context_t&,
                                                          const hook_call_t&) {
  return mandate::schema::make_ok();
}

mandate::schema::result_t enforcer_error(const std::string_view enforcer,
                                         const mandate::schema::error_code code,
                                         const std::string_view reason) {
  return mandate::schema::make_error(
      code, fmt::format("{}:{}", enforcer, reason), kCodespace);
}

mandate::schema::result_t invalid_terms_length(
    const std::string_view enforcer) {
  return enforcer_error(enforcer,
                        mandate::schema::error_code::invalid_terms_length,
                        "invalid-terms-length");
}

mandate::schema::result_t require_single_call_type(
    const std::string_view enforcer,
    const mandate::schema::execution_mode_t& mode) {
  if (mode.call_type != mandate::schema::call_type_t::single) {
    return enforcer_error(enforcer,
                          mandate::schema::error_code::invalid_call_type,
                          "invalid-call-type");
  }
  return mandate::schema::make_ok();
}

mandate::schema::result_t require_batch_call_type(
    const std::string_view enforcer,
    const mandate::schema::execution_mode_t& mode) {
  if (mode.call_type != mandate::schema::call_type_t::batch) {
    return enforcer_error(enforcer,
                          mandate::schema::error_code::invalid_call_type,
                          "invalid-call-type");
  }
  return mandate::schema::make_ok();
}

mandate::schema::result_t require_default_exec_type(
    const std::string_view enforcer,
    const mandate::schema::execution_mode_t& mode) {
  if (mode.exec_type != mandate::schema::exec_type_t::default_) {
    return enforcer_error(enforcer,
                          mandate::schema::error_code::invalid_execution_type,
                          "invalid-execution-type");
  }
  return mandate::schema::make_ok();
}

mandate::schema::result_t require_single_default(
    const std::string_view enforcer,
    const mandate::schema::execution_mode_t& mode) {
  auto result = require_single_call_type(enforcer, mode);
  if (result.code != 0) {
    return result;
  }
  return require_default_exec_type(enforcer, mode);
}

mandate::schema::result_t require_batch_default(
    const std::string_view enforcer,
    const mandate::schema::execution_mode_t& mode) {
  auto result = require_batch_call_type(enforcer, mode);
  if (result.code != 0) {
    return result;
  }
  return require_default_exec_type(enforcer, mode);
}

const mandate::schema::execution_t& single_execution(const hook_call_t& call) {
  return std::get<mandate::schema::execution_t>(call.payload);
}

const mandate::schema::execution_batch_t& batch_execution(
    const hook_call_t& call) {
  return std::get<mandate::schema::execution_batch_t>(call.payload);
}

mandate::schema::key::builder make_state_key(
    const std::string_view enforcer,
    const mandate::schema::address_t& caller) {
  auto key = mandate::schema::key::builder{};
  key.write(mandate::state::kKeyspacePrefix)
      .write(std::string_view{"ENFORCER|"})
      .write(enforcer)
      .write(std::string_view{"|"})
      .write(caller);
  return key;
}

}  // namespace mandate::enforcer
