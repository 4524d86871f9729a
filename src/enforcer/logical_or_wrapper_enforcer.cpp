#include <mandate/enforcer/logical_or_wrapper_enforcer.hpp>
#include <mandate/enforcer/registry.hpp>
#include <mandate/schema/encoding/scale/caveat_group.hpp>

#include <spdlog/spdlog.h>

namespace mandate::enforcer {

namespace {

using hook_t = mandate::schema::result_t (caveat_enforcer::*)(
    hook_context_t&,
    const hook_call_t&);

std::optional<logical_or_wrapper_enforcer::selected_group_t> get_args_info(
    const logical_or_wrapper_enforcer::terms_t& groups,
    const mandate::schema::bytes_view_t& args,
    mandate::schema::result_t& error) {
  auto selected =
      decode_exact<logical_or_wrapper_enforcer::selected_group_t>(args);
  if (!selected) {
    error = enforcer_error(logical_or_wrapper_enforcer::kName,
                           mandate::schema::error_code::invalid_args,
                           "invalid-args");
    return std::nullopt;
  }
  if (selected->group_index >= groups.size()) {
    error = enforcer_error(logical_or_wrapper_enforcer::kName,
                           mandate::schema::error_code::invalid_group_index,
                           "invalid-group-index");
    return std::nullopt;
  }
  if (selected->caveat_args.size() !=
      groups[selected->group_index].caveats.size()) {
    error = enforcer_error(
        logical_or_wrapper_enforcer::kName,
        mandate::schema::error_code::invalid_caveat_args_length,
        "invalid-caveat-args-length");
    return std::nullopt;
  }
  return selected;
}

// Runs `hook` for every caveat of the selected group, as the wrapper.
mandate::schema::result_t run_selected_group(hook_context_t& context,
                                             const hook_call_t& call,
                                             hook_t hook) {
  auto error = mandate::schema::make_ok();
  auto groups = logical_or_wrapper_enforcer::get_terms_info(call.terms, error);
  if (!groups) {
    return error;
  }
  auto selected = get_args_info(*groups, call.args, error);
  if (!selected) {
    return error;
  }

  auto inner_context = context;
  inner_context.caller = call.enforcer;

  const auto& group = (*groups)[selected->group_index];
  for (auto i = size_t{0}; i < group.caveats.size(); ++i) {
    const auto& caveat = group.caveats[i];
    auto* enforcer = context.enforcers.find(caveat.enforcer);
    if (enforcer == nullptr) {
      return enforcer_error(logical_or_wrapper_enforcer::kName,
                            mandate::schema::error_code::unknown_enforcer,
                            "unknown-enforcer");
    }
    auto inner_call = hook_call_t{.enforcer = caveat.enforcer,
                                  .terms = caveat.terms,
                                  .args = selected->caveat_args[i],
                                  .mode = call.mode,
                                  .payload = call.payload,
                                  .delegation_hash = call.delegation_hash,
                                  .delegator = call.delegator,
                                  .redeemer = call.redeemer};
    auto result = (enforcer->*hook)(inner_context, inner_call);
    if (result.code != 0) {
      spdlog::debug("{}: group {} caveat {} rejected: {}",
                    logical_or_wrapper_enforcer::kName, selected->group_index,
                    i, result.log);
      return result;
    }
  }
  return mandate::schema::make_ok();
}

}  // namespace

std::optional<logical_or_wrapper_enforcer::terms_t>
logical_or_wrapper_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  auto groups = decode_exact<terms_t>(terms);
  if (!groups) {
    error = enforcer_error(kName, mandate::schema::error_code::invalid_terms,
                           "invalid-terms");
    return std::nullopt;
  }
  return groups;
}

mandate::schema::bytes_t logical_or_wrapper_enforcer::encode_terms(
    const terms_t& terms) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  return encoder.encode(terms);
}

mandate::schema::bytes_t logical_or_wrapper_enforcer::encode_args(
    const selected_group_t& args) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  return encoder.encode(args);
}

mandate::schema::result_t logical_or_wrapper_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t logical_or_wrapper_enforcer::before_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  return run_selected_group(context, call, &caveat_enforcer::before_all_hook);
}

mandate::schema::result_t logical_or_wrapper_enforcer::before_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  return run_selected_group(context, call, &caveat_enforcer::before_hook);
}

mandate::schema::result_t logical_or_wrapper_enforcer::after_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  return run_selected_group(context, call, &caveat_enforcer::after_hook);
}

mandate::schema::result_t logical_or_wrapper_enforcer::after_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  return run_selected_group(context, call, &caveat_enforcer::after_all_hook);
}

}  // namespace mandate::enforcer
