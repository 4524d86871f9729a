#include <mandate/enforcer/allowance.hpp>
#include <mandate/enforcer/multi_token_period_enforcer.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

namespace {

inline constexpr auto kConfigWidth =
    mandate::schema::kAddressWidth + (3 * mandate::schema::kWordWidth);

}  // namespace

std::optional<multi_token_period_enforcer::terms_t>
multi_token_period_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.empty() || terms.size() % kConfigWidth != 0) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto decoded = terms_t{};
  while (!reader.done()) {
    auto config = token_period_t{};
    config.token = reader.read_address();
    config.period.period_amount = reader.read_uint256();
    config.period.period_duration = reader.read_uint256();
    config.period.start_date = reader.read_uint256();
    auto valid = validate_period_terms(kName, config.period);
    if (valid.code != 0) {
      error = valid;
      return std::nullopt;
    }
    decoded.configs.push_back(config);
  }
  return decoded;
}

mandate::schema::bytes_t multi_token_period_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  for (const auto& config : terms.configs) {
    writer.write_address(config.token)
        .write_uint256(config.period.period_amount)
        .write_uint256(config.period.period_duration)
        .write_uint256(config.period.start_date);
  }
  return writer.release();
}

mandate::schema::bytes_t multi_token_period_enforcer::encode_args(
    const std::size_t index) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint256(index);
  return writer.release();
}

mandate::schema::result_t multi_token_period_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t multi_token_period_enforcer::before_hook(
    hook_context_t& context,
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

  if (call.args.size() != mandate::schema::kWordWidth) {
    return enforcer_error(kName, mandate::schema::error_code::invalid_args,
                          "invalid-index");
  }
  auto index = mandate::schema::terms_reader{call.args}.read_uint256();
  if (index >= terms->configs.size()) {
    return enforcer_error(kName, mandate::schema::error_code::invalid_args,
                          "invalid-index");
  }
  const auto& config = terms->configs[static_cast<std::size_t>(index)];

  const auto& execution = single_execution(call);
  auto amount = std::optional<mandate::schema::amount_t>{};
  if (config.token == mandate::schema::kNativeAsset) {
    amount = execution.value;
  } else {
    amount = token_transfer_amount_of(kName, execution, config.token, error);
    if (!amount) {
      return error;
    }
  }

  auto key = make_state_key(kName, context.caller);
  key.write(call.delegation_hash).write(config.token);
  return claim_period_amount(context, kName, key.data, config.period, *amount);
}

}  // namespace mandate::enforcer
