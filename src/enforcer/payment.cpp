#include <mandate/common/checked_math.hpp>
#include <mandate/enforcer/args_equality_check_enforcer.hpp>
#include <mandate/enforcer/payment.hpp>
#include <mandate/enforcer/registry.hpp>

#include <spdlog/spdlog.h>

#include <tuple>

namespace mandate::enforcer {

std::optional<mandate::schema::permission_context_t> decode_allowance(
    const std::string_view enforcer,
    const mandate::schema::bytes_view_t& args,
    mandate::schema::result_t& error) {
  auto allowance = decode_exact<mandate::schema::permission_context_t>(args);
  if (!allowance) {
    error = enforcer_error(enforcer, mandate::schema::error_code::invalid_args,
                           "invalid-allowance-delegations");
    return std::nullopt;
  }
  if (allowance->empty()) {
    error = enforcer_error(enforcer, mandate::schema::error_code::invalid_args,
                           "missing-allowance");
    return std::nullopt;
  }
  return allowance;
}

mandate::schema::bytes_t encode_payment_binding(
    const mandate::schema::hash32_t& delegation_hash,
    const mandate::schema::address_t& redeemer) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  return encoder.encode(std::tuple{delegation_hash, redeemer});
}

void bind_allowance(const registry& enforcers,
                    mandate::schema::permission_context_t& allowance,
                    const mandate::schema::bytes_t& binding) {
  auto args_equality =
      enforcers.address_of(args_equality_check_enforcer::kName);
  if (!args_equality) {
    return;
  }
  for (auto& delegation : allowance) {
    for (auto& caveat : delegation.caveats) {
      if (caveat.enforcer == *args_equality) {
        caveat.args = binding;
      }
    }
  }
}

mandate::schema::result_t collect_payment(
    hook_context_t& context,
    const std::string_view enforcer,
    const mandate::schema::address_t& redeemer,
    const mandate::schema::permission_context_t& allowance,
    const mandate::schema::address_t& asset,
    const mandate::schema::address_t& recipient,
    const mandate::schema::amount_t& amount,
    const mandate::schema::execution_t& execution) {
  auto balance_before = context.ledger.balance_of(asset, recipient);

  auto redeemed = context.redemptions.redeem_delegations(
      redeemer, {allowance}, {mandate::schema::kSingleDefaultMode},
      {mandate::schema::execution_payload_t{execution}});
  if (redeemed.code != 0) {
    spdlog::debug("{}: nested payment redemption failed: {}", enforcer,
                  redeemed.log);
    return redeemed;
  }

  auto required = mandate::common::checked_add(balance_before, amount);
  if (context.ledger.balance_of(asset, recipient) < required) {
    return enforcer_error(enforcer,
                          mandate::schema::error_code::payment_not_received,
                          "payment-not-received");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
