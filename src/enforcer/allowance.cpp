#include <mandate/common/checked_math.hpp>
#include <mandate/enforcer/allowance.hpp>
#include <mandate/schema/call_data.hpp>

#include <spdlog/spdlog.h>

namespace mandate::enforcer {

std::optional<mandate::schema::amount_t> token_transfer_amount_of(
    const std::string_view enforcer,
    const mandate::schema::execution_t& execution,
    const mandate::schema::address_t& token,
    mandate::schema::result_t& error) {
  if (execution.payload.size() != mandate::schema::kTransferCallLength) {
    error = enforcer_error(enforcer,
                           mandate::schema::error_code::invalid_execution,
                           "invalid-execution-length");
    return std::nullopt;
  }
  if (execution.value != 0) {
    error = enforcer_error(enforcer,
                           mandate::schema::error_code::invalid_execution,
                           "invalid-value");
    return std::nullopt;
  }
  if (execution.target != token) {
    error = enforcer_error(enforcer, mandate::schema::error_code::invalid_token,
                           "invalid-contract");
    return std::nullopt;
  }
  auto call = mandate::schema::decode_transfer(execution.payload);
  if (!call) {
    error = enforcer_error(enforcer,
                           mandate::schema::error_code::invalid_method,
                           "invalid-method");
    return std::nullopt;
  }
  return call->amount;
}

mandate::schema::amount_t load_amount(
    const mandate::state::store& store,
    const mandate::schema::bytes_view_t& key) {
  return store.get<mandate::schema::amount_t>(key).value_or(0);
}

mandate::schema::result_t spend_within(
    hook_context_t& context,
    const std::string_view enforcer,
    const mandate::schema::bytes_view_t& key,
    const mandate::schema::amount_t& amount,
    const mandate::schema::amount_t& ceiling) {
  auto spent = load_amount(context.store, key);
  auto next = mandate::common::checked_add(spent, amount);
  if (next > ceiling) {
    spdlog::debug("{}: spending {} on top of {} exceeds {}", enforcer,
                  amount.str(), spent.str(), ceiling.str());
    return enforcer_error(enforcer,
                          mandate::schema::error_code::allowance_exceeded,
                          "allowance-exceeded");
  }
  context.store.put(key, next);
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
