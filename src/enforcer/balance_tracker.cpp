#include <mandate/common/checked_math.hpp>
#include <mandate/enforcer/balance_tracker.hpp>
#include <mandate/schema/encoding/scale/balance_tracker.hpp>

#include <spdlog/spdlog.h>

namespace mandate::enforcer {

std::optional<balance_tracker_t> load_tracker(
    const mandate::state::store& store,
    const mandate::schema::bytes_view_t& key) {
  return store.get<balance_tracker_t>(key);
}

mandate::schema::result_t track_expected_change(
    hook_context_t& context,
    const std::string_view enforcer,
    const mandate::schema::bytes_view_t& key,
    const mandate::schema::amount_t& current_balance,
    const bool is_decrease,
    const mandate::schema::amount_t& amount) {
  if (amount == 0) {
    return enforcer_error(enforcer,
                          mandate::schema::error_code::zero_expected_change,
                          "zero-expected-change");
  }

  auto tracker = load_tracker(context.store, key).value_or(balance_tracker_t{
      .balance_before = current_balance});
  if (is_decrease) {
    tracker.expected_decrease =
        mandate::common::checked_add(tracker.expected_decrease, amount);
  } else {
    tracker.expected_increase =
        mandate::common::checked_add(tracker.expected_increase, amount);
  }
  ++tracker.pending;
  context.store.put(key, tracker);
  return mandate::schema::make_ok();
}

mandate::schema::result_t validate_expected_change(
    hook_context_t& context,
    const std::string_view enforcer,
    const mandate::schema::bytes_view_t& key,
    const mandate::schema::amount_t& current_balance) {
  auto tracker = load_tracker(context.store, key);
  if (!tracker || tracker->pending == 0) {
    throw mandate::common::arithmetic_error{
        "balance tracker validation without a pending use"};
  }

  --tracker->pending;
  if (tracker->pending > 0) {
    context.store.put(key, *tracker);
    return mandate::schema::make_ok();
  }
  context.store.erase(key);

  if (tracker->expected_increase >= tracker->expected_decrease) {
    auto required = mandate::common::checked_add(
        tracker->balance_before,
        tracker->expected_increase - tracker->expected_decrease);
    if (current_balance < required) {
      spdlog::debug("{}: balance {} below required {}", enforcer,
                    current_balance.str(), required.str());
      return enforcer_error(
          enforcer, mandate::schema::error_code::insufficient_balance_change,
          "insufficient-balance-increase");
    }
    return mandate::schema::make_ok();
  }

  auto floor = mandate::common::checked_sub(
      tracker->balance_before,
      tracker->expected_decrease - tracker->expected_increase);
  if (current_balance < floor) {
    spdlog::debug("{}: balance {} below floor {}", enforcer,
                  current_balance.str(), floor.str());
    return enforcer_error(
        enforcer, mandate::schema::error_code::excessive_balance_decrease,
        "exceeded-balance-decrease");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
