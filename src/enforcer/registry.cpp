#include <mandate/blake3/hash.hpp>
#include <mandate/common/critical.hpp>
#include <mandate/enforcer/allowed_calldata_enforcer.hpp>
#include <mandate/enforcer/allowed_methods_enforcer.hpp>
#include <mandate/enforcer/allowed_targets_enforcer.hpp>
#include <mandate/enforcer/args_equality_check_enforcer.hpp>
#include <mandate/enforcer/balance_change_enforcer.hpp>
#include <mandate/enforcer/block_height_enforcer.hpp>
#include <mandate/enforcer/exact_calldata_batch_enforcer.hpp>
#include <mandate/enforcer/exact_calldata_enforcer.hpp>
#include <mandate/enforcer/exact_execution_batch_enforcer.hpp>
#include <mandate/enforcer/exact_execution_enforcer.hpp>
#include <mandate/enforcer/id_enforcer.hpp>
#include <mandate/enforcer/limited_calls_enforcer.hpp>
#include <mandate/enforcer/logical_or_wrapper_enforcer.hpp>
#include <mandate/enforcer/multi_operation_increase_balance_enforcer.hpp>
#include <mandate/enforcer/multi_token_period_enforcer.hpp>
#include <mandate/enforcer/native_token_payment_enforcer.hpp>
#include <mandate/enforcer/native_token_transfer_amount_enforcer.hpp>
#include <mandate/enforcer/no_calldata_enforcer.hpp>
#include <mandate/enforcer/nonce_enforcer.hpp>
#include <mandate/enforcer/period_transfer_enforcer.hpp>
#include <mandate/enforcer/redeemer_enforcer.hpp>
#include <mandate/enforcer/registry.hpp>
#include <mandate/enforcer/specific_action_token_transfer_batch_enforcer.hpp>
#include <mandate/enforcer/streaming_enforcer.hpp>
#include <mandate/enforcer/timestamp_enforcer.hpp>
#include <mandate/enforcer/token_balance_gte_enforcer.hpp>
#include <mandate/enforcer/token_swap_offer_enforcer.hpp>
#include <mandate/enforcer/token_transfer_amount_enforcer.hpp>
#include <mandate/enforcer/value_lte_enforcer.hpp>


#include <algorithm>
#include <string>

namespace mandate::enforcer {

mandate::schema::address_t make_enforcer_address(const std::string_view name) {
  auto digest = mandate::blake3::hash(
      std::string{"mandate.enforcer."} + std::string{name});
  auto address = mandate::schema::address_t{};
  std::copy(std::end(digest) - address.size(), std::end(digest),
            std::begin(address));
  return address;
}

mandate::schema::address_t registry::add(
    std::unique_ptr<caveat_enforcer> enforcer) {
  if (!enforcer) {
    mandate::common::critical("cannot register a null enforcer");
  }
  auto name = std::string{enforcer->name()};
  if (names_.contains(name)) {
    mandate::common::critical("duplicate enforcer registration: {}", name);
  }
  auto address = make_enforcer_address(name);
  enforcers_.emplace(address, std::move(enforcer));
  names_.emplace(std::move(name), address);
  return address;
}

caveat_enforcer* registry::find(
    const mandate::schema::address_t& address) const {
  auto it = enforcers_.find(address);
  if (it == std::end(enforcers_)) {
    return nullptr;
  }
  return it->second.get();
}

std::optional<mandate::schema::address_t> registry::address_of(
    const std::string_view name) const {
  auto it = names_.find(name);
  if (it == std::end(names_)) {
    return std::nullopt;
  }
  return it->second;
}

mandate::schema::address_t registry::at(const std::string_view name) const {
  auto address = address_of(name);
  if (!address) {
    mandate::common::critical("unknown enforcer name: {}", name);
  }
  return *address;
}

std::vector<std::pair<std::string, mandate::schema::address_t>>
registry::list() const {
  return {std::begin(names_), std::end(names_)};
}

registry make_default_registry() {
  auto enforcers = registry{};
  enforcers.add(std::make_unique<allowed_calldata_enforcer>());
  enforcers.add(std::make_unique<allowed_methods_enforcer>());
  enforcers.add(std::make_unique<allowed_targets_enforcer>());
  enforcers.add(std::make_unique<args_equality_check_enforcer>());
  enforcers.add(std::make_unique<block_height_enforcer>());
  enforcers.add(std::make_unique<timestamp_enforcer>());
  enforcers.add(std::make_unique<exact_calldata_enforcer>());
  enforcers.add(std::make_unique<exact_calldata_batch_enforcer>());
  enforcers.add(std::make_unique<exact_execution_enforcer>());
  enforcers.add(std::make_unique<exact_execution_batch_enforcer>());
  enforcers.add(std::make_unique<no_calldata_enforcer>());
  enforcers.add(std::make_unique<value_lte_enforcer>());
  enforcers.add(std::make_unique<redeemer_enforcer>());
  enforcers.add(std::make_unique<id_enforcer>());
  enforcers.add(std::make_unique<nonce_enforcer>());
  enforcers.add(std::make_unique<limited_calls_enforcer>());
  enforcers.add(std::make_unique<redeemer_limited_calls_enforcer>());
  enforcers.add(std::make_unique<native_token_transfer_amount_enforcer>());
  enforcers.add(std::make_unique<token_transfer_amount_enforcer>());
  enforcers.add(std::make_unique<native_token_streaming_enforcer>());
  enforcers.add(std::make_unique<token_streaming_enforcer>());
  enforcers.add(std::make_unique<native_token_period_transfer_enforcer>());
  enforcers.add(std::make_unique<token_period_transfer_enforcer>());
  enforcers.add(std::make_unique<multi_token_period_enforcer>());
  enforcers.add(std::make_unique<native_balance_change_enforcer>());
  enforcers.add(std::make_unique<token_balance_change_enforcer>());
  enforcers.add(std::make_unique<multi_token_balance_change_enforcer>());
  enforcers.add(
      std::make_unique<native_token_multi_operation_increase_balance_enforcer>());
  enforcers.add(
      std::make_unique<token_multi_operation_increase_balance_enforcer>());
  enforcers.add(std::make_unique<token_balance_gte_enforcer>());
  enforcers.add(
      std::make_unique<specific_action_token_transfer_batch_enforcer>());
  enforcers.add(std::make_unique<native_token_payment_enforcer>());
  enforcers.add(std::make_unique<token_swap_offer_enforcer>());
  enforcers.add(std::make_unique<logical_or_wrapper_enforcer>());
  return enforcers;
}

}  // namespace mandate::enforcer
