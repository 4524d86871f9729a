#pragma once

#include <mandate/enforcer/registry.hpp>
#include <mandate/execution/delegation_manager.hpp>
#include <mandate/execution/ledger_sink.hpp>
#include <mandate/ledger/state_ledger.hpp>
#include <mandate/schema/call_data.hpp>
#include <mandate/schema/environment.hpp>
#include <mandate/state/store.hpp>
#include <mandate/testing/common.hpp>

#include <string_view>
#include <utility>
#include <vector>

namespace mandate::testing {

/// Store, ledger, execution sink, enforcers and one delegation manager wired
/// together. Signatures are not checked unless `strict` is set.
struct world_t final {
  explicit world_t(const bool strict = false)
      : manager{kManagerAddress,
                kOwner,
                store,
                ledger,
                sink,
                enforcers,
                mandate::execution::manager_options_t{
                    .require_strict_crypto = strict}} {
    sink.register_token(kToken);
    sink.register_token(kOtherToken);
    manager.set_environment(
        mandate::schema::environment_t{.timestamp = 1000, .height = 100});
  }

  world_t(const world_t&) = delete;
  world_t& operator=(const world_t&) = delete;

  mandate::schema::caveat_t caveat(const std::string_view name,
                                   mandate::schema::bytes_t terms,
                                   mandate::schema::bytes_t args = {}) const {
    return mandate::schema::caveat_t{.enforcer = enforcers.at(name),
                                     .terms = std::move(terms),
                                     .args = std::move(args)};
  }

  /// Credit `amount` outside of any redemption.
  void fund(const mandate::schema::address_t& asset,
            const mandate::schema::address_t& principal,
            const mandate::schema::amount_t& amount) {
    ledger.mint(asset, principal, amount);
    store.commit();
  }

  mandate::schema::amount_t balance(
      const mandate::schema::address_t& asset,
      const mandate::schema::address_t& principal) const {
    return ledger.balance_of(asset, principal);
  }

  mandate::schema::result_t redeem(
      const mandate::schema::address_t& redeemer,
      mandate::schema::permission_context_t chain,
      mandate::schema::execution_payload_t payload,
      const mandate::schema::execution_mode_t& mode =
          mandate::schema::kSingleDefaultMode) {
    return manager.redeem_delegations(redeemer, {std::move(chain)}, {mode},
                                      {std::move(payload)});
  }

  void set_time(const mandate::schema::timestamp_seconds_t timestamp) {
    auto environment = manager.environment();
    environment.timestamp = timestamp;
    manager.set_environment(environment);
  }

  void set_height(const uint64_t height) {
    auto environment = manager.environment();
    environment.height = height;
    manager.set_environment(environment);
  }

  mandate::state::store store;
  mandate::ledger::state_ledger ledger{store};
  mandate::execution::ledger_sink sink{ledger};
  mandate::enforcer::registry enforcers{
      mandate::enforcer::make_default_registry()};
  mandate::execution::delegation_manager manager;
};

/// Token transfer execution.
inline mandate::schema::execution_t make_token_transfer(
    const mandate::schema::address_t& token,
    const mandate::schema::address_t& recipient,
    const mandate::schema::amount_t& amount) {
  return mandate::schema::make_execution(
      token, 0, mandate::schema::encode_transfer(recipient, amount));
}

}  // namespace mandate::testing
