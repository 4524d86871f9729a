#include <mandate/common/checked_math.hpp>
#include <mandate/crypto/verify.hpp>
#include <mandate/enforcer/nonce_enforcer.hpp>
#include <mandate/execution/delegation_manager.hpp>
#include <mandate/execution/executor.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>
#include <mandate/schema/key/builder.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <variant>

namespace mandate::execution {

namespace {

mandate::schema::result_t manager_error(const mandate::schema::error_code code,
                                        const std::string_view reason) {
  return mandate::schema::make_error(code, fmt::format("manager:{}", reason),
                                     kManagerCodespace);
}

bool payload_matches(const mandate::schema::execution_mode_t& mode,
                     const mandate::schema::execution_payload_t& payload) {
  if (mode.call_type == mandate::schema::call_type_t::single) {
    return std::holds_alternative<mandate::schema::execution_t>(payload);
  }
  return std::holds_alternative<mandate::schema::execution_batch_t>(payload);
}

/// Keeps `depth` in step with the redemption stack.
struct depth_guard final {
  explicit depth_guard(std::size_t& depth) : depth_{depth} { ++depth_; }
  ~depth_guard() { --depth_; }
  depth_guard(const depth_guard&) = delete;
  depth_guard& operator=(const depth_guard&) = delete;

 private:
  std::size_t& depth_;
};

}  // namespace

delegation_manager::delegation_manager(
    const mandate::schema::address_t& address,
    const mandate::schema::address_t& owner,
    mandate::state::store& store,
    mandate::ledger::ledger& ledger,
    execution_sink& sink,
    const mandate::enforcer::registry& enforcers,
    const manager_options_t options)
    : address_{address},
      owner_{owner},
      store_{store},
      ledger_{ledger},
      sink_{sink},
      enforcers_{enforcers},
      require_strict_crypto_{options.require_strict_crypto},
      signature_verifier_{mandate::crypto::verify_signature} {
  if (!require_strict_crypto_) {
    spdlog::warn("Delegation manager {} bypasses signature verification",
                 mandate::schema::to_hex(address_));
  }
}

mandate::schema::result_t delegation_manager::redeem_delegations(
    const mandate::schema::address_t& redeemer,
    const std::vector<mandate::schema::permission_context_t>& contexts,
    const std::vector<mandate::schema::execution_mode_t>& modes,
    const std::vector<mandate::schema::execution_payload_t>& payloads) {
  auto guard = depth_guard{depth_};
  auto checkpoint = store_.checkpoint();

  auto result = mandate::schema::result_t{};
  try {
    result = redeem(redeemer, contexts, modes, payloads);
  } catch (const mandate::common::arithmetic_error& e) {
    result = manager_error(mandate::schema::error_code::arithmetic_error,
                           fmt::format("arithmetic-error:{}", e.what()));
  }

  if (result.code != 0) {
    store_.rollback(checkpoint);
    spdlog::warn("Redemption by {} at depth {} failed: {}",
                 mandate::schema::to_hex(redeemer), depth_, result.log);
    return result;
  }
  if (depth_ == 1) {
    store_.commit();
    spdlog::info("Redeemed {} permission context(s) for {}", contexts.size(),
                 mandate::schema::to_hex(redeemer));
  }
  return result;
}

mandate::schema::result_t delegation_manager::redeem(
    const mandate::schema::address_t& redeemer,
    const std::vector<mandate::schema::permission_context_t>& contexts,
    const std::vector<mandate::schema::execution_mode_t>& modes,
    const std::vector<mandate::schema::execution_payload_t>& payloads) {
  if (contexts.size() != modes.size() || contexts.size() != payloads.size()) {
    return manager_error(mandate::schema::error_code::batch_length_mismatch,
                         "batch-length-mismatch");
  }
  if (paused()) {
    return manager_error(mandate::schema::error_code::paused, "paused");
  }

  auto prepared = std::vector<prepared_context_t>(contexts.size());
  for (auto i = std::size_t{}; i < contexts.size(); ++i) {
    if (!payload_matches(modes[i], payloads[i])) {
      return manager_error(mandate::schema::error_code::invalid_call_type,
                           "invalid-call-type");
    }
    auto result = prepare_context(redeemer, contexts[i], prepared[i]);
    if (result.code != 0) {
      return result;
    }
  }

  // Root to leaf, every context.
  for (auto i = std::size_t{}; i < prepared.size(); ++i) {
    for (auto hop = prepared[i].chain->size(); hop > 0; --hop) {
      auto result = run_hooks(hook_phase::before_all, redeemer, prepared[i],
                              hop - 1, modes[i], payloads[i]);
      if (result.code != 0) {
        return result;
      }
    }
  }

  auto return_data =
      std::vector<std::vector<mandate::schema::bytes_t>>(prepared.size());
  for (auto i = std::size_t{}; i < prepared.size(); ++i) {
    const auto& chain = *prepared[i].chain;
    for (auto hop = chain.size(); hop > 0; --hop) {
      auto result = run_hooks(hook_phase::before, redeemer, prepared[i],
                              hop - 1, modes[i], payloads[i]);
      if (result.code != 0) {
        return result;
      }
    }

    auto executed = execute(sink_, store_, prepared[i].account, modes[i],
                            payloads[i], return_data[i]);
    if (executed.code != 0) {
      return executed;
    }

    for (auto hop = std::size_t{}; hop < chain.size(); ++hop) {
      auto result = run_hooks(hook_phase::after, redeemer, prepared[i], hop,
                              modes[i], payloads[i]);
      if (result.code != 0) {
        return result;
      }
    }
  }

  // Leaf to root, every context.
  for (auto i = std::size_t{}; i < prepared.size(); ++i) {
    for (auto hop = std::size_t{}; hop < prepared[i].chain->size(); ++hop) {
      auto result = run_hooks(hook_phase::after_all, redeemer, prepared[i], hop,
                              modes[i], payloads[i]);
      if (result.code != 0) {
        return result;
      }
    }
  }

  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  return mandate::schema::make_ok(encoder.encode(return_data));
}

mandate::schema::result_t delegation_manager::prepare_context(
    const mandate::schema::address_t& redeemer,
    const mandate::schema::permission_context_t& chain,
    prepared_context_t& prepared) const {
  prepared.chain = &chain;
  prepared.hashes.clear();
  if (chain.empty()) {
    prepared.account = redeemer;
    return mandate::schema::make_ok();
  }

  prepared.hashes.reserve(chain.size());
  for (const auto& delegation : chain) {
    prepared.hashes.push_back(delegation_hash(delegation));
  }

  for (auto i = std::size_t{}; i < chain.size(); ++i) {
    const auto& delegation = chain[i];
    const auto& hash = prepared.hashes[i];

    if (require_strict_crypto_) {
      auto digest = signing_digest(hash);
      if (!signature_verifier_ ||
          !signature_verifier_(mandate::schema::bytes_view_t{digest},
                               delegation.delegator,
                               delegation.signature)) {
        return manager_error(mandate::schema::error_code::invalid_signature,
                             "invalid-signature");
      }
    }

    if (is_delegation_disabled(hash)) {
      return manager_error(mandate::schema::error_code::disabled_delegation,
                           "cannot-use-a-disabled-delegation");
    }

    const auto& expected_delegate =
        i == 0 ? redeemer : chain[i - 1].delegator;
    if (delegation.delegate != expected_delegate &&
        delegation.delegate != mandate::schema::kAnyDelegate) {
      return manager_error(mandate::schema::error_code::invalid_delegate,
                           "invalid-delegate");
    }

    const auto& expected_authority = i + 1 == chain.size()
                                         ? mandate::schema::kRootAuthority
                                         : prepared.hashes[i + 1];
    if (delegation.authority != expected_authority) {
      return manager_error(mandate::schema::error_code::invalid_authority,
                           "invalid-authority");
    }

    for (const auto& caveat : delegation.caveats) {
      if (enforcers_.find(caveat.enforcer) == nullptr) {
        return manager_error(mandate::schema::error_code::unknown_enforcer,
                             "unknown-enforcer");
      }
    }
  }

  prepared.account = chain.back().delegator;
  return mandate::schema::make_ok();
}

mandate::schema::result_t delegation_manager::run_hooks(
    const hook_phase phase,
    const mandate::schema::address_t& redeemer,
    const prepared_context_t& prepared,
    const std::size_t index,
    const mandate::schema::execution_mode_t& mode,
    const mandate::schema::execution_payload_t& payload) {
  const auto& delegation = (*prepared.chain)[index];
  auto context = mandate::enforcer::hook_context_t{.caller = address_,
                                                   .store = store_,
                                                   .ledger = ledger_,
                                                   .environment = environment_,
                                                   .enforcers = enforcers_,
                                                   .redemptions = *this};
  for (const auto& caveat : delegation.caveats) {
    auto* enforcer = enforcers_.find(caveat.enforcer);
    if (enforcer == nullptr) {
      return manager_error(mandate::schema::error_code::unknown_enforcer,
                           "unknown-enforcer");
    }
    auto call =
        mandate::enforcer::hook_call_t{.enforcer = caveat.enforcer,
                                       .terms = caveat.terms,
                                       .args = caveat.args,
                                       .mode = mode,
                                       .payload = payload,
                                       .delegation_hash = prepared.hashes[index],
                                       .delegator = delegation.delegator,
                                       .redeemer = redeemer};
    auto result = mandate::schema::result_t{};
    switch (phase) {
      case hook_phase::before_all:
        result = enforcer->before_all_hook(context, call);
        break;
      case hook_phase::before:
        result = enforcer->before_hook(context, call);
        break;
      case hook_phase::after:
        result = enforcer->after_hook(context, call);
        break;
      case hook_phase::after_all:
        result = enforcer->after_all_hook(context, call);
        break;
    }
    if (result.code != 0) {
      spdlog::debug("Caveat {} rejected delegation {}: {}", enforcer->name(),
                    mandate::schema::to_hex(prepared.hashes[index]),
                    result.log);
      return result;
    }
  }
  return mandate::schema::make_ok();
}

mandate::schema::result_t delegation_manager::disable_delegation(
    const mandate::schema::address_t& sender,
    const mandate::schema::delegation_t& delegation) {
  if (sender != delegation.delegator) {
    return manager_error(mandate::schema::error_code::invalid_delegator,
                         "invalid-delegator");
  }
  auto hash = delegation_hash(delegation);
  if (is_delegation_disabled(hash)) {
    return manager_error(mandate::schema::error_code::already_disabled,
                         "already-disabled");
  }
  store_.put(make_disabled_key(hash), true);
  commit_if_idle();
  spdlog::info("Delegation {} disabled", mandate::schema::to_hex(hash));
  return mandate::schema::make_ok();
}

mandate::schema::result_t delegation_manager::enable_delegation(
    const mandate::schema::address_t& sender,
    const mandate::schema::delegation_t& delegation) {
  if (sender != delegation.delegator) {
    return manager_error(mandate::schema::error_code::invalid_delegator,
                         "invalid-delegator");
  }
  auto hash = delegation_hash(delegation);
  if (!is_delegation_disabled(hash)) {
    return manager_error(mandate::schema::error_code::already_enabled,
                         "already-enabled");
  }
  store_.erase(make_disabled_key(hash));
  commit_if_idle();
  spdlog::info("Delegation {} enabled", mandate::schema::to_hex(hash));
  return mandate::schema::make_ok();
}

void delegation_manager::increment_nonce(
    const mandate::schema::address_t& sender) {
  auto nonces = mandate::enforcer::nonce_enforcer{};
  nonces.increment_nonce(store_, address_, sender);
  commit_if_idle();
}

bool delegation_manager::is_delegation_disabled(
    const mandate::schema::hash32_t& delegation_hash) const {
  return store_.contains(make_disabled_key(delegation_hash));
}

mandate::schema::result_t delegation_manager::pause(
    const mandate::schema::address_t& sender) {
  if (sender != owner_) {
    return manager_error(mandate::schema::error_code::unauthorized_caller,
                         "unauthorized-caller");
  }
  store_.put(make_paused_key(), true);
  commit_if_idle();
  spdlog::info("Delegation manager {} paused",
               mandate::schema::to_hex(address_));
  return mandate::schema::make_ok();
}

mandate::schema::result_t delegation_manager::unpause(
    const mandate::schema::address_t& sender) {
  if (sender != owner_) {
    return manager_error(mandate::schema::error_code::unauthorized_caller,
                         "unauthorized-caller");
  }
  store_.erase(make_paused_key());
  commit_if_idle();
  spdlog::info("Delegation manager {} unpaused",
               mandate::schema::to_hex(address_));
  return mandate::schema::make_ok();
}

bool delegation_manager::paused() const {
  return store_.contains(make_paused_key());
}

void delegation_manager::set_environment(
    const mandate::schema::environment_t& environment) {
  environment_ = environment;
}

void delegation_manager::set_signature_verifier(
    signature_verifier_t verifier) {
  if (!require_strict_crypto_) {
    spdlog::warn("Ignoring signature verifier: strict crypto is disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

mandate::schema::hash32_t delegation_manager::delegation_hash(
    const mandate::schema::delegation_t& delegation) const {
  return mandate::schema::hash_delegation(delegation);
}

mandate::schema::hash32_t delegation_manager::signing_digest(
    const mandate::schema::hash32_t& delegation_hash) const {
  return mandate::schema::make_signing_digest(address_, delegation_hash);
}

void delegation_manager::persist(
    const mandate::storage::storage<mandate::storage::rocksdb_storage_tag>&
        storage,
    const uint64_t sequence) const {
  if (depth_ != 0) {
    mandate::common::critical("cannot persist during a redemption");
  }
  store_.save_to(storage, sequence);
}

std::optional<uint64_t> delegation_manager::restore(
    const mandate::storage::storage<mandate::storage::rocksdb_storage_tag>&
        storage) {
  if (depth_ != 0) {
    mandate::common::critical("cannot restore during a redemption");
  }
  return store_.load_from(storage);
}

mandate::schema::bytes_t delegation_manager::make_disabled_key(
    const mandate::schema::hash32_t& delegation_hash) const {
  auto key = mandate::schema::key::builder{};
  key.write(mandate::state::kKeyspacePrefix)
      .write(std::string_view{"MANAGER|"})
      .write(address_)
      .write(std::string_view{"|DISABLED|"})
      .write(delegation_hash);
  return key.data;
}

mandate::schema::bytes_t delegation_manager::make_paused_key() const {
  auto key = mandate::schema::key::builder{};
  key.write(mandate::state::kKeyspacePrefix)
      .write(std::string_view{"MANAGER|"})
      .write(address_)
      .write(std::string_view{"|PAUSED"});
  return key.data;
}

void delegation_manager::commit_if_idle() {
  if (depth_ == 0) {
    store_.commit();
  }
}

}  // namespace mandate::execution
