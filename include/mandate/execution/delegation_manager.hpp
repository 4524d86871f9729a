#pragma once

#include <mandate/enforcer/registry.hpp>
#include <mandate/enforcer/redemption_service.hpp>
#include <mandate/execution/execution_sink.hpp>
#include <mandate/ledger/ledger.hpp>
#include <mandate/schema/delegation.hpp>
#include <mandate/schema/environment.hpp>
#include <mandate/schema/result.hpp>
#include <mandate/state/store.hpp>
#include <mandate/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace mandate::execution {

inline constexpr auto kManagerCodespace = std::string_view{"mandate.manager"};

/// Checks `signature` over `digest` for `delegator`. Installed verifiers
/// replace mandate::crypto::verify_signature.
using signature_verifier_t =
    std::function<bool(const mandate::schema::bytes_view_t& digest,
                       const mandate::schema::address_t& delegator,
                       const mandate::schema::bytes_view_t& signature)>;

struct manager_options_t final {
  /// Verify delegation signatures. When false every signature is accepted.
  bool require_strict_crypto{true};
};

/// Delegation chain redemption engine.
///
/// Validates each permission context (signatures, disabled state, delegate
/// and authority linkage, enforcer resolution), runs the caveat hooks around
/// the execution and keeps the whole call atomic against the shared store.
/// Enforcers and execution sinks may call back into `redeem_delegations`
/// while a redemption is in flight; nested calls share the store and roll
/// back only their own writes on failure.
class delegation_manager final : public mandate::enforcer::redemption_service {
 public:
  delegation_manager(const mandate::schema::address_t& address,
                     const mandate::schema::address_t& owner,
                     mandate::state::store& store,
                     mandate::ledger::ledger& ledger,
                     execution_sink& sink,
                     const mandate::enforcer::registry& enforcers,
                     manager_options_t options = {});

  /// Redeem one execution per permission context.
  ///
  /// Runs before_all hooks for every context, then per context the before
  /// hooks, the execution and the after hooks, then after_all hooks for every
  /// context. Any failure rolls back every write of the call. On success the
  /// data is SCALE(vector<vector<bytes>>): per context, per execution return
  /// data.
  mandate::schema::result_t redeem_delegations(
      const mandate::schema::address_t& redeemer,
      const std::vector<mandate::schema::permission_context_t>& contexts,
      const std::vector<mandate::schema::execution_mode_t>& modes,
      const std::vector<mandate::schema::execution_payload_t>& payloads)
      override;

  const mandate::schema::address_t& address() const override {
    return address_;
  }
  const mandate::schema::address_t& owner() const { return owner_; }

  /// Only the delegator may disable or re-enable its delegation.
  mandate::schema::result_t disable_delegation(
      const mandate::schema::address_t& sender,
      const mandate::schema::delegation_t& delegation);
  mandate::schema::result_t enable_delegation(
      const mandate::schema::address_t& sender,
      const mandate::schema::delegation_t& delegation);
  bool is_delegation_disabled(
      const mandate::schema::hash32_t& delegation_hash) const;

  /// Advance the nonce `sender` is tracked under by the nonce enforcer,
  /// invalidating every outstanding delegation bound to the old value.
  void increment_nonce(const mandate::schema::address_t& sender);

  mandate::schema::result_t pause(const mandate::schema::address_t& sender);
  mandate::schema::result_t unpause(const mandate::schema::address_t& sender);
  bool paused() const;

  void set_environment(const mandate::schema::environment_t& environment);
  const mandate::schema::environment_t& environment() const {
    return environment_;
  }

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  mandate::schema::hash32_t delegation_hash(
      const mandate::schema::delegation_t& delegation) const;
  /// Digest a delegator signs for this manager.
  mandate::schema::hash32_t signing_digest(
      const mandate::schema::hash32_t& delegation_hash) const;

  /// Persist the committed keyspace. Only valid between redemptions.
  void persist(
      const mandate::storage::storage<mandate::storage::rocksdb_storage_tag>&
          storage,
      uint64_t sequence) const;
  std::optional<uint64_t> restore(
      const mandate::storage::storage<mandate::storage::rocksdb_storage_tag>&
          storage);

  /// Number of redemptions currently on the stack.
  std::size_t depth() const { return depth_; }

 private:
  /// Validated permission context ready for the hook phases.
  struct prepared_context_t final {
    const mandate::schema::permission_context_t* chain{};
    std::vector<mandate::schema::hash32_t> hashes;
    mandate::schema::address_t account{};
  };

  enum class hook_phase : uint8_t { before_all, before, after, after_all };

  mandate::schema::result_t redeem(
      const mandate::schema::address_t& redeemer,
      const std::vector<mandate::schema::permission_context_t>& contexts,
      const std::vector<mandate::schema::execution_mode_t>& modes,
      const std::vector<mandate::schema::execution_payload_t>& payloads);

  mandate::schema::result_t prepare_context(
      const mandate::schema::address_t& redeemer,
      const mandate::schema::permission_context_t& chain,
      prepared_context_t& prepared) const;

  /// Run one hook for every caveat of one delegation, in caveat order.
  mandate::schema::result_t run_hooks(
      hook_phase phase,
      const mandate::schema::address_t& redeemer,
      const prepared_context_t& prepared,
      std::size_t index,
      const mandate::schema::execution_mode_t& mode,
      const mandate::schema::execution_payload_t& payload);

  mandate::schema::bytes_t make_disabled_key(
      const mandate::schema::hash32_t& delegation_hash) const;
  mandate::schema::bytes_t make_paused_key() const;

  /// Commit writes made outside of any redemption.
  void commit_if_idle();

  mandate::schema::address_t address_;
  mandate::schema::address_t owner_;
  mandate::state::store& store_;
  mandate::ledger::ledger& ledger_;
  execution_sink& sink_;
  const mandate::enforcer::registry& enforcers_;
  mandate::schema::environment_t environment_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  std::size_t depth_{};
};

}  // namespace mandate::execution
