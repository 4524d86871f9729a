#pragma once

#include <mandate/enforcer/redemption_service.hpp>
#include <mandate/ledger/ledger.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>
#include <mandate/schema/environment.hpp>
#include <mandate/schema/execution.hpp>
#include <mandate/schema/execution_mode.hpp>
#include <mandate/schema/key/builder.hpp>
#include <mandate/schema/primitives.hpp>
#include <mandate/schema/result.hpp>
#include <mandate/state/store.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

class registry;

inline constexpr auto kCodespace = std::string_view{"mandate.enforcer"};

/// Collaborators visible to a hook. `caller` scopes every piece of enforcer
/// state so that two redemption engines never share accounting.
struct hook_context_t final {
  mandate::schema::address_t caller;
  mandate::state::store& store;
  mandate::ledger::ledger& ledger;
  mandate::schema::environment_t environment;
  const registry& enforcers;
  redemption_service& redemptions;
};

/// One caveat evaluated against one permission context.
struct hook_call_t final {
  mandate::schema::address_t enforcer;
  mandate::schema::bytes_view_t terms;
  mandate::schema::bytes_view_t args;
  mandate::schema::execution_mode_t mode;
  const mandate::schema::execution_payload_t& payload;
  mandate::schema::hash32_t delegation_hash;
  mandate::schema::address_t delegator;
  mandate::schema::address_t redeemer;
};

/// Policy module attached to delegations through caveats.
///
/// The redemption engine calls `before_all_hook` for every permission context
/// of a redemption, then per context `before_hook`, the execution and
/// `after_hook`, and finally `after_all_hook` for every context. Any non-zero
/// result aborts the redemption. Hooks default to success.
class caveat_enforcer {
 public:
  virtual ~caveat_enforcer() = default;

  virtual std::string_view name() const = 0;

  /// Decode and validate terms without touching state.
  virtual mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const = 0;

  virtual mandate::schema::result_t before_all_hook(hook_context_t& context,
                                                    const hook_call_t& call);
  virtual mandate::schema::result_t before_hook(hook_context_t& context,
                                                const hook_call_t& call);
  virtual mandate::schema::result_t after_hook(hook_context_t& context,
                                               const hook_call_t& call);
  virtual mandate::schema::result_t after_all_hook(hook_context_t& context,
                                                   const hook_call_t& call);
};

/// `"<enforcer>:<reason>"` error in the enforcer codespace.
mandate::schema::result_t enforcer_error(std::string_view enforcer,
                                         mandate::schema::error_code code,
                                         std::string_view reason);

mandate::schema::result_t invalid_terms_length(std::string_view enforcer);

mandate::schema::result_t require_single_call_type(
    std::string_view enforcer,
    const mandate::schema::execution_mode_t& mode);
mandate::schema::result_t require_batch_call_type(
    std::string_view enforcer,
    const mandate::schema::execution_mode_t& mode);
mandate::schema::result_t require_default_exec_type(
    std::string_view enforcer,
    const mandate::schema::execution_mode_t& mode);

/// Single call type and default exec type, the most common restriction.
mandate::schema::result_t require_single_default(
    std::string_view enforcer,
    const mandate::schema::execution_mode_t& mode);
mandate::schema::result_t require_batch_default(
    std::string_view enforcer,
    const mandate::schema::execution_mode_t& mode);

/// Payload of a call that already passed a single call type guard.
const mandate::schema::execution_t& single_execution(const hook_call_t& call);
const mandate::schema::execution_batch_t& batch_execution(
    const hook_call_t& call);

/// Key prefix `MANDATE|ENFORCER|<enforcer>|<caller>` for enforcer state.
mandate::schema::key::builder make_state_key(
    std::string_view enforcer,
    const mandate::schema::address_t& caller);

/// Decode SCALE bytes and reject any encoding that does not re-encode to the
/// exact same bytes, trailing data included.
template <typename T>
std::optional<T> decode_exact(const mandate::schema::bytes_view_t& bytes) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto decoded = encoder.try_decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  auto reencoded = encoder.encode(*decoded);
  if (!std::equal(std::begin(reencoded), std::end(reencoded),
                  std::begin(bytes), std::end(bytes))) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace mandate::enforcer
