#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Periodic allowances: up to `period_amount` may be claimed in each window
// of `period_duration` seconds counted from `start_date`. Unclaimed amounts
// do not roll over.
namespace mandate::enforcer {

struct period_terms_t final {
  mandate::schema::amount_t period_amount{};
  mandate::schema::amount_t period_duration{};
  mandate::schema::amount_t start_date{};

  bool operator==(const period_terms_t&) const = default;
};

struct period_state_t final {
  mandate::schema::amount_t last_claim_period{};
  mandate::schema::amount_t claimed_in_period{};
};

/// Shared terms validation; `enforcer` names the error source.
mandate::schema::result_t validate_period_terms(std::string_view enforcer,
                                                const period_terms_t& terms);

/// Claim `amount` against the period allowance stored at `key`.
mandate::schema::result_t claim_period_amount(
    hook_context_t& context,
    std::string_view enforcer,
    const mandate::schema::bytes_view_t& key,
    const period_terms_t& terms,
    const mandate::schema::amount_t& amount);

/// Amount still claimable at `now` given the stored period state.
mandate::schema::amount_t available_period_amount(
    const period_terms_t& terms,
    const std::optional<period_state_t>& state,
    mandate::schema::timestamp_seconds_t now);

class native_token_period_transfer_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName =
      std::string_view{"native_token_period_transfer"};

  using terms_t = period_terms_t;

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_hook(hook_context_t& context,
                                        const hook_call_t& call) override;

  mandate::schema::amount_t available(
      const mandate::state::store& store,
      const mandate::schema::address_t& caller,
      const mandate::schema::hash32_t& delegation_hash,
      const terms_t& terms,
      mandate::schema::timestamp_seconds_t now) const;
};

class token_period_transfer_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"token_period_transfer"};

  struct terms_t final {
    mandate::schema::address_t token{};
    period_terms_t period;

    bool operator==(const terms_t&) const = default;
  };

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_hook(hook_context_t& context,
                                        const hook_call_t& call) override;
};

}  // namespace mandate::enforcer
