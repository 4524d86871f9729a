#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

struct call_limit_terms_t final {
  mandate::schema::amount_t limit{};

  bool operator==(const call_limit_terms_t&) const = default;
};

std::optional<call_limit_terms_t> get_call_limit_terms(
    std::string_view enforcer,
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error);
mandate::schema::bytes_t encode_call_limit_terms(
    const call_limit_terms_t& terms);

/// Caps how many times a delegation may be redeemed.
class limited_calls_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"limited_calls"};

  using terms_t = call_limit_terms_t;

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_hook(hook_context_t& context,
                                        const hook_call_t& call) override;

  mandate::schema::amount_t call_count(
      const mandate::state::store& store,
      const mandate::schema::address_t& caller,
      const mandate::schema::hash32_t& delegation_hash) const;
};

/// Caps how many times each redeemer may redeem a delegation.
class redeemer_limited_calls_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"redeemer_limited_calls"};

  using terms_t = call_limit_terms_t;

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_hook(hook_context_t& context,
                                        const hook_call_t& call) override;

  mandate::schema::amount_t call_count(
      const mandate::state::store& store,
      const mandate::schema::address_t& caller,
      const mandate::schema::hash32_t& delegation_hash,
      const mandate::schema::address_t& redeemer) const;
};

}  // namespace mandate::enforcer
