#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

struct increase_balance_terms_t final {
  mandate::schema::address_t token{};
  mandate::schema::address_t recipient{};
  mandate::schema::amount_t amount{};

  bool operator==(const increase_balance_terms_t&) const = default;
};

/// Minimum native balance increase of `recipient`, aggregated across every
/// use in one redemption. Terms: recipient, amount (u256).
class native_token_multi_operation_increase_balance_enforcer final
    : public caveat_enforcer {
 public:
  static constexpr auto kName =
      std::string_view{"native_token_multi_operation_increase_balance"};

  using terms_t = increase_balance_terms_t;

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_all_hook(hook_context_t& context,
                                            const hook_call_t& call) override;
  mandate::schema::result_t after_all_hook(hook_context_t& context,
                                           const hook_call_t& call) override;
};

/// Token variant. Terms: token, recipient, amount (u256).
class token_multi_operation_increase_balance_enforcer final
    : public caveat_enforcer {
 public:
  static constexpr auto kName =
      std::string_view{"token_multi_operation_increase_balance"};

  using terms_t = increase_balance_terms_t;

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_all_hook(hook_context_t& context,
                                            const hook_call_t& call) override;
  mandate::schema::result_t after_all_hook(hook_context_t& context,
                                           const hook_call_t& call) override;
};

}  // namespace mandate::enforcer
