#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

/// Makes a delegation conditional on a native payment of `amount` to
/// `recipient`.
///
/// The redeemer passes, as args, a permission context granting this
/// enforcer an allowance. In after_all the enforcer redeems that allowance
/// for a transfer of `amount` to `recipient` and checks the recipient was
/// paid. Before redeeming, the args of every args_equality_check caveat in
/// the allowance are set to SCALE(delegation hash, redeemer), so an
/// allowance can be bound to the one delegation and redeemer it pays for.
/// Terms: recipient, amount (u256).
class native_token_payment_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"native_token_payment"};

  struct terms_t final {
    mandate::schema::address_t recipient{};
    mandate::schema::amount_t amount{};

    bool operator==(const terms_t&) const = default;
  };

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t after_all_hook(hook_context_t& context,
                                           const hook_call_t& call) override;
};

}  // namespace mandate::enforcer
