#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

/// Standing swap offer: the delegator sells up to `amount_out` of
/// `token_out` for `token_in` at the rate amount_in / amount_out.
///
/// Each redemption claims part of the offer with a transfer of `token_out`
/// (native value when it is `kNativeAsset`). Before the transfer runs, the
/// enforcer redeems the permission context passed in args, paying the
/// proportional `token_in` amount (rounded up) to `recipient`, and checks
/// the payment arrived. Terms: token in, token out, amount in (u256),
/// amount out (u256), recipient.
class token_swap_offer_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"token_swap_offer"};

  struct terms_t final {
    mandate::schema::address_t token_in{};
    mandate::schema::address_t token_out{};
    mandate::schema::amount_t amount_in{};
    mandate::schema::amount_t amount_out{};
    mandate::schema::address_t recipient{};

    bool operator==(const terms_t&) const = default;
  };

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);

  /// `token_in` owed for claiming `claimed_out`, rounded up.
  static mandate::schema::amount_t required_input(
      const terms_t& terms,
      const mandate::schema::amount_t& claimed_out);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_hook(hook_context_t& context,
                                        const hook_call_t& call) override;

  mandate::schema::amount_t claimed(
      const mandate::state::store& store,
      const mandate::schema::address_t& caller,
      const mandate::schema::hash32_t& delegation_hash) const;
};

}  // namespace mandate::enforcer
