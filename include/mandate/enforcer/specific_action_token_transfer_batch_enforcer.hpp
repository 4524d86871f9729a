#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

/// Authorizes exactly one two-step batch: a signed first call followed by a
/// token transfer of `amount` to `recipient`. Usable once per delegation.
/// Terms: token, recipient, amount (u256), first target, first payload (rest).
class specific_action_token_transfer_batch_enforcer final
    : public caveat_enforcer {
 public:
  static constexpr auto kName =
      std::string_view{"specific_action_token_transfer_batch"};

  struct terms_t final {
    mandate::schema::address_t token{};
    mandate::schema::address_t recipient{};
    mandate::schema::amount_t amount{};
    mandate::schema::address_t first_target{};
    mandate::schema::bytes_t first_payload;
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

  bool is_used(const mandate::state::store& store,
               const mandate::schema::address_t& caller,
               const mandate::schema::hash32_t& delegation_hash) const;
};

}  // namespace mandate::enforcer
