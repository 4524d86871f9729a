#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

/// Lifetime cap on one token moved through `transfer` calls.
/// Terms: token (address), max amount (u256).
class token_transfer_amount_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"token_transfer_amount"};

  struct terms_t final {
    mandate::schema::address_t token{};
    mandate::schema::amount_t max_amount{};

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

  mandate::schema::amount_t spent(
      const mandate::state::store& store,
      const mandate::schema::address_t& caller,
      const mandate::schema::hash32_t& delegation_hash) const;
};

}  // namespace mandate::enforcer
