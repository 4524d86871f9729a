#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

/// Single-use balance check: `recipient`'s balance of `token` must grow by at
/// least `amount` between the before and after hooks of one use. A second
/// use of the same delegation before the first one's after hook fails with
/// `enforcer-is-locked`. Terms: token, recipient, amount (u256).
class token_balance_gte_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"token_balance_gte"};

  struct terms_t final {
    mandate::schema::address_t token{};
    mandate::schema::address_t recipient{};
    mandate::schema::amount_t amount{};

    bool operator==(const terms_t&) const = default;
  };

  struct lock_t final {
    bool locked{};
    mandate::schema::amount_t balance_before{};
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
  mandate::schema::result_t after_hook(hook_context_t& context,
                                       const hook_call_t& call) override;

  bool is_locked(const mandate::state::store& store,
                 const mandate::schema::address_t& caller,
                 const mandate::schema::hash32_t& delegation_hash,
                 const terms_t& terms) const;
};

}  // namespace mandate::enforcer
