#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

/// Delegations carry the delegator's nonce at signing time. Incrementing the
/// nonce revokes every outstanding delegation that uses this enforcer.
class nonce_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"nonce"};

  struct terms_t final {
    mandate::schema::amount_t nonce{};

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

  mandate::schema::amount_t current_nonce(
      const mandate::state::store& store,
      const mandate::schema::address_t& caller,
      const mandate::schema::address_t& delegator) const;

  /// Store write only; hosts go through delegation_manager::increment_nonce.
  void increment_nonce(mandate::state::store& store,
                       const mandate::schema::address_t& caller,
                       const mandate::schema::address_t& delegator);
};

}  // namespace mandate::enforcer
