#pragma once

#include <mandate/enforcer/period_transfer_enforcer.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace mandate::enforcer {

/// Several periodic allowances in one caveat, one per token. The redeemer
/// selects the configuration through args (index, u256); `kNativeAsset`
/// selects native value.
class multi_token_period_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"multi_token_period"};

  struct token_period_t final {
    mandate::schema::address_t token{};
    period_terms_t period;
  };

  struct terms_t final {
    std::vector<token_period_t> configs;
  };

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);
  static mandate::schema::bytes_t encode_args(std::size_t index);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_hook(hook_context_t& context,
                                        const hook_call_t& call) override;
};

}  // namespace mandate::enforcer
