#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace mandate::enforcer {

/// Restricts the execution target to a signed list of addresses.
class allowed_targets_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"allowed_targets"};

  struct terms_t final {
    std::vector<mandate::schema::address_t> targets;
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
