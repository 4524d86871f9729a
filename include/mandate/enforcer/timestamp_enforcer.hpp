#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

/// Inclusive wall-clock window in seconds. Terms: after (u128), before
/// (u128); zero leaves that side unbounded.
class timestamp_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"timestamp"};

  struct terms_t final {
    mandate::schema::uint128_t after{};
    mandate::schema::uint128_t before{};

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
};

}  // namespace mandate::enforcer
