#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <string_view>

namespace mandate::enforcer {

/// Requires the payload to equal the terms byte for byte.
class exact_calldata_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"exact_calldata"};

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_hook(hook_context_t& context,
                                        const hook_call_t& call) override;
};

}  // namespace mandate::enforcer
