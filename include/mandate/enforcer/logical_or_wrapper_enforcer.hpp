#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>
#include <mandate/schema/caveat.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace mandate::enforcer {

/// Disjunction over groups of caveats. Terms list the signed groups; the
/// redeemer picks one group and supplies the args of each of its caveats.
/// Only the chosen group is evaluated, with the wrapper as the caller of the
/// wrapped enforcers. Caveat args carried inside the terms are ignored.
class logical_or_wrapper_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"logical_or_wrapper"};

  struct caveat_group_t final {
    std::vector<mandate::schema::caveat_t> caveats;
  };

  struct selected_group_t final {
    uint64_t group_index{};
    std::vector<mandate::schema::bytes_t> caveat_args;
  };

  using terms_t = std::vector<caveat_group_t>;

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);
  static mandate::schema::bytes_t encode_args(const selected_group_t& args);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_all_hook(hook_context_t& context,
                                            const hook_call_t& call) override;
  mandate::schema::result_t before_hook(hook_context_t& context,
                                        const hook_call_t& call) override;
  mandate::schema::result_t after_hook(hook_context_t& context,
                                       const hook_call_t& call) override;
  mandate::schema::result_t after_all_hook(hook_context_t& context,
                                           const hook_call_t& call) override;
};

}  // namespace mandate::enforcer
