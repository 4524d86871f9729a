#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

/// Single-use id per delegator: once any delegation carrying id N from a
/// delegator is redeemed, every other delegation with the same id is dead.
class id_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"id"};

  struct terms_t final {
    mandate::schema::amount_t id{};

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

  bool is_used(const mandate::state::store& store,
               const mandate::schema::address_t& caller,
               const mandate::schema::address_t& delegator,
               const mandate::schema::amount_t& id) const;
};

}  // namespace mandate::enforcer
