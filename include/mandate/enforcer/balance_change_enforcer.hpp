#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

namespace mandate::enforcer {

/// Direction byte of balance change terms.
enum class balance_change_t : uint8_t {
  increase = 0,
  decrease = 1,
};

/// Expected change of `recipient`'s balance of `token` (and `token_id` for
/// multi-token assets) across a redemption. An increase must be at least
/// `amount`; a decrease must be at most `amount`.
struct balance_change_terms_t final {
  balance_change_t direction{balance_change_t::increase};
  mandate::schema::address_t token{};
  mandate::schema::address_t recipient{};
  mandate::schema::amount_t token_id{};
  mandate::schema::amount_t amount{};

  bool operator==(const balance_change_terms_t&) const = default;
};

/// Terms: direction (u8), recipient, amount (u256).
class native_balance_change_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"native_balance_change"};

  using terms_t = balance_change_terms_t;

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_all_hook(hook_context_t& context,
                                            const hook_call_t& call) override;
  mandate::schema::result_t after_all_hook(hook_context_t& context,
                                           const hook_call_t& call) override;
};

/// Terms: direction (u8), token, recipient, amount (u256).
class token_balance_change_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"token_balance_change"};

  using terms_t = balance_change_terms_t;

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_all_hook(hook_context_t& context,
                                            const hook_call_t& call) override;
  mandate::schema::result_t after_all_hook(hook_context_t& context,
                                           const hook_call_t& call) override;
};

/// Terms: direction (u8), token, recipient, token id (u256), amount (u256).
class multi_token_balance_change_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName =
      std::string_view{"multi_token_balance_change"};

  using terms_t = balance_change_terms_t;

  static std::optional<terms_t> get_terms_info(
      const mandate::schema::bytes_view_t& terms,
      mandate::schema::result_t& error);
  static mandate::schema::bytes_t encode_terms(const terms_t& terms);

  std::string_view name() const override { return kName; }
  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t& terms) const override;
  mandate::schema::result_t before_all_hook(hook_context_t& context,
                                            const hook_call_t& call) override;
  mandate::schema::result_t after_all_hook(hook_context_t& context,
                                           const hook_call_t& call) override;
};

}  // namespace mandate::enforcer
