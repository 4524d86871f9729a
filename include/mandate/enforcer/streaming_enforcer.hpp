#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

// Linear streaming allowances:
//   unlocked(t) = 0 before start, else min(max, initial + rate * (t - start))
// and a transfer passes while spent + amount <= unlocked(now).
namespace mandate::enforcer {

struct stream_terms_t final {
  mandate::schema::amount_t initial_amount{};
  mandate::schema::amount_t max_amount{};
  mandate::schema::amount_t amount_per_second{};
  mandate::schema::amount_t start_time{};

  bool operator==(const stream_terms_t&) const = default;
};

mandate::schema::amount_t unlocked_amount(const stream_terms_t& terms,
                                          mandate::schema::timestamp_seconds_t
                                              now);

class native_token_streaming_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"native_token_streaming"};

  using terms_t = stream_terms_t;

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

/// Terms: token (address) followed by the four native stream words.
class token_streaming_enforcer final : public caveat_enforcer {
 public:
  static constexpr auto kName = std::string_view{"token_streaming"};

  struct terms_t final {
    mandate::schema::address_t token{};
    stream_terms_t stream;

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
