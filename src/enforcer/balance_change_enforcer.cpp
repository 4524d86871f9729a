#include <mandate/enforcer/balance_change_enforcer.hpp>
#include <mandate/enforcer/balance_tracker.hpp>
#include <mandate/schema/terms.hpp>

namespace mandate::enforcer {

namespace {

inline constexpr auto kNativeTermsWidth =
    1 + mandate::schema::kAddressWidth + mandate::schema::kWordWidth;
inline constexpr auto kTokenTermsWidth =
    kNativeTermsWidth + mandate::schema::kAddressWidth;
inline constexpr auto kMultiTokenTermsWidth =
    kTokenTermsWidth + mandate::schema::kWordWidth;

std::optional<balance_change_t> read_direction(
    const std::string_view enforcer,
    mandate::schema::terms_reader& reader,
    mandate::schema::result_t& error) {
  auto direction = reader.read_uint8();
  if (direction > static_cast<uint8_t>(balance_change_t::decrease)) {
    error = enforcer_error(enforcer, mandate::schema::error_code::invalid_terms,
                           "invalid-balance-change-type");
    return std::nullopt;
  }
  return static_cast<balance_change_t>(direction);
}

mandate::schema::bytes_t make_tracker_key(
    const std::string_view enforcer,
    const mandate::schema::address_t& caller,
    const balance_change_terms_t& terms) {
  auto key = make_state_key(enforcer, caller);
  key.write(terms.token).write(terms.recipient).write(terms.token_id);
  return key.data;
}

mandate::schema::amount_t current_balance(hook_context_t& context,
                                          const balance_change_terms_t& terms) {
  return context.ledger.balance_of(terms.token, terms.token_id,
                                   terms.recipient);
}

mandate::schema::result_t track(hook_context_t& context,
                                const std::string_view enforcer,
                                const hook_call_t& call,
                                const balance_change_terms_t& terms) {
  auto guard = require_default_exec_type(enforcer, call.mode);
  if (guard.code != 0) {
    return guard;
  }
  return track_expected_change(
      context, enforcer, make_tracker_key(enforcer, context.caller, terms),
      current_balance(context, terms),
      terms.direction == balance_change_t::decrease, terms.amount);
}

mandate::schema::result_t validate(hook_context_t& context,
                                   const std::string_view enforcer,
                                   const balance_change_terms_t& terms) {
  return validate_expected_change(
      context, enforcer, make_tracker_key(enforcer, context.caller, terms),
      current_balance(context, terms));
}

}  // namespace

std::optional<native_balance_change_enforcer::terms_t>
native_balance_change_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != kNativeTermsWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto direction = read_direction(kName, reader, error);
  if (!direction) {
    return std::nullopt;
  }
  auto decoded = terms_t{.direction = *direction,
                         .token = mandate::schema::kNativeAsset};
  decoded.recipient = reader.read_address();
  decoded.amount = reader.read_uint256();
  return decoded;
}

mandate::schema::bytes_t native_balance_change_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint8(static_cast<uint8_t>(terms.direction))
      .write_address(terms.recipient)
      .write_uint256(terms.amount);
  return writer.release();
}

mandate::schema::result_t native_balance_change_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t native_balance_change_enforcer::before_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return track(context, kName, call, *terms);
}

mandate::schema::result_t native_balance_change_enforcer::after_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return validate(context, kName, *terms);
}

std::optional<token_balance_change_enforcer::terms_t>
token_balance_change_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != kTokenTermsWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto direction = read_direction(kName, reader, error);
  if (!direction) {
    return std::nullopt;
  }
  auto decoded = terms_t{.direction = *direction};
  decoded.token = reader.read_address();
  decoded.recipient = reader.read_address();
  decoded.amount = reader.read_uint256();
  return decoded;
}

mandate::schema::bytes_t token_balance_change_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint8(static_cast<uint8_t>(terms.direction))
      .write_address(terms.token)
      .write_address(terms.recipient)
      .write_uint256(terms.amount);
  return writer.release();
}

mandate::schema::result_t token_balance_change_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t token_balance_change_enforcer::before_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return track(context, kName, call, *terms);
}

mandate::schema::result_t token_balance_change_enforcer::after_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return validate(context, kName, *terms);
}

std::optional<multi_token_balance_change_enforcer::terms_t>
multi_token_balance_change_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != kMultiTokenTermsWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto direction = read_direction(kName, reader, error);
  if (!direction) {
    return std::nullopt;
  }
  auto decoded = terms_t{.direction = *direction};
  decoded.token = reader.read_address();
  decoded.recipient = reader.read_address();
  decoded.token_id = reader.read_uint256();
  decoded.amount = reader.read_uint256();
  return decoded;
}

mandate::schema::bytes_t multi_token_balance_change_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint8(static_cast<uint8_t>(terms.direction))
      .write_address(terms.token)
      .write_address(terms.recipient)
      .write_uint256(terms.token_id)
      .write_uint256(terms.amount);
  return writer.release();
}

mandate::schema::result_t multi_token_balance_change_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t multi_token_balance_change_enforcer::before_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return track(context, kName, call, *terms);
}

mandate::schema::result_t multi_token_balance_change_enforcer::after_all_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return validate(context, kName, *terms);
}

}  // namespace mandate::enforcer
