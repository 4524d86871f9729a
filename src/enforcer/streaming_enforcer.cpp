#include <mandate/common/checked_math.hpp>
#include <mandate/enforcer/allowance.hpp>
#include <mandate/enforcer/streaming_enforcer.hpp>
#include <mandate/schema/terms.hpp>

#include <algorithm>

namespace mandate::enforcer {

namespace {

inline constexpr auto kStreamTermsWidth = 4 * mandate::schema::kWordWidth;

std::optional<stream_terms_t> read_stream_terms(
    const std::string_view enforcer,
    mandate::schema::terms_reader& reader,
    mandate::schema::result_t& error) {
  auto terms = stream_terms_t{};
  terms.initial_amount = reader.read_uint256();
  terms.max_amount = reader.read_uint256();
  terms.amount_per_second = reader.read_uint256();
  terms.start_time = reader.read_uint256();
  if (terms.max_amount < terms.initial_amount) {
    error = enforcer_error(enforcer, mandate::schema::error_code::invalid_terms,
                           "invalid-max-amount");
    return std::nullopt;
  }
  if (terms.start_time == 0) {
    error = enforcer_error(enforcer, mandate::schema::error_code::invalid_terms,
                           "invalid-zero-start-time");
    return std::nullopt;
  }
  return terms;
}

void write_stream_terms(mandate::schema::terms_writer& writer,
                        const stream_terms_t& terms) {
  writer.write_uint256(terms.initial_amount)
      .write_uint256(terms.max_amount)
      .write_uint256(terms.amount_per_second)
      .write_uint256(terms.start_time);
}

mandate::schema::bytes_t make_spent_key(
    const std::string_view enforcer,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) {
  auto key = make_state_key(enforcer, caller);
  key.write(delegation_hash);
  return key.data;
}

mandate::schema::result_t spend_stream(hook_context_t& context,
                                       const std::string_view enforcer,
                                       const hook_call_t& call,
                                       const stream_terms_t& terms,
                                       const mandate::schema::amount_t& amount) {
  return spend_within(
      context, enforcer,
      make_spent_key(enforcer, context.caller, call.delegation_hash), amount,
      unlocked_amount(terms, context.environment.timestamp));
}

}  // namespace

mandate::schema::amount_t unlocked_amount(
    const stream_terms_t& terms,
    const mandate::schema::timestamp_seconds_t now) {
  auto current = mandate::schema::amount_t{now};
  if (current < terms.start_time) {
    return 0;
  }
  auto elapsed = current - terms.start_time;
  auto streamed = mandate::common::checked_add(
      terms.initial_amount,
      mandate::common::checked_mul(terms.amount_per_second, elapsed));
  return std::min(terms.max_amount, streamed);
}

std::optional<native_token_streaming_enforcer::terms_t>
native_token_streaming_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != kStreamTermsWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  return read_stream_terms(kName, reader, error);
}

mandate::schema::bytes_t native_token_streaming_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  write_stream_terms(writer, terms);
  return writer.release();
}

mandate::schema::result_t native_token_streaming_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::amount_t native_token_streaming_enforcer::spent(
    const mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) const {
  return load_amount(store, make_spent_key(kName, caller, delegation_hash));
}

mandate::schema::result_t native_token_streaming_enforcer::before_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto guard = require_single_default(kName, call.mode);
  if (guard.code != 0) {
    return guard;
  }
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  return spend_stream(context, kName, call, *terms,
                      single_execution(call).value);
}

std::optional<token_streaming_enforcer::terms_t>
token_streaming_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != mandate::schema::kAddressWidth + kStreamTermsWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto token = reader.read_address();
  auto stream = read_stream_terms(kName, reader, error);
  if (!stream) {
    return std::nullopt;
  }
  return terms_t{.token = token, .stream = *stream};
}

mandate::schema::bytes_t token_streaming_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_address(terms.token);
  write_stream_terms(writer, terms.stream);
  return writer.release();
}

mandate::schema::result_t token_streaming_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::amount_t token_streaming_enforcer::spent(
    const mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) const {
  return load_amount(store, make_spent_key(kName, caller, delegation_hash));
}

mandate::schema::result_t token_streaming_enforcer::before_hook(
    hook_context_t& context,
    const hook_call_t& call) {
  auto guard = require_single_default(kName, call.mode);
  if (guard.code != 0) {
    return guard;
  }
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }
  auto amount = token_transfer_amount_of(kName, single_execution(call),
                                         terms->token, error);
  if (!amount) {
    return error;
  }
  return spend_stream(context, kName, call, terms->stream, *amount);
}

}  // namespace mandate::enforcer
