#include <mandate/common/checked_math.hpp>
#include <mandate/enforcer/allowance.hpp>
#include <mandate/enforcer/period_transfer_enforcer.hpp>
#include <mandate/schema/encoding/scale/period_state.hpp>
#include <mandate/schema/terms.hpp>

#include <spdlog/spdlog.h>

namespace mandate::enforcer {

namespace {

inline constexpr auto kPeriodTermsWidth = 3 * mandate::schema::kWordWidth;

period_terms_t read_period_terms(mandate::schema::terms_reader& reader) {
  auto terms = period_terms_t{};
  terms.period_amount = reader.read_uint256();
  terms.period_duration = reader.read_uint256();
  terms.start_date = reader.read_uint256();
  return terms;
}

void write_period_terms(mandate::schema::terms_writer& writer,
                        const period_terms_t& terms) {
  writer.write_uint256(terms.period_amount)
      .write_uint256(terms.period_duration)
      .write_uint256(terms.start_date);
}

mandate::schema::bytes_t make_period_key(
    const std::string_view enforcer,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash) {
  auto key = make_state_key(enforcer, caller);
  key.write(delegation_hash);
  return key.data;
}

// Periods are numbered from 1 so that a fresh state (period 0) never matches.
mandate::schema::amount_t current_period(const period_terms_t& terms,
                                         const mandate::schema::amount_t& now) {
  return ((now - terms.start_date) / terms.period_duration) + 1;
}

}  // namespace

mandate::schema::result_t validate_period_terms(const std::string_view enforcer,
                                                const period_terms_t& terms) {
  if (terms.period_amount == 0) {
    return enforcer_error(enforcer, mandate::schema::error_code::invalid_terms,
                          "invalid-zero-period-amount");
  }
  if (terms.period_duration == 0) {
    return enforcer_error(enforcer, mandate::schema::error_code::invalid_terms,
                          "invalid-zero-period-duration");
  }
  if (terms.start_date == 0) {
    return enforcer_error(enforcer, mandate::schema::error_code::invalid_terms,
                          "invalid-zero-start-date");
  }
  return mandate::schema::make_ok();
}

mandate::schema::amount_t available_period_amount(
    const period_terms_t& terms,
    const std::optional<period_state_t>& state,
    const mandate::schema::timestamp_seconds_t now) {
  auto current = mandate::schema::amount_t{now};
  if (current < terms.start_date) {
    return 0;
  }
  auto period = current_period(terms, current);
  if (!state || state->last_claim_period != period) {
    return terms.period_amount;
  }
  return terms.period_amount - state->claimed_in_period;
}

mandate::schema::result_t claim_period_amount(
    hook_context_t& context,
    const std::string_view enforcer,
    const mandate::schema::bytes_view_t& key,
    const period_terms_t& terms,
    const mandate::schema::amount_t& amount) {
  auto now = mandate::schema::amount_t{context.environment.timestamp};
  if (now < terms.start_date) {
    return enforcer_error(enforcer,
                          mandate::schema::error_code::claim_not_started,
                          "transfer-not-started");
  }

  auto state = context.store.get<period_state_t>(key);
  auto available = available_period_amount(terms, state,
                                            context.environment.timestamp);
  if (amount > available) {
    spdlog::debug("{}: claim of {} exceeds the {} left in this period",
                  enforcer, amount.str(), available.str());
    return enforcer_error(enforcer,
                          mandate::schema::error_code::claim_amount_exceeded,
                          "transfer-amount-exceeded");
  }

  auto period = current_period(terms, now);
  auto claimed = mandate::schema::amount_t{0};
  if (state && state->last_claim_period == period) {
    claimed = state->claimed_in_period;
  }
  context.store.put(
      key, period_state_t{.last_claim_period = period,
                          .claimed_in_period =
                              mandate::common::checked_add(claimed, amount)});
  return mandate::schema::make_ok();
}

std::optional<native_token_period_transfer_enforcer::terms_t>
native_token_period_transfer_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != kPeriodTermsWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto decoded = read_period_terms(reader);
  auto valid = validate_period_terms(kName, decoded);
  if (valid.code != 0) {
    error = valid;
    return std::nullopt;
  }
  return decoded;
}

mandate::schema::bytes_t native_token_period_transfer_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  write_period_terms(writer, terms);
  return writer.release();
}

mandate::schema::result_t native_token_period_transfer_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::amount_t native_token_period_transfer_enforcer::available(
    const mandate::state::store& store,
    const mandate::schema::address_t& caller,
    const mandate::schema::hash32_t& delegation_hash,
    const terms_t& terms,
    const mandate::schema::timestamp_seconds_t now) const {
  auto state = store.get<period_state_t>(
      make_period_key(kName, caller, delegation_hash));
  return available_period_amount(terms, state, now);
}

mandate::schema::result_t native_token_period_transfer_enforcer::before_hook(
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
  return claim_period_amount(
      context, kName,
      make_period_key(kName, context.caller, call.delegation_hash), *terms,
      single_execution(call).value);
}

std::optional<token_period_transfer_enforcer::terms_t>
token_period_transfer_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() != mandate::schema::kAddressWidth + kPeriodTermsWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto token = reader.read_address();
  auto period = read_period_terms(reader);
  auto valid = validate_period_terms(kName, period);
  if (valid.code != 0) {
    error = valid;
    return std::nullopt;
  }
  return terms_t{.token = token, .period = period};
}

mandate::schema::bytes_t token_period_transfer_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_address(terms.token);
  write_period_terms(writer, terms.period);
  return writer.release();
}

mandate::schema::result_t token_period_transfer_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t token_period_transfer_enforcer::before_hook(
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
  return claim_period_amount(
      context, kName,
      make_period_key(kName, context.caller, call.delegation_hash),
      terms->period, *amount);
}

}  // namespace mandate::enforcer
